#pragma once

#include "catalog_store.hpp"
#include "recognition_types.hpp"
#include "text_matching.hpp"
#include <atomic>
#include <cstdint>
#include <memory>
#include <mutex>
#include <vector>

namespace dre {

// Immutable point-in-time view of the catalog
struct CatalogSnapshot {
    std::vector<CatalogEntry> entries;  // ordered by image id
    NameIndex names;
    uint64_t generation;

    CatalogSnapshot() : generation(0) {}

    size_t size() const {
        return entries.size();
    }

    bool empty() const {
        return entries.empty();
    }
};

using SnapshotPtr = std::shared_ptr<const CatalogSnapshot>;

// Holds the active snapshot. Readers never lock; refresh builds the next
// snapshot off to the side and publishes it with one atomic store.
class CatalogCache {
public:
    CatalogCache();

    CatalogCache(const CatalogCache&) = delete;
    CatalogCache& operator=(const CatalogCache&) = delete;

    // Reads every row once; throws CatalogUnavailableError on failure
    static SnapshotPtr build(CatalogSource& source, uint64_t generation = 0);

    // Returns false (and keeps the previous snapshot) if the source fails
    bool refresh(CatalogSource& source);

    // Never null; empty until the first successful refresh
    SnapshotPtr current() const;

    // True once any refresh has succeeded
    bool loaded() const;

    uint64_t generation() const;

    size_t get_refresh_failures() const;

private:
    SnapshotPtr snapshot_;
    std::mutex refresh_mutex_;  // single writer
    std::atomic<bool> loaded_;
    std::atomic<uint64_t> generation_;
    std::atomic<size_t> refresh_failures_;
};

}  // namespace dre
