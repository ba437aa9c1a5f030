#include "catalog_cache.hpp"
#include "errors.hpp"
#include <chrono>
#include <iostream>

namespace dre {

CatalogCache::CatalogCache()
    : snapshot_(std::make_shared<const CatalogSnapshot>())
    , loaded_(false)
    , generation_(0)
    , refresh_failures_(0) {}

SnapshotPtr CatalogCache::build(CatalogSource& source, uint64_t generation) {
    std::vector<CatalogRow> rows = source.get_catalog_snapshot();
    std::vector<DrugInfo> drugs = source.list_drugs();

    auto snapshot = std::make_shared<CatalogSnapshot>();
    snapshot->generation = generation;
    snapshot->entries.reserve(rows.size());

    size_t skipped = 0;
    for (auto& row : rows) {
        if (row.feature_vector.size() != FEATURE_DIMENSION) {
            ++skipped;
            continue;
        }

        CatalogEntry entry;
        entry.drug_id = row.drug_id;
        entry.image_id = row.image_id;
        entry.features = std::move(row.feature_vector);
        entry.shape = std::move(row.shape);
        entry.color = std::move(row.color);
        snapshot->entries.push_back(std::move(entry));
    }

    if (skipped > 0) {
        std::cerr << "Catalog: skipped " << skipped << " rows with a feature vector of "
                  << "unexpected dimension (expected " << FEATURE_DIMENSION << ")" << std::endl;
    }

    snapshot->names = NameIndex(drugs);

    return snapshot;
}

bool CatalogCache::refresh(CatalogSource& source) {
    std::lock_guard<std::mutex> lock(refresh_mutex_);

    auto start = std::chrono::steady_clock::now();
    SnapshotPtr next;

    try {
        next = build(source, generation_ + 1);
    } catch (const std::exception& e) {
        refresh_failures_++;
        std::cerr << "Catalog refresh failed, keeping generation " << generation_
                  << ": " << e.what() << std::endl;
        return false;
    }

    std::atomic_store(&snapshot_, next);
    generation_ = next->generation;
    loaded_ = true;

    auto end = std::chrono::steady_clock::now();
    auto duration_ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        end - start).count();

    std::cout << "Catalog generation " << next->generation << " loaded: "
              << next->size() << " images, " << next->names.size() << " names"
              << " (" << duration_ms << "ms)" << std::endl;

    return true;
}

SnapshotPtr CatalogCache::current() const {
    return std::atomic_load(&snapshot_);
}

bool CatalogCache::loaded() const {
    return loaded_;
}

uint64_t CatalogCache::generation() const {
    return generation_;
}

size_t CatalogCache::get_refresh_failures() const {
    return refresh_failures_;
}

}  // namespace dre
