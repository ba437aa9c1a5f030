#pragma once

#include "catalog_cache.hpp"
#include "recognition_types.hpp"
#include <cstddef>
#include <functional>
#include <vector>

namespace dre {

using ProgressSink = std::function<void(size_t processed, size_t total)>;
using CancelCheck = std::function<bool()>;

struct SearchOutcome {
    std::vector<SimilarityResult> results;  // ranked, possibly partial
    bool cancelled;
    size_t processed;
    size_t total;  // entries left after filtering

    SearchOutcome() : cancelled(false), processed(0), total(0) {}
};

// Cosine similarity clamped to [0, 1]; zero-norm input yields 0
float cosine_similarity(const FeatureVector& a, const FeatureVector& b);

// Exact linear scan with a bounded top-k heap
class SimilaritySearch {
public:
    static constexpr size_t DEFAULT_BATCH_SIZE = 200;

    // Every catalog image is a candidate of its own. With
    // one_result_per_drug, a drug with several images is ranked once, by
    // its best-scoring image; that mode keeps a score per drug until the
    // scan ends.
    explicit SimilaritySearch(size_t batch_size = DEFAULT_BATCH_SIZE,
                              bool one_result_per_drug = false);

    // Progress is reported and cancellation checked after every batch.
    // A cancelled scan returns the partial ranking with cancelled = true.
    SearchOutcome search(const FeatureVector& query,
                         const CatalogSnapshot& snapshot,
                         const SearchFilters& filters,
                         size_t top_k,
                         const ProgressSink& progress_sink = ProgressSink(),
                         const CancelCheck& cancel_check = CancelCheck()) const;

    size_t batch_size() const {
        return batch_size_;
    }

    bool one_result_per_drug() const {
        return one_result_per_drug_;
    }

private:
    size_t batch_size_;
    bool one_result_per_drug_;
};

}  // namespace dre
