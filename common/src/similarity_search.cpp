#include "similarity_search.hpp"
#include <algorithm>
#include <cmath>
#include <queue>
#include <stdexcept>
#include <string>
#include <unordered_map>

namespace dre {

namespace {

// Heap top is the candidate that ranks last, so it is the one evicted
using CandidateHeap = std::priority_queue<SimilarityResult,
                                          std::vector<SimilarityResult>,
                                          decltype(&ranks_before)>;

void offer(CandidateHeap& heap, const SimilarityResult& candidate, size_t top_k) {
    if (heap.size() < top_k) {
        heap.push(candidate);
    } else if (ranks_before(candidate, heap.top())) {
        heap.pop();
        heap.push(candidate);
    }
}

std::vector<SimilarityResult> drain(CandidateHeap& heap) {
    std::vector<SimilarityResult> results;
    results.reserve(heap.size());
    while (!heap.empty()) {
        results.push_back(heap.top());
        heap.pop();
    }
    assign_ranks(results);
    return results;
}

}  // namespace

float cosine_similarity(const FeatureVector& a, const FeatureVector& b) {
    if (a.size() != b.size()) {
        throw std::invalid_argument("Feature dimension mismatch: " + std::to_string(a.size()) +
                                    " vs " + std::to_string(b.size()));
    }

    double dot = 0.0;
    double norm_a = 0.0;
    double norm_b = 0.0;
    for (size_t i = 0; i < a.size(); ++i) {
        dot += static_cast<double>(a[i]) * b[i];
        norm_a += static_cast<double>(a[i]) * a[i];
        norm_b += static_cast<double>(b[i]) * b[i];
    }

    if (norm_a <= 0.0 || norm_b <= 0.0) {
        return 0.0f;
    }

    double similarity = dot / (std::sqrt(norm_a) * std::sqrt(norm_b));
    return static_cast<float>(std::min(1.0, std::max(0.0, similarity)));
}

SimilaritySearch::SimilaritySearch(size_t batch_size, bool one_result_per_drug)
    : batch_size_(batch_size > 0 ? batch_size : DEFAULT_BATCH_SIZE)
    , one_result_per_drug_(one_result_per_drug) {}

SearchOutcome SimilaritySearch::search(const FeatureVector& query,
                                       const CatalogSnapshot& snapshot,
                                       const SearchFilters& filters,
                                       size_t top_k,
                                       const ProgressSink& progress_sink,
                                       const CancelCheck& cancel_check) const {
    SearchOutcome outcome;

    // Filter pre-pass keeps the snapshot's iteration order
    std::vector<const CatalogEntry*> candidates;
    candidates.reserve(snapshot.entries.size());
    for (const auto& entry : snapshot.entries) {
        if (filters.matches(entry)) {
            candidates.push_back(&entry);
        }
    }

    outcome.total = candidates.size();

    if (progress_sink) {
        progress_sink(0, outcome.total);
    }

    if (top_k == 0 || candidates.empty()) {
        if (progress_sink && outcome.total > 0) {
            progress_sink(outcome.total, outcome.total);
        }
        outcome.processed = outcome.total;
        return outcome;
    }

    if (cancel_check && cancel_check()) {
        outcome.cancelled = true;
        return outcome;
    }

    CandidateHeap heap(&ranks_before);
    std::unordered_map<DrugId, float> best_per_drug;

    // Per-drug results are only final once every image was seen,
    // so the heap for that mode is filled at drain time
    auto collect = [&]() {
        if (one_result_per_drug_) {
            for (const auto& kv : best_per_drug) {
                offer(heap, SimilarityResult(kv.first, kv.second), top_k);
            }
        }
        return drain(heap);
    };

    for (size_t i = 0; i < candidates.size(); ++i) {
        const CatalogEntry& entry = *candidates[i];
        float score = cosine_similarity(query, entry.features);

        if (one_result_per_drug_) {
            auto it = best_per_drug.find(entry.drug_id);
            if (it == best_per_drug.end() || score > it->second) {
                best_per_drug[entry.drug_id] = score;
            }
        } else {
            offer(heap, SimilarityResult(entry.drug_id, score), top_k);
        }

        outcome.processed = i + 1;

        if (outcome.processed % batch_size_ == 0 && outcome.processed < outcome.total) {
            if (progress_sink) {
                progress_sink(outcome.processed, outcome.total);
            }
            if (cancel_check && cancel_check()) {
                outcome.cancelled = true;
                outcome.results = collect();
                return outcome;
            }
        }
    }

    if (progress_sink) {
        progress_sink(outcome.total, outcome.total);
    }

    outcome.results = collect();
    return outcome;
}

}  // namespace dre
