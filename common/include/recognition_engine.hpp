#pragma once

#include "catalog_cache.hpp"
#include "catalog_store.hpp"
#include "job_coordinator.hpp"
#include "lbp_extractor.hpp"
#include "mode_selector.hpp"
#include "recognition_types.hpp"
#include "similarity_search.hpp"
#include "text_matching.hpp"
#include "worker_pool.hpp"
#include <atomic>
#include <future>
#include <string>
#include <vector>

namespace dre {

struct SearchConfig {
    size_t batch_size;
    uint32_t default_top_k;  // used when a request asks for top_k == 0
    bool one_result_per_drug;

    SearchConfig()
        : batch_size(SimilaritySearch::DEFAULT_BATCH_SIZE)
        , default_top_k(5)
        , one_result_per_drug(false) {}
};

struct EngineConfig {
    SearchConfig search;
    ModeSelectorConfig mode_selector;
    JobConfig jobs;
    size_t worker_threads;       // 0 = hardware concurrency
    bool reject_empty_catalog;   // EmptyCatalogError instead of zero results
    float ocr_min_confidence;

    EngineConfig()
        : worker_threads(0)
        , reject_empty_catalog(false)
        , ocr_min_confidence(0.5f) {}
};

// Entry point used by the server: owns the catalog cache, the job
// registry and the worker pool, and runs each request as one job.
class RecognitionEngine {
public:
    // text_recognizer may be null; OCR is then reported unavailable
    RecognitionEngine(CatalogSource& catalog,
                      TextRecognizer* text_recognizer,
                      const EngineConfig& config = EngineConfig(),
                      JobCoordinator::ClockFn clock = JobCoordinator::ClockFn());

    // Waits for in-flight jobs
    ~RecognitionEngine();

    RecognitionEngine(const RecognitionEngine&) = delete;
    RecognitionEngine& operator=(const RecognitionEngine&) = delete;

    // Reload the catalog; on failure the previous snapshot stays active
    bool refresh_catalog();

    // Queues the request. Never throws for request-level problems: the
    // future always yields a response carrying either results or an error.
    std::future<RecognitionResponse> submit(RecognitionRequest request);

    RecognitionResponse recognize(RecognitionRequest request);

    JobProgress get_progress(const std::string& request_id);

    bool cancel(const std::string& request_id);

    SweepStats sweep();

    const CatalogCache& catalog() const {
        return cache_;
    }

    JobCoordinator& jobs() {
        return jobs_;
    }

    const EngineConfig& config() const {
        return config_;
    }

    bool ocr_available() const;

    size_t get_worker_count() const {
        return pool_.size();
    }

    // Statistics
    uint64_t get_requests_submitted() const { return requests_submitted_.load(); }
    uint64_t get_requests_completed() const { return requests_completed_.load(); }
    uint64_t get_requests_failed() const { return requests_failed_.load(); }
    uint64_t get_requests_cancelled() const { return requests_cancelled_.load(); }

private:
    RecognitionResponse run_job(const RecognitionRequest& request,
                                const CancellationTokenPtr& token);

    RecognitionPath choose_path(const RecognitionRequest& request,
                                const cv::Mat& image,
                                std::vector<std::string>& warnings) const;

    SearchOutcome run_feature_path(const RecognitionRequest& request,
                                   const cv::Mat& image,
                                   const CatalogSnapshot& snapshot,
                                   const CancellationTokenPtr& token);

    SearchOutcome run_text_path(const RecognitionRequest& request,
                                const CatalogSnapshot& snapshot,
                                const CancellationTokenPtr& token);

    std::vector<RecognitionResult> hydrate(const std::vector<SimilarityResult>& ranked,
                                           std::vector<std::string>& warnings);

    void record_failure(const std::string& request_id, const CancellationTokenPtr& token,
                        ErrorKind kind, const std::string& message,
                        RecognitionResponse& response);

    std::string next_request_id();

    uint32_t effective_top_k(const RecognitionRequest& request) const;

    CatalogSource& catalog_source_;
    TextRecognizer* text_recognizer_;
    EngineConfig config_;

    CatalogCache cache_;
    LbpExtractor extractor_;
    ModeSelector selector_;
    SimilaritySearch search_;
    JobCoordinator jobs_;

    std::atomic<uint64_t> request_counter_;
    std::atomic<uint64_t> requests_submitted_;
    std::atomic<uint64_t> requests_completed_;
    std::atomic<uint64_t> requests_failed_;
    std::atomic<uint64_t> requests_cancelled_;

    // Last member: destroyed first, so queued jobs finish while the
    // state they use is still alive
    WorkerPool pool_;
};

}  // namespace dre
