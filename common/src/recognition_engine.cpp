#include "recognition_engine.hpp"
#include "errors.hpp"
#include <chrono>
#include <iostream>
#include <sstream>
#include <unordered_set>

namespace dre {

RecognitionEngine::RecognitionEngine(CatalogSource& catalog,
                                     TextRecognizer* text_recognizer,
                                     const EngineConfig& config,
                                     JobCoordinator::ClockFn clock)
    : catalog_source_(catalog)
    , text_recognizer_(text_recognizer)
    , config_(config)
    , selector_(config.mode_selector)
    , search_(config.search.batch_size, config.search.one_result_per_drug)
    , jobs_(config.jobs, std::move(clock))
    , request_counter_(0)
    , requests_submitted_(0)
    , requests_completed_(0)
    , requests_failed_(0)
    , requests_cancelled_(0)
    , pool_(config.worker_threads) {}

RecognitionEngine::~RecognitionEngine() {
    pool_.wait_all();
}

bool RecognitionEngine::refresh_catalog() {
    return cache_.refresh(catalog_source_);
}

bool RecognitionEngine::ocr_available() const {
    return text_recognizer_ != nullptr && text_recognizer_->available();
}

std::future<RecognitionResponse> RecognitionEngine::submit(RecognitionRequest request) {
    if (request.request_id.empty()) {
        request.request_id = next_request_id();
    }

    requests_submitted_++;

    CancellationTokenPtr token;
    try {
        token = jobs_.create(request.request_id, request.mode, request.filters);
    } catch (const DuplicateJobError& e) {
        requests_failed_++;

        RecognitionResponse response;
        response.request_id = request.request_id;
        response.status = JobStatus::FAILED;
        response.error = e.kind();
        response.message = e.what();

        std::promise<RecognitionResponse> rejected;
        rejected.set_value(std::move(response));
        return rejected.get_future();
    }

    return pool_.submit([this, request = std::move(request), token]() {
        return run_job(request, token);
    });
}

RecognitionResponse RecognitionEngine::recognize(RecognitionRequest request) {
    return submit(std::move(request)).get();
}

JobProgress RecognitionEngine::get_progress(const std::string& request_id) {
    return jobs_.get_progress(request_id);
}

bool RecognitionEngine::cancel(const std::string& request_id) {
    return jobs_.cancel(request_id);
}

SweepStats RecognitionEngine::sweep() {
    SweepStats stats = jobs_.sweep();
    if (stats.purged > 0 || stats.timed_out > 0) {
        std::cout << "Job sweep: purged " << stats.purged
                  << ", timed out " << stats.timed_out << std::endl;
    }
    return stats;
}

RecognitionResponse RecognitionEngine::run_job(const RecognitionRequest& request,
                                               const CancellationTokenPtr& token) {
    const std::string& id = request.request_id;

    RecognitionResponse response;
    response.request_id = id;

    try {
        // Cancelled or timed out while still queued. The id may already
        // belong to a newer job, so the outcome comes from this job's token.
        if (token->cancelled() || !jobs_.start(id, token)) {
            response.status = token->reason() == CancelReason::USER ? JobStatus::CANCELLED
                                                                     : JobStatus::FAILED;
            if (response.status == JobStatus::CANCELLED) {
                response.message = "Recognition cancelled before it started";
                requests_cancelled_++;
            } else {
                response.error = ErrorKind::TIMEOUT;
                response.message = "Recognition waited longer than maximum duration";
                requests_failed_++;
            }
            return response;
        }

        cv::Mat image = LbpExtractor::decode(request.image_data);

        if (!cache_.loaded()) {
            throw CatalogUnavailableError("Catalog has not been loaded");
        }

        SnapshotPtr snapshot = cache_.current();
        if (snapshot->empty() && config_.reject_empty_catalog) {
            throw EmptyCatalogError("Catalog contains no reference images");
        }

        RecognitionPath path = choose_path(request, image, response.warnings);

        SearchOutcome outcome;
        bool searched = false;

        if (path == RecognitionPath::OCR) {
            try {
                outcome = run_text_path(request, *snapshot, token);
                searched = true;
            } catch (const OcrUnavailableError& e) {
                if (request.mode != RecognitionMode::AUTO) {
                    throw;
                }
                response.warnings.push_back(std::string(to_string(e.kind())) + ": " + e.what());
                path = RecognitionPath::FEATURE;
            }
        }

        if (!searched) {
            outcome = run_feature_path(request, image, *snapshot, token);
        }

        jobs_.record_path(id, path, token);
        response.method_used = path;

        if (outcome.cancelled || token->cancelled()) {
            response.status = jobs_.finish_cancelled(id, token);

            if (response.status == JobStatus::FAILED) {
                response.error = ErrorKind::TIMEOUT;
                response.message = "Recognition exceeded maximum duration";
                requests_failed_++;
                std::cerr << "Job " << id << " timed out after "
                          << outcome.processed << "/" << outcome.total << " comparisons" << std::endl;
            } else {
                response.message = "Recognition cancelled";
                requests_cancelled_++;
                std::cout << "Job " << id << " cancelled after "
                          << outcome.processed << "/" << outcome.total << " comparisons" << std::endl;
            }
            return response;
        }

        response.results = hydrate(outcome.results, response.warnings);
        jobs_.complete(id, std::move(outcome.results), token);

        response.success = true;
        response.status = JobStatus::COMPLETED;
        if (response.results.empty()) {
            response.message = snapshot->empty() ? "Catalog is empty" : "No matching drugs found";
        }
        requests_completed_++;

    } catch (const InvalidTransitionError& e) {
        std::cerr << "Job " << id << " coordinator misuse: " << e.what() << std::endl;
        throw;
    } catch (const RecognitionError& e) {
        record_failure(id, token, e.kind(), e.what(), response);
    } catch (const DatabaseError& e) {
        record_failure(id, token, ErrorKind::CATALOG_UNAVAILABLE, e.what(), response);
    } catch (const std::exception& e) {
        record_failure(id, token, ErrorKind::INTERNAL, e.what(), response);
    }

    return response;
}

RecognitionPath RecognitionEngine::choose_path(const RecognitionRequest& request,
                                               const cv::Mat& image,
                                               std::vector<std::string>& warnings) const {
    switch (request.mode) {
        case RecognitionMode::FEATURE:
            return RecognitionPath::FEATURE;
        case RecognitionMode::OCR:
        case RecognitionMode::PRESCRIPTION:
            return RecognitionPath::OCR;
        case RecognitionMode::AUTO:
            break;
    }

    RecognitionPath path = selector_.select(image);
    if (path == RecognitionPath::OCR && !ocr_available()) {
        warnings.push_back(std::string(to_string(ErrorKind::OCR_UNAVAILABLE)) +
                           ": text recognition unavailable, used feature matching");
        return RecognitionPath::FEATURE;
    }
    return path;
}

SearchOutcome RecognitionEngine::run_feature_path(const RecognitionRequest& request,
                                                  const cv::Mat& image,
                                                  const CatalogSnapshot& snapshot,
                                                  const CancellationTokenPtr& token) {
    FeatureVector query = extractor_.extract(image);

    const std::string& id = request.request_id;
    ProgressSink sink = [this, &id, &token](size_t processed, size_t total) {
        jobs_.report_progress(id, processed, total, token);
    };
    CancelCheck check = [&token]() {
        return token->cancelled();
    };

    return search_.search(query, snapshot, request.filters, effective_top_k(request), sink, check);
}

SearchOutcome RecognitionEngine::run_text_path(const RecognitionRequest& request,
                                               const CatalogSnapshot& snapshot,
                                               const CancellationTokenPtr& token) {
    if (!ocr_available()) {
        throw OcrUnavailableError("Text recognition is not available");
    }

    const std::string& id = request.request_id;
    std::vector<std::string> lines = text_recognizer_->recognize_text(request.image_data);

    SearchOutcome outcome;
    outcome.total = lines.size();
    jobs_.report_progress(id, 0, outcome.total, token);

    if (token->cancelled()) {
        outcome.cancelled = true;
        return outcome;
    }

    std::vector<NameMatch> matches;
    if (request.mode == RecognitionMode::PRESCRIPTION) {
        matches = best_match_per_line(lines, snapshot.names, config_.ocr_min_confidence);
    } else {
        matches = fuzzy_match(lines, snapshot.names, config_.ocr_min_confidence);
    }

    // Shape and color live on catalog images, so a filtered text match
    // must have at least one image that passes the filters
    std::unordered_set<DrugId> allowed;
    if (!request.filters.empty()) {
        for (const auto& entry : snapshot.entries) {
            if (request.filters.matches(entry)) {
                allowed.insert(entry.drug_id);
            }
        }
    }

    for (const auto& match : matches) {
        if (request.filters.empty() || allowed.count(match.drug_id) > 0) {
            outcome.results.emplace_back(match.drug_id, match.confidence);
        }
    }

    assign_ranks(outcome.results);
    size_t top_k = effective_top_k(request);
    if (outcome.results.size() > top_k) {
        outcome.results.resize(top_k);
    }

    outcome.processed = outcome.total;
    jobs_.report_progress(id, outcome.processed, outcome.total, token);

    return outcome;
}

std::vector<RecognitionResult> RecognitionEngine::hydrate(const std::vector<SimilarityResult>& ranked,
                                                          std::vector<std::string>& warnings) {
    std::vector<RecognitionResult> results;
    results.reserve(ranked.size());

    bool metadata_available = true;

    for (const auto& match : ranked) {
        RecognitionResult result;
        result.drug_id = match.drug_id;
        result.similarity = match.score;
        result.rank = match.rank;

        if (metadata_available) {
            try {
                result.drug = catalog_source_.get_drug_by_id(match.drug_id);
            } catch (const CatalogUnavailableError& e) {
                // Rankings stay valid without names; say so instead of failing
                metadata_available = false;
                warnings.push_back(std::string(to_string(e.kind())) + ": " + e.what());
                std::cerr << "Drug metadata lookup failed: " << e.what() << std::endl;
            }
        }

        results.push_back(std::move(result));
    }

    return results;
}

void RecognitionEngine::record_failure(const std::string& request_id,
                                       const CancellationTokenPtr& token, ErrorKind kind,
                                       const std::string& message, RecognitionResponse& response) {
    std::cerr << "Job " << request_id << " failed (" << to_string(kind) << "): "
              << message << std::endl;

    try {
        jobs_.fail(request_id, kind, message, token);
    } catch (const NotFoundError& e) {
        std::cerr << "Job " << request_id << " was purged or replaced before its failure was recorded: "
                  << e.what() << std::endl;
    }

    response.success = false;
    response.status = JobStatus::FAILED;
    response.error = kind;
    response.message = message;
    response.results.clear();
    requests_failed_++;
}

std::string RecognitionEngine::next_request_id() {
    auto ticks = std::chrono::steady_clock::now().time_since_epoch().count();

    std::ostringstream oss;
    oss << "req-" << std::hex << ticks << "-" << std::dec << ++request_counter_;
    return oss.str();
}

uint32_t RecognitionEngine::effective_top_k(const RecognitionRequest& request) const {
    return request.top_k > 0 ? request.top_k : config_.search.default_top_k;
}

}  // namespace dre
