#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace dre {  // Drug Recognition Engine

// LBP with 8 neighbours yields 2^8 codes
constexpr size_t FEATURE_DIMENSION = 256;

// Normalized texture descriptor (entries >= 0, sum == 1)
using FeatureVector = std::vector<float>;

using DrugId = int64_t;
using ImageId = int64_t;

enum class RecognitionMode : uint32_t {
    AUTO = 0,
    FEATURE = 1,
    OCR = 2,
    PRESCRIPTION = 3
};

// Path actually taken for a request
enum class RecognitionPath : uint32_t {
    FEATURE = 1,
    OCR = 2
};

enum class JobStatus : uint32_t {
    PENDING = 0,
    RUNNING = 1,
    CANCELLED = 2,
    COMPLETED = 3,
    FAILED = 4
};

enum class ErrorKind : uint32_t {
    NONE = 0,
    INVALID_IMAGE = 1,
    EMPTY_IMAGE = 2,
    EMPTY_CATALOG = 3,
    DUPLICATE_JOB = 4,
    NOT_FOUND = 5,
    INVALID_TRANSITION = 6,
    TIMEOUT = 7,
    OCR_UNAVAILABLE = 8,
    CATALOG_UNAVAILABLE = 9,
    INTERNAL = 10,
    MALFORMED_REQUEST = 11
};

const char* to_string(RecognitionMode mode);
const char* to_string(RecognitionPath path);
const char* to_string(JobStatus status);
const char* to_string(ErrorKind kind);

// Accepts "auto", "feature", "ocr", "prescription"
std::optional<RecognitionMode> parse_mode(const std::string& text);

inline bool is_terminal(JobStatus status) {
    return status == JobStatus::CANCELLED ||
           status == JobStatus::COMPLETED ||
           status == JobStatus::FAILED;
}

// Descriptive drug metadata, used to hydrate results
struct DrugInfo {
    DrugId id;
    std::string license_number;
    std::string chinese_name;
    std::string english_name;
    std::string shape;
    std::string color;
    std::string special_dosage_form;

    DrugInfo() : id(0) {}
};

// One searchable reference image
struct CatalogEntry {
    DrugId drug_id;
    ImageId image_id;
    FeatureVector features;
    std::string shape;
    std::string color;

    CatalogEntry() : drug_id(0), image_id(0) {}
};

// Exact-match filters, either optional
struct SearchFilters {
    std::optional<std::string> shape;
    std::optional<std::string> color;

    bool empty() const {
        return !shape && !color;
    }

    bool matches(const CatalogEntry& entry) const {
        if (shape && entry.shape != *shape) {
            return false;
        }
        if (color && entry.color != *color) {
            return false;
        }
        return true;
    }
};

struct SimilarityResult {
    DrugId drug_id;
    float score;   // [0, 1]
    uint32_t rank; // 1-based

    SimilarityResult() : drug_id(0), score(0.0f), rank(0) {}
    SimilarityResult(DrugId drug_id_, float score_, uint32_t rank_ = 0)
        : drug_id(drug_id_), score(score_), rank(rank_) {}
};

// Descending score, ties broken by ascending drug_id
inline bool ranks_before(const SimilarityResult& a, const SimilarityResult& b) {
    if (a.score != b.score) {
        return a.score > b.score;
    }
    return a.drug_id < b.drug_id;
}

// Sorts by ranking order and assigns 1-based ranks
void assign_ranks(std::vector<SimilarityResult>& results);

struct JobProgress {
    JobStatus status;
    uint64_t processed;
    uint64_t total;
    double percent;

    JobProgress()
        : status(JobStatus::PENDING), processed(0), total(0), percent(0.0) {}
};

struct RecognitionRequest {
    std::string request_id;  // generated when empty
    std::vector<uint8_t> image_data;
    RecognitionMode mode;
    uint32_t top_k;
    SearchFilters filters;

    RecognitionRequest() : mode(RecognitionMode::AUTO), top_k(5) {}
};

// One ranked drug, hydrated with catalog metadata when available
struct RecognitionResult {
    DrugId drug_id;
    float similarity;
    uint32_t rank;
    std::optional<DrugInfo> drug;

    RecognitionResult() : drug_id(0), similarity(0.0f), rank(0) {}
};

struct RecognitionResponse {
    std::string request_id;
    bool success;
    RecognitionPath method_used;
    JobStatus status;
    ErrorKind error;
    std::string message;
    std::vector<std::string> warnings;
    std::vector<RecognitionResult> results;

    RecognitionResponse()
        : success(false), method_used(RecognitionPath::FEATURE)
        , status(JobStatus::PENDING), error(ErrorKind::NONE) {}
};

}  // namespace dre
