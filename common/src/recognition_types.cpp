#include "recognition_types.hpp"
#include <algorithm>

namespace dre {

const char* to_string(RecognitionMode mode) {
    switch (mode) {
        case RecognitionMode::AUTO: return "auto";
        case RecognitionMode::FEATURE: return "feature";
        case RecognitionMode::OCR: return "ocr";
        case RecognitionMode::PRESCRIPTION: return "prescription";
    }
    return "unknown";
}

const char* to_string(RecognitionPath path) {
    switch (path) {
        case RecognitionPath::FEATURE: return "feature";
        case RecognitionPath::OCR: return "ocr";
    }
    return "unknown";
}

const char* to_string(JobStatus status) {
    switch (status) {
        case JobStatus::PENDING: return "pending";
        case JobStatus::RUNNING: return "running";
        case JobStatus::CANCELLED: return "cancelled";
        case JobStatus::COMPLETED: return "completed";
        case JobStatus::FAILED: return "failed";
    }
    return "unknown";
}

const char* to_string(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::NONE: return "none";
        case ErrorKind::INVALID_IMAGE: return "InvalidImageError";
        case ErrorKind::EMPTY_IMAGE: return "EmptyImageError";
        case ErrorKind::EMPTY_CATALOG: return "EmptyCatalogError";
        case ErrorKind::DUPLICATE_JOB: return "DuplicateJobError";
        case ErrorKind::NOT_FOUND: return "NotFoundError";
        case ErrorKind::INVALID_TRANSITION: return "InvalidTransitionError";
        case ErrorKind::TIMEOUT: return "TimeoutError";
        case ErrorKind::OCR_UNAVAILABLE: return "OCRUnavailableError";
        case ErrorKind::CATALOG_UNAVAILABLE: return "CatalogUnavailableError";
        case ErrorKind::INTERNAL: return "InternalError";
        case ErrorKind::MALFORMED_REQUEST: return "MalformedRequestError";
    }
    return "unknown";
}

std::optional<RecognitionMode> parse_mode(const std::string& text) {
    if (text == "auto") {
        return RecognitionMode::AUTO;
    } else if (text == "feature") {
        return RecognitionMode::FEATURE;
    } else if (text == "ocr") {
        return RecognitionMode::OCR;
    } else if (text == "prescription") {
        return RecognitionMode::PRESCRIPTION;
    }
    return std::nullopt;
}

void assign_ranks(std::vector<SimilarityResult>& results) {
    std::sort(results.begin(), results.end(), ranks_before);
    for (size_t i = 0; i < results.size(); ++i) {
        results[i].rank = static_cast<uint32_t>(i + 1);
    }
}

}  // namespace dre
