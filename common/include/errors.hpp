#pragma once

#include "recognition_types.hpp"
#include <stdexcept>
#include <string>

namespace dre {

// Base of the recognition error taxonomy; kind() maps onto the wire
class RecognitionError : public std::runtime_error {
public:
    RecognitionError(ErrorKind kind, const std::string& msg)
        : std::runtime_error(msg), kind_(kind) {}

    ErrorKind kind() const {
        return kind_;
    }

private:
    ErrorKind kind_;
};

class InvalidImageError : public RecognitionError {
public:
    explicit InvalidImageError(const std::string& msg)
        : RecognitionError(ErrorKind::INVALID_IMAGE, msg) {}
};

class EmptyImageError : public RecognitionError {
public:
    explicit EmptyImageError(const std::string& msg)
        : RecognitionError(ErrorKind::EMPTY_IMAGE, msg) {}
};

class EmptyCatalogError : public RecognitionError {
public:
    explicit EmptyCatalogError(const std::string& msg)
        : RecognitionError(ErrorKind::EMPTY_CATALOG, msg) {}
};

class DuplicateJobError : public RecognitionError {
public:
    explicit DuplicateJobError(const std::string& msg)
        : RecognitionError(ErrorKind::DUPLICATE_JOB, msg) {}
};

class NotFoundError : public RecognitionError {
public:
    explicit NotFoundError(const std::string& msg)
        : RecognitionError(ErrorKind::NOT_FOUND, msg) {}
};

// Coordinator misuse; indicates a bug in the caller
class InvalidTransitionError : public RecognitionError {
public:
    explicit InvalidTransitionError(const std::string& msg)
        : RecognitionError(ErrorKind::INVALID_TRANSITION, msg) {}
};

class TimeoutError : public RecognitionError {
public:
    explicit TimeoutError(const std::string& msg)
        : RecognitionError(ErrorKind::TIMEOUT, msg) {}
};

class OcrUnavailableError : public RecognitionError {
public:
    explicit OcrUnavailableError(const std::string& msg)
        : RecognitionError(ErrorKind::OCR_UNAVAILABLE, msg) {}
};

class CatalogUnavailableError : public RecognitionError {
public:
    explicit CatalogUnavailableError(const std::string& msg)
        : RecognitionError(ErrorKind::CATALOG_UNAVAILABLE, msg) {}
};

}  // namespace dre
