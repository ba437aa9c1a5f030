#pragma once

#include "recognition_types.hpp"
#include <cstdint>
#include <string>

namespace dre {

// "DRE1"
constexpr uint32_t MESSAGE_MAGIC = 0x44524531;

enum class MessageType : uint32_t {
    RECOGNIZE_REQUEST = 1,
    RECOGNIZE_RESPONSE = 2,
    PROGRESS_REQUEST = 3,
    PROGRESS_RESPONSE = 4,
    CANCEL_REQUEST = 5,
    CANCEL_RESPONSE = 6,
    ERROR_RESPONSE = 7
};

// Message header structure (64 bytes, fixed size)
struct MessageHeader {
    uint32_t magic;              // Magic number for validation
    MessageType type;            // Message type
    uint64_t payload_size;       // Bytes following the header
    uint64_t timestamp;          // Unix timestamp in milliseconds
    uint32_t request_id_length;  // Request id leads the payload
    uint8_t reserved[36];

    MessageHeader()
        : magic(MESSAGE_MAGIC)
        , type(MessageType::ERROR_RESPONSE)
        , payload_size(0)
        , timestamp(0)
        , request_id_length(0)
        , reserved{0} {}
};

static_assert(sizeof(MessageHeader) == 64, "MessageHeader must be exactly 64 bytes");

struct ProgressQuery {
    std::string request_id;
};

struct ProgressReply {
    std::string request_id;
    bool found;
    JobProgress progress;
    ErrorKind error;  // NOT_FOUND when the job is unknown or expired
    std::string message;

    ProgressReply() : found(false), error(ErrorKind::NONE) {}
};

struct CancelQuery {
    std::string request_id;
};

struct CancelReply {
    std::string request_id;
    bool acknowledged;

    CancelReply() : acknowledged(false) {}
};

// Sent for requests that could not be decoded or dispatched
struct ErrorReply {
    std::string request_id;
    ErrorKind error;
    std::string message;

    ErrorReply() : error(ErrorKind::INTERNAL) {}
};

}  // namespace dre
