#pragma once

#include "message_types.hpp"
#include <cstring>
#include <stdexcept>
#include <string>
#include <vector>

namespace dre {

class SerializationError : public std::runtime_error {
public:
    explicit SerializationError(const std::string& msg)
        : std::runtime_error(msg) {}
};

// Binary codec for the request/response protocol. Every message is a
// MessageHeader followed by the request id and a type-specific payload.
class Serializer {
public:
    static std::vector<uint8_t> serialize(const RecognitionRequest& request);
    static std::vector<uint8_t> serialize(const RecognitionResponse& response);
    static std::vector<uint8_t> serialize(const ProgressQuery& query);
    static std::vector<uint8_t> serialize(const ProgressReply& reply);
    static std::vector<uint8_t> serialize(const CancelQuery& query);
    static std::vector<uint8_t> serialize(const CancelReply& reply);
    static std::vector<uint8_t> serialize(const ErrorReply& reply);

    // Validates the header and returns its type
    static MessageType peek_type(const std::vector<uint8_t>& data);

    // Best effort: empty if the header or id cannot be read
    static std::string peek_request_id(const std::vector<uint8_t>& data);

    static RecognitionRequest deserialize_recognize_request(const std::vector<uint8_t>& data);
    static RecognitionResponse deserialize_recognize_response(const std::vector<uint8_t>& data);
    static ProgressQuery deserialize_progress_query(const std::vector<uint8_t>& data);
    static ProgressReply deserialize_progress_reply(const std::vector<uint8_t>& data);
    static CancelQuery deserialize_cancel_query(const std::vector<uint8_t>& data);
    static CancelReply deserialize_cancel_reply(const std::vector<uint8_t>& data);
    static ErrorReply deserialize_error_reply(const std::vector<uint8_t>& data);

private:
    // Writes a placeholder header and the request id
    static std::vector<uint8_t> begin_message(MessageType type, const std::string& request_id);

    // Patches payload_size once the payload is written
    static void finish_message(std::vector<uint8_t>& buffer);

    // Validates header and type; returns the id and leaves offset after it
    static std::string open_message(const std::vector<uint8_t>& data,
                                    MessageType expected, size_t& offset);

    static void expect_end(const std::vector<uint8_t>& data, size_t offset);

    static void write_string(std::vector<uint8_t>& buffer, const std::string& text);
    static std::string read_string(const std::vector<uint8_t>& buffer, size_t& offset);

    static void write_bytes(std::vector<uint8_t>& buffer, const std::vector<uint8_t>& bytes);
    static std::vector<uint8_t> read_bytes(const std::vector<uint8_t>& buffer, size_t& offset);

    static bool read_flag(const std::vector<uint8_t>& buffer, size_t& offset);

    // Enums are range checked, never trusted
    template<typename E>
    static E read_enum(const std::vector<uint8_t>& buffer, size_t& offset,
                       uint32_t min_value, uint32_t max_value, const char* what) {
        uint32_t raw = read_from_buffer<uint32_t>(buffer, offset);
        if (raw < min_value || raw > max_value) {
            throw SerializationError(std::string("Invalid ") + what + " value: " +
                                     std::to_string(raw));
        }
        return static_cast<E>(raw);
    }

    // Helper: write data to buffer
    template<typename T>
    static void write_to_buffer(std::vector<uint8_t>& buffer, const T& value) {
        const uint8_t* ptr = reinterpret_cast<const uint8_t*>(&value);
        buffer.insert(buffer.end(), ptr, ptr + sizeof(T));
    }

    // Helper: read data from buffer
    template<typename T>
    static T read_from_buffer(const std::vector<uint8_t>& buffer, size_t& offset) {
        if (offset + sizeof(T) > buffer.size()) {
            throw SerializationError("Buffer underflow: not enough data to read");
        }
        T value;
        std::memcpy(&value, buffer.data() + offset, sizeof(T));
        offset += sizeof(T);
        return value;
    }
};

}  // namespace dre
