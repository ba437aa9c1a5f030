#include "serialization.hpp"
#include <chrono>
#include <cstddef>

namespace dre {

namespace {

uint64_t now_millis() {
    return static_cast<uint64_t>(std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()).count());
}

MessageHeader read_header(const std::vector<uint8_t>& data) {
    if (data.size() < sizeof(MessageHeader)) {
        throw SerializationError("Data too small to contain header");
    }

    MessageHeader header;
    std::memcpy(&header, data.data(), sizeof(MessageHeader));

    if (header.magic != MESSAGE_MAGIC) {
        throw SerializationError("Invalid magic number in header");
    }

    uint32_t type = static_cast<uint32_t>(header.type);
    if (type < static_cast<uint32_t>(MessageType::RECOGNIZE_REQUEST) ||
        type > static_cast<uint32_t>(MessageType::ERROR_RESPONSE)) {
        throw SerializationError("Unknown message type: " + std::to_string(type));
    }

    if (data.size() - sizeof(MessageHeader) != header.payload_size) {
        throw SerializationError("Data size mismatch");
    }

    if (header.request_id_length > header.payload_size) {
        throw SerializationError("Invalid request id length");
    }

    return header;
}

}  // namespace

std::vector<uint8_t> Serializer::begin_message(MessageType type, const std::string& request_id) {
    MessageHeader header;
    header.type = type;
    header.timestamp = now_millis();
    header.request_id_length = static_cast<uint32_t>(request_id.size());

    std::vector<uint8_t> buffer;
    buffer.reserve(sizeof(MessageHeader) + request_id.size() + 64);

    const uint8_t* header_ptr = reinterpret_cast<const uint8_t*>(&header);
    buffer.insert(buffer.end(), header_ptr, header_ptr + sizeof(MessageHeader));
    buffer.insert(buffer.end(), request_id.begin(), request_id.end());

    return buffer;
}

void Serializer::finish_message(std::vector<uint8_t>& buffer) {
    uint64_t payload_size = buffer.size() - sizeof(MessageHeader);
    std::memcpy(buffer.data() + offsetof(MessageHeader, payload_size),
                &payload_size, sizeof(payload_size));
}

std::string Serializer::open_message(const std::vector<uint8_t>& data,
                                     MessageType expected, size_t& offset) {
    MessageHeader header = read_header(data);

    if (header.type != expected) {
        throw SerializationError("Unexpected message type: " +
                                 std::to_string(static_cast<uint32_t>(header.type)));
    }

    offset = sizeof(MessageHeader);
    std::string request_id(data.begin() + offset,
                           data.begin() + offset + header.request_id_length);
    offset += header.request_id_length;

    return request_id;
}

void Serializer::expect_end(const std::vector<uint8_t>& data, size_t offset) {
    if (offset != data.size()) {
        throw SerializationError("Trailing bytes after payload");
    }
}

void Serializer::write_string(std::vector<uint8_t>& buffer, const std::string& text) {
    write_to_buffer(buffer, static_cast<uint32_t>(text.size()));
    buffer.insert(buffer.end(), text.begin(), text.end());
}

std::string Serializer::read_string(const std::vector<uint8_t>& buffer, size_t& offset) {
    uint32_t length = read_from_buffer<uint32_t>(buffer, offset);
    if (length > buffer.size() - offset) {
        throw SerializationError("Buffer underflow: string length exceeds payload");
    }
    std::string text(buffer.begin() + offset, buffer.begin() + offset + length);
    offset += length;
    return text;
}

void Serializer::write_bytes(std::vector<uint8_t>& buffer, const std::vector<uint8_t>& bytes) {
    write_to_buffer(buffer, static_cast<uint64_t>(bytes.size()));
    buffer.insert(buffer.end(), bytes.begin(), bytes.end());
}

std::vector<uint8_t> Serializer::read_bytes(const std::vector<uint8_t>& buffer, size_t& offset) {
    uint64_t length = read_from_buffer<uint64_t>(buffer, offset);
    if (length > buffer.size() - offset) {
        throw SerializationError("Buffer underflow: byte block exceeds payload");
    }
    std::vector<uint8_t> bytes(buffer.begin() + offset, buffer.begin() + offset + length);
    offset += length;
    return bytes;
}

bool Serializer::read_flag(const std::vector<uint8_t>& buffer, size_t& offset) {
    uint8_t flag = read_from_buffer<uint8_t>(buffer, offset);
    if (flag > 1) {
        throw SerializationError("Invalid boolean flag: " + std::to_string(flag));
    }
    return flag == 1;
}

MessageType Serializer::peek_type(const std::vector<uint8_t>& data) {
    return read_header(data).type;
}

std::string Serializer::peek_request_id(const std::vector<uint8_t>& data) {
    if (data.size() < sizeof(MessageHeader)) {
        return std::string();
    }

    MessageHeader header;
    std::memcpy(&header, data.data(), sizeof(MessageHeader));

    if (header.magic != MESSAGE_MAGIC ||
        header.request_id_length > data.size() - sizeof(MessageHeader)) {
        return std::string();
    }

    auto begin = data.begin() + sizeof(MessageHeader);
    return std::string(begin, begin + header.request_id_length);
}

// Recognize request: mode, top_k, filter flags, shape, color, image bytes
std::vector<uint8_t> Serializer::serialize(const RecognitionRequest& request) {
    std::vector<uint8_t> buffer = begin_message(MessageType::RECOGNIZE_REQUEST, request.request_id);
    buffer.reserve(buffer.size() + request.image_data.size() + 64);

    uint8_t filter_flags = 0;
    if (request.filters.shape) {
        filter_flags |= 0x1;
    }
    if (request.filters.color) {
        filter_flags |= 0x2;
    }

    write_to_buffer(buffer, static_cast<uint32_t>(request.mode));
    write_to_buffer(buffer, request.top_k);
    write_to_buffer(buffer, filter_flags);
    write_string(buffer, request.filters.shape.value_or(std::string()));
    write_string(buffer, request.filters.color.value_or(std::string()));
    write_bytes(buffer, request.image_data);

    finish_message(buffer);
    return buffer;
}

RecognitionRequest Serializer::deserialize_recognize_request(const std::vector<uint8_t>& data) {
    size_t offset = 0;
    RecognitionRequest request;
    request.request_id = open_message(data, MessageType::RECOGNIZE_REQUEST, offset);

    request.mode = read_enum<RecognitionMode>(data, offset, 0, 3, "recognition mode");
    request.top_k = read_from_buffer<uint32_t>(data, offset);

    uint8_t filter_flags = read_from_buffer<uint8_t>(data, offset);
    if (filter_flags > 0x3) {
        throw SerializationError("Invalid filter flags");
    }

    std::string shape = read_string(data, offset);
    std::string color = read_string(data, offset);
    if (filter_flags & 0x1) {
        request.filters.shape = std::move(shape);
    }
    if (filter_flags & 0x2) {
        request.filters.color = std::move(color);
    }

    request.image_data = read_bytes(data, offset);

    expect_end(data, offset);
    return request;
}

// Recognize response: outcome fields, warnings, then ranked results
std::vector<uint8_t> Serializer::serialize(const RecognitionResponse& response) {
    std::vector<uint8_t> buffer = begin_message(MessageType::RECOGNIZE_RESPONSE, response.request_id);

    write_to_buffer(buffer, static_cast<uint8_t>(response.success ? 1 : 0));
    write_to_buffer(buffer, static_cast<uint32_t>(response.method_used));
    write_to_buffer(buffer, static_cast<uint32_t>(response.status));
    write_to_buffer(buffer, static_cast<uint32_t>(response.error));
    write_string(buffer, response.message);

    write_to_buffer(buffer, static_cast<uint32_t>(response.warnings.size()));
    for (const auto& warning : response.warnings) {
        write_string(buffer, warning);
    }

    write_to_buffer(buffer, static_cast<uint32_t>(response.results.size()));
    for (const auto& result : response.results) {
        write_to_buffer(buffer, result.drug_id);
        write_to_buffer(buffer, result.similarity);
        write_to_buffer(buffer, result.rank);
        write_to_buffer(buffer, static_cast<uint8_t>(result.drug ? 1 : 0));

        if (result.drug) {
            const DrugInfo& drug = *result.drug;
            write_to_buffer(buffer, drug.id);
            write_string(buffer, drug.license_number);
            write_string(buffer, drug.chinese_name);
            write_string(buffer, drug.english_name);
            write_string(buffer, drug.shape);
            write_string(buffer, drug.color);
            write_string(buffer, drug.special_dosage_form);
        }
    }

    finish_message(buffer);
    return buffer;
}

RecognitionResponse Serializer::deserialize_recognize_response(const std::vector<uint8_t>& data) {
    size_t offset = 0;
    RecognitionResponse response;
    response.request_id = open_message(data, MessageType::RECOGNIZE_RESPONSE, offset);

    response.success = read_flag(data, offset);
    response.method_used = read_enum<RecognitionPath>(data, offset, 1, 2, "recognition path");
    response.status = read_enum<JobStatus>(data, offset, 0, 4, "job status");
    response.error = read_enum<ErrorKind>(data, offset, 0, 11, "error kind");
    response.message = read_string(data, offset);

    uint32_t warning_count = read_from_buffer<uint32_t>(data, offset);
    for (uint32_t i = 0; i < warning_count; ++i) {
        response.warnings.push_back(read_string(data, offset));
    }

    uint32_t result_count = read_from_buffer<uint32_t>(data, offset);
    for (uint32_t i = 0; i < result_count; ++i) {
        RecognitionResult result;
        result.drug_id = read_from_buffer<DrugId>(data, offset);
        result.similarity = read_from_buffer<float>(data, offset);
        result.rank = read_from_buffer<uint32_t>(data, offset);

        if (read_flag(data, offset)) {
            DrugInfo drug;
            drug.id = read_from_buffer<DrugId>(data, offset);
            drug.license_number = read_string(data, offset);
            drug.chinese_name = read_string(data, offset);
            drug.english_name = read_string(data, offset);
            drug.shape = read_string(data, offset);
            drug.color = read_string(data, offset);
            drug.special_dosage_form = read_string(data, offset);
            result.drug = std::move(drug);
        }

        response.results.push_back(std::move(result));
    }

    expect_end(data, offset);
    return response;
}

std::vector<uint8_t> Serializer::serialize(const ProgressQuery& query) {
    std::vector<uint8_t> buffer = begin_message(MessageType::PROGRESS_REQUEST, query.request_id);
    finish_message(buffer);
    return buffer;
}

ProgressQuery Serializer::deserialize_progress_query(const std::vector<uint8_t>& data) {
    size_t offset = 0;
    ProgressQuery query;
    query.request_id = open_message(data, MessageType::PROGRESS_REQUEST, offset);
    expect_end(data, offset);
    return query;
}

std::vector<uint8_t> Serializer::serialize(const ProgressReply& reply) {
    std::vector<uint8_t> buffer = begin_message(MessageType::PROGRESS_RESPONSE, reply.request_id);

    write_to_buffer(buffer, static_cast<uint8_t>(reply.found ? 1 : 0));
    write_to_buffer(buffer, static_cast<uint32_t>(reply.progress.status));
    write_to_buffer(buffer, reply.progress.processed);
    write_to_buffer(buffer, reply.progress.total);
    write_to_buffer(buffer, reply.progress.percent);
    write_to_buffer(buffer, static_cast<uint32_t>(reply.error));
    write_string(buffer, reply.message);

    finish_message(buffer);
    return buffer;
}

ProgressReply Serializer::deserialize_progress_reply(const std::vector<uint8_t>& data) {
    size_t offset = 0;
    ProgressReply reply;
    reply.request_id = open_message(data, MessageType::PROGRESS_RESPONSE, offset);

    reply.found = read_flag(data, offset);
    reply.progress.status = read_enum<JobStatus>(data, offset, 0, 4, "job status");
    reply.progress.processed = read_from_buffer<uint64_t>(data, offset);
    reply.progress.total = read_from_buffer<uint64_t>(data, offset);
    reply.progress.percent = read_from_buffer<double>(data, offset);
    reply.error = read_enum<ErrorKind>(data, offset, 0, 11, "error kind");
    reply.message = read_string(data, offset);

    expect_end(data, offset);
    return reply;
}

std::vector<uint8_t> Serializer::serialize(const CancelQuery& query) {
    std::vector<uint8_t> buffer = begin_message(MessageType::CANCEL_REQUEST, query.request_id);
    finish_message(buffer);
    return buffer;
}

CancelQuery Serializer::deserialize_cancel_query(const std::vector<uint8_t>& data) {
    size_t offset = 0;
    CancelQuery query;
    query.request_id = open_message(data, MessageType::CANCEL_REQUEST, offset);
    expect_end(data, offset);
    return query;
}

std::vector<uint8_t> Serializer::serialize(const CancelReply& reply) {
    std::vector<uint8_t> buffer = begin_message(MessageType::CANCEL_RESPONSE, reply.request_id);
    write_to_buffer(buffer, static_cast<uint8_t>(reply.acknowledged ? 1 : 0));
    finish_message(buffer);
    return buffer;
}

CancelReply Serializer::deserialize_cancel_reply(const std::vector<uint8_t>& data) {
    size_t offset = 0;
    CancelReply reply;
    reply.request_id = open_message(data, MessageType::CANCEL_RESPONSE, offset);
    reply.acknowledged = read_flag(data, offset);
    expect_end(data, offset);
    return reply;
}

std::vector<uint8_t> Serializer::serialize(const ErrorReply& reply) {
    std::vector<uint8_t> buffer = begin_message(MessageType::ERROR_RESPONSE, reply.request_id);
    write_to_buffer(buffer, static_cast<uint32_t>(reply.error));
    write_string(buffer, reply.message);
    finish_message(buffer);
    return buffer;
}

ErrorReply Serializer::deserialize_error_reply(const std::vector<uint8_t>& data) {
    size_t offset = 0;
    ErrorReply reply;
    reply.request_id = open_message(data, MessageType::ERROR_RESPONSE, offset);
    reply.error = read_enum<ErrorKind>(data, offset, 0, 11, "error kind");
    reply.message = read_string(data, offset);
    expect_end(data, offset);
    return reply;
}

}  // namespace dre
