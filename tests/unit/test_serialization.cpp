#include <gtest/gtest.h>
#include "serialization.hpp"
#include "message_types.hpp"
#include <cstddef>

using namespace dre;

class SerializationTest : public ::testing::Test {
protected:
    void SetUp() override {
        // A small fake JPEG payload
        request_.request_id = "req-42";
        request_.mode = RecognitionMode::FEATURE;
        request_.top_k = 3;
        request_.filters.shape = std::string("round");
        request_.image_data.resize(4096);
        for (size_t i = 0; i < request_.image_data.size(); ++i) {
            request_.image_data[i] = static_cast<uint8_t>(i % 256);
        }

        DrugInfo drug;
        drug.id = 7;
        drug.license_number = "H20065016";
        drug.chinese_name = "阿莫西林胶囊";
        drug.english_name = "Amoxicillin Capsules";
        drug.shape = "capsule";
        drug.color = "red";
        drug.special_dosage_form = "hard capsule";

        RecognitionResult first;
        first.drug_id = 7;
        first.similarity = 0.9f;
        first.rank = 1;
        first.drug = drug;

        RecognitionResult second;
        second.drug_id = 3;
        second.similarity = 0.5f;
        second.rank = 2;

        response_.request_id = "req-42";
        response_.success = true;
        response_.method_used = RecognitionPath::FEATURE;
        response_.status = JobStatus::COMPLETED;
        response_.warnings.push_back("CatalogUnavailableError: lookup timed out");
        response_.results.push_back(first);
        response_.results.push_back(second);
    }

    // Rewrites payload_size so the header agrees with the buffer again
    static void fix_payload_size(std::vector<uint8_t>& data) {
        uint64_t payload_size = data.size() - sizeof(MessageHeader);
        std::memcpy(data.data() + offsetof(MessageHeader, payload_size),
                    &payload_size, sizeof(payload_size));
    }

    RecognitionRequest request_;
    RecognitionResponse response_;
};

TEST_F(SerializationTest, HeaderIsFixedSize) {
    EXPECT_EQ(sizeof(MessageHeader), 64u);

    ProgressQuery query;
    query.request_id = "abc";
    auto serialized = Serializer::serialize(query);

    EXPECT_EQ(serialized.size(), sizeof(MessageHeader) + 3);

    MessageHeader header;
    std::memcpy(&header, serialized.data(), sizeof(MessageHeader));
    EXPECT_EQ(header.magic, MESSAGE_MAGIC);
    EXPECT_EQ(header.type, MessageType::PROGRESS_REQUEST);
    EXPECT_EQ(header.payload_size, 3u);
    EXPECT_EQ(header.request_id_length, 3u);
    EXPECT_GT(header.timestamp, 0u);
}

TEST_F(SerializationTest, RecognizeRequestRoundTrip) {
    auto serialized = Serializer::serialize(request_);
    ASSERT_GT(serialized.size(), request_.image_data.size());
    EXPECT_EQ(Serializer::peek_type(serialized), MessageType::RECOGNIZE_REQUEST);

    RecognitionRequest decoded = Serializer::deserialize_recognize_request(serialized);

    EXPECT_EQ(decoded.request_id, "req-42");
    EXPECT_EQ(decoded.mode, RecognitionMode::FEATURE);
    EXPECT_EQ(decoded.top_k, 3u);
    ASSERT_TRUE(decoded.filters.shape.has_value());
    EXPECT_EQ(*decoded.filters.shape, "round");
    EXPECT_FALSE(decoded.filters.color.has_value());
    EXPECT_EQ(decoded.image_data, request_.image_data);
}

TEST_F(SerializationTest, EmptyFilterStringIsStillAFilter) {
    request_.filters.shape.reset();
    request_.filters.color = std::string("");

    RecognitionRequest decoded = Serializer::deserialize_recognize_request(
        Serializer::serialize(request_));

    EXPECT_FALSE(decoded.filters.shape.has_value());
    ASSERT_TRUE(decoded.filters.color.has_value());
    EXPECT_TRUE(decoded.filters.color->empty());
}

TEST_F(SerializationTest, RequestWithoutIdOrImage) {
    RecognitionRequest bare;

    RecognitionRequest decoded = Serializer::deserialize_recognize_request(
        Serializer::serialize(bare));

    EXPECT_TRUE(decoded.request_id.empty());
    EXPECT_TRUE(decoded.image_data.empty());
    EXPECT_EQ(decoded.mode, RecognitionMode::AUTO);
    EXPECT_TRUE(decoded.filters.empty());
}

TEST_F(SerializationTest, RecognizeResponseRoundTrip) {
    RecognitionResponse decoded = Serializer::deserialize_recognize_response(
        Serializer::serialize(response_));

    EXPECT_EQ(decoded.request_id, "req-42");
    EXPECT_TRUE(decoded.success);
    EXPECT_EQ(decoded.method_used, RecognitionPath::FEATURE);
    EXPECT_EQ(decoded.status, JobStatus::COMPLETED);
    EXPECT_EQ(decoded.error, ErrorKind::NONE);
    ASSERT_EQ(decoded.warnings.size(), 1u);
    EXPECT_EQ(decoded.warnings[0], response_.warnings[0]);

    ASSERT_EQ(decoded.results.size(), 2u);
    EXPECT_EQ(decoded.results[0].drug_id, 7);
    EXPECT_FLOAT_EQ(decoded.results[0].similarity, 0.9f);
    EXPECT_EQ(decoded.results[0].rank, 1u);
    ASSERT_TRUE(decoded.results[0].drug.has_value());
    EXPECT_EQ(decoded.results[0].drug->chinese_name, "阿莫西林胶囊");
    EXPECT_EQ(decoded.results[0].drug->license_number, "H20065016");
    EXPECT_EQ(decoded.results[0].drug->special_dosage_form, "hard capsule");

    EXPECT_EQ(decoded.results[1].drug_id, 3);
    EXPECT_FALSE(decoded.results[1].drug.has_value());
}

TEST_F(SerializationTest, FailedResponseRoundTrip) {
    RecognitionResponse failed;
    failed.request_id = "slow";
    failed.status = JobStatus::FAILED;
    failed.error = ErrorKind::TIMEOUT;
    failed.message = "Recognition exceeded maximum duration";

    RecognitionResponse decoded = Serializer::deserialize_recognize_response(
        Serializer::serialize(failed));

    EXPECT_FALSE(decoded.success);
    EXPECT_EQ(decoded.status, JobStatus::FAILED);
    EXPECT_EQ(decoded.error, ErrorKind::TIMEOUT);
    EXPECT_EQ(decoded.message, failed.message);
    EXPECT_TRUE(decoded.results.empty());
}

TEST_F(SerializationTest, ProgressMessagesRoundTrip) {
    ProgressQuery query;
    query.request_id = "job-1";
    EXPECT_EQ(Serializer::deserialize_progress_query(Serializer::serialize(query)).request_id, "job-1");

    ProgressReply reply;
    reply.request_id = "job-1";
    reply.found = true;
    reply.progress.status = JobStatus::RUNNING;
    reply.progress.processed = 200;
    reply.progress.total = 800;
    reply.progress.percent = 25.0;

    ProgressReply decoded = Serializer::deserialize_progress_reply(Serializer::serialize(reply));
    EXPECT_TRUE(decoded.found);
    EXPECT_EQ(decoded.progress.status, JobStatus::RUNNING);
    EXPECT_EQ(decoded.progress.processed, 200u);
    EXPECT_EQ(decoded.progress.total, 800u);
    EXPECT_DOUBLE_EQ(decoded.progress.percent, 25.0);

    ProgressReply missing;
    missing.request_id = "gone";
    missing.error = ErrorKind::NOT_FOUND;
    missing.message = "Job expired: gone";

    decoded = Serializer::deserialize_progress_reply(Serializer::serialize(missing));
    EXPECT_FALSE(decoded.found);
    EXPECT_EQ(decoded.error, ErrorKind::NOT_FOUND);
    EXPECT_EQ(decoded.message, "Job expired: gone");
}

TEST_F(SerializationTest, CancelMessagesRoundTrip) {
    CancelQuery query;
    query.request_id = "job-2";
    EXPECT_EQ(Serializer::deserialize_cancel_query(Serializer::serialize(query)).request_id, "job-2");

    CancelReply reply;
    reply.request_id = "job-2";
    reply.acknowledged = true;

    CancelReply decoded = Serializer::deserialize_cancel_reply(Serializer::serialize(reply));
    EXPECT_EQ(decoded.request_id, "job-2");
    EXPECT_TRUE(decoded.acknowledged);
}

TEST_F(SerializationTest, ErrorReplyRoundTrip) {
    ErrorReply reply;
    reply.request_id = "bad";
    reply.error = ErrorKind::MALFORMED_REQUEST;
    reply.message = "Data size mismatch";

    auto serialized = Serializer::serialize(reply);
    EXPECT_EQ(Serializer::peek_type(serialized), MessageType::ERROR_RESPONSE);

    ErrorReply decoded = Serializer::deserialize_error_reply(serialized);
    EXPECT_EQ(decoded.request_id, "bad");
    EXPECT_EQ(decoded.error, ErrorKind::MALFORMED_REQUEST);
    EXPECT_EQ(decoded.message, "Data size mismatch");
}

TEST_F(SerializationTest, InvalidMagicNumber) {
    auto serialized = Serializer::serialize(request_);
    serialized[0] = 0xFF;

    EXPECT_THROW(Serializer::peek_type(serialized), SerializationError);
    EXPECT_THROW(Serializer::deserialize_recognize_request(serialized), SerializationError);
    EXPECT_TRUE(Serializer::peek_request_id(serialized).empty());
}

TEST_F(SerializationTest, TruncatedData) {
    auto serialized = Serializer::serialize(request_);

    std::vector<uint8_t> header_only(serialized.begin(), serialized.begin() + 10);
    EXPECT_THROW(Serializer::peek_type(header_only), SerializationError);

    serialized.resize(serialized.size() - 100);
    EXPECT_THROW(Serializer::deserialize_recognize_request(serialized), SerializationError);

    // Consistent header, but the image length runs past the end
    fix_payload_size(serialized);
    EXPECT_THROW(Serializer::deserialize_recognize_request(serialized), SerializationError);
}

TEST_F(SerializationTest, TrailingBytesRejected) {
    auto serialized = Serializer::serialize(CancelReply());
    serialized.push_back(0);
    fix_payload_size(serialized);

    EXPECT_THROW(Serializer::deserialize_cancel_reply(serialized), SerializationError);
}

TEST_F(SerializationTest, OutOfRangeEnumRejected) {
    auto serialized = Serializer::serialize(request_);

    // Mode follows the header and the request id
    size_t mode_offset = sizeof(MessageHeader) + request_.request_id.size();
    uint32_t bogus_mode = 9;
    std::memcpy(serialized.data() + mode_offset, &bogus_mode, sizeof(bogus_mode));

    EXPECT_THROW(Serializer::deserialize_recognize_request(serialized), SerializationError);
}

TEST_F(SerializationTest, InvalidFlagRejected) {
    CancelReply reply;
    reply.request_id = "x";
    auto serialized = Serializer::serialize(reply);
    serialized.back() = 2;

    EXPECT_THROW(Serializer::deserialize_cancel_reply(serialized), SerializationError);
}

TEST_F(SerializationTest, WrongMessageTypeRejected) {
    auto serialized = Serializer::serialize(request_);
    EXPECT_THROW(Serializer::deserialize_recognize_response(serialized), SerializationError);
    EXPECT_THROW(Serializer::deserialize_progress_query(serialized), SerializationError);
}

TEST_F(SerializationTest, UnknownMessageTypeRejected) {
    auto serialized = Serializer::serialize(CancelQuery());
    uint32_t bogus_type = 99;
    std::memcpy(serialized.data() + offsetof(MessageHeader, type), &bogus_type, sizeof(bogus_type));

    EXPECT_THROW(Serializer::peek_type(serialized), SerializationError);
}

TEST_F(SerializationTest, PeekRequestIdWithoutFullDecode) {
    auto serialized = Serializer::serialize(request_);
    EXPECT_EQ(Serializer::peek_request_id(serialized), "req-42");

    // Still readable when the body is damaged
    serialized.resize(sizeof(MessageHeader) + request_.request_id.size() + 2);
    EXPECT_EQ(Serializer::peek_request_id(serialized), "req-42");
    EXPECT_THROW(Serializer::deserialize_recognize_request(serialized), SerializationError);

    EXPECT_TRUE(Serializer::peek_request_id(std::vector<uint8_t>(8, 0)).empty());
}
