#include <gtest/gtest.h>
#include "recognition_server.hpp"
#include "errors.hpp"
#include "lbp_extractor.hpp"
#include "serialization.hpp"
#include "test_support.hpp"
#include <filesystem>
#include <thread>

using namespace dre;
using namespace dre::test;

namespace fs = std::filesystem;

class RecognitionServerTest : public ::testing::Test {
protected:
    void SetUp() override {
        static int port = 15655;
        client_endpoint_ = "tcp://127.0.0.1:" + std::to_string(port);
        config_.endpoint = "tcp://127.0.0.1:" + std::to_string(port++);

        database_path_ = (fs::temp_directory_path() /
            ("dre_server_test_" + std::string(
                ::testing::UnitTest::GetInstance()->current_test_info()->name()) + ".db")).string();
        remove_database();

        noise_bytes_ = encode_png(noise_image(160, 120, 5));
        pill_bytes_ = encode_png(pill_image(160));
        populate_catalog();

        config_.database_path = database_path_;
        config_.engine.worker_threads = 2;
        config_.refresh_interval = std::chrono::seconds(0);

        server_ = std::make_unique<RecognitionServer>(config_);
        server_thread_ = std::thread([this]() { server_->run(); });
    }

    void TearDown() override {
        stop_server();
        server_.reset();
        remove_database();
    }

    void stop_server() {
        if (server_) {
            server_->stop();
        }
        if (server_thread_.joinable()) {
            server_thread_.join();
        }
    }

    void populate_catalog() {
        SqliteCatalogStore store(database_path_);
        store.init_schema();
        LbpExtractor extractor;

        DrugInfo amoxicillin;
        amoxicillin.license_number = "H20065016";
        amoxicillin.chinese_name = "阿莫西林胶囊";
        amoxicillin.english_name = "Amoxicillin Capsules";
        amoxicillin.shape = "capsule";
        amoxicillin.color = "red";
        amoxicillin_id_ = store.add_drug(amoxicillin);
        ImageId image = store.add_image(amoxicillin_id_, "amoxicillin.png", "/photos/amoxicillin.png");
        store.store_feature_vector(image, extractor.extract(noise_bytes_));

        DrugInfo vitamin;
        vitamin.license_number = "H44021893";
        vitamin.chinese_name = "维生素C片";
        vitamin.english_name = "Vitamin C Tablets";
        vitamin.shape = "round";
        vitamin.color = "white";
        DrugId vitamin_id = store.add_drug(vitamin);
        image = store.add_image(vitamin_id, "vitamin_c.png", "/photos/vitamin_c.png");
        store.store_feature_vector(image, extractor.extract(pill_bytes_));
    }

    void remove_database() {
        std::error_code ec;
        fs::remove(database_path_, ec);
        fs::remove(database_path_ + "-wal", ec);
        fs::remove(database_path_ + "-shm", ec);
    }

    std::vector<uint8_t> exchange(const std::vector<uint8_t>& payload) {
        RequestClient client(client_endpoint_, 10000);
        return client.request(payload);
    }

    RecognitionResponse recognize(const std::vector<uint8_t>& image, const std::string& request_id) {
        RecognitionRequest request;
        request.request_id = request_id;
        request.image_data = image;
        request.mode = RecognitionMode::FEATURE;
        request.top_k = 2;
        return Serializer::deserialize_recognize_response(exchange(Serializer::serialize(request)));
    }

    ServerConfig config_;
    std::string client_endpoint_;
    std::string database_path_;
    std::vector<uint8_t> noise_bytes_;
    std::vector<uint8_t> pill_bytes_;
    DrugId amoxicillin_id_ = 0;

    std::unique_ptr<RecognitionServer> server_;
    std::thread server_thread_;
};

TEST_F(RecognitionServerTest, RecognizesOverSocket) {
    RecognitionResponse response = recognize(noise_bytes_, "socket-1");

    ASSERT_TRUE(response.success) << response.message;
    EXPECT_EQ(response.request_id, "socket-1");
    EXPECT_EQ(response.status, JobStatus::COMPLETED);
    ASSERT_EQ(response.results.size(), 2u);
    EXPECT_EQ(response.results[0].drug_id, amoxicillin_id_);
    EXPECT_NEAR(response.results[0].similarity, 1.0f, 1e-4);
    ASSERT_TRUE(response.results[0].drug.has_value());
    EXPECT_EQ(response.results[0].drug->chinese_name, "阿莫西林胶囊");
    EXPECT_EQ(response.results[0].drug->license_number, "H20065016");
}

TEST_F(RecognitionServerTest, ProgressOfFinishedJob) {
    ASSERT_TRUE(recognize(pill_bytes_, "done-1").success);

    ProgressQuery query;
    query.request_id = "done-1";
    std::vector<uint8_t> reply = exchange(Serializer::serialize(query));

    ASSERT_EQ(Serializer::peek_type(reply), MessageType::PROGRESS_RESPONSE);
    ProgressReply progress = Serializer::deserialize_progress_reply(reply);
    EXPECT_TRUE(progress.found);
    EXPECT_EQ(progress.progress.status, JobStatus::COMPLETED);
    EXPECT_DOUBLE_EQ(progress.progress.percent, 100.0);
}

TEST_F(RecognitionServerTest, UnknownJobQueries) {
    ProgressQuery progress_query;
    progress_query.request_id = "nobody";
    ProgressReply progress = Serializer::deserialize_progress_reply(
        exchange(Serializer::serialize(progress_query)));

    EXPECT_FALSE(progress.found);
    EXPECT_EQ(progress.error, ErrorKind::NOT_FOUND);

    CancelQuery cancel_query;
    cancel_query.request_id = "nobody";
    CancelReply cancel = Serializer::deserialize_cancel_reply(
        exchange(Serializer::serialize(cancel_query)));

    EXPECT_EQ(cancel.request_id, "nobody");
    EXPECT_FALSE(cancel.acknowledged);
}

TEST_F(RecognitionServerTest, InvalidImageReported) {
    std::vector<uint8_t> garbage(256, 0x5A);
    RecognitionResponse response = recognize(garbage, "bad-image");

    EXPECT_FALSE(response.success);
    EXPECT_EQ(response.status, JobStatus::FAILED);
    EXPECT_EQ(response.error, ErrorKind::INVALID_IMAGE);
}

TEST_F(RecognitionServerTest, MalformedPayloadsGetErrorReplies) {
    std::vector<uint8_t> reply = exchange({'h', 'e', 'l', 'l', 'o'});
    ASSERT_EQ(Serializer::peek_type(reply), MessageType::ERROR_RESPONSE);
    EXPECT_EQ(Serializer::deserialize_error_reply(reply).error, ErrorKind::MALFORMED_REQUEST);

    // Well formed, but a reply type
    CancelReply not_a_request;
    not_a_request.request_id = "confused";
    reply = exchange(Serializer::serialize(not_a_request));
    ErrorReply error = Serializer::deserialize_error_reply(reply);
    EXPECT_EQ(error.error, ErrorKind::MALFORMED_REQUEST);
    EXPECT_EQ(error.request_id, "confused");

    // Header intact, body cut short
    RecognitionRequest request;
    request.request_id = "cut";
    request.image_data = noise_bytes_;
    std::vector<uint8_t> truncated = Serializer::serialize(request);
    truncated.resize(truncated.size() - 10);
    error = Serializer::deserialize_error_reply(exchange(truncated));
    EXPECT_EQ(error.error, ErrorKind::MALFORMED_REQUEST);
    EXPECT_EQ(error.request_id, "cut");

    // Still serving
    EXPECT_TRUE(recognize(pill_bytes_, "after-garbage").success);

    stop_server();
    EXPECT_EQ(server_->get_malformed_requests(), 3u);
    EXPECT_EQ(server_->get_requests_received(), 4u);
    EXPECT_EQ(server_->get_replies_sent(), 4u);
}
