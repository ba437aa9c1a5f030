#pragma once

#include "catalog_store.hpp"
#include "ipc_manager.hpp"
#include "recognition_engine.hpp"
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <future>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace dre {

struct ServerConfig {
    std::string endpoint;
    std::string database_path;
    EngineConfig engine;
    int receive_timeout_ms;                     // I/O loop poll interval
    std::chrono::seconds refresh_interval;      // 0 disables periodic reload
    std::chrono::seconds sweep_interval;

    ServerConfig()
        : endpoint("tcp://*:5560")
        , database_path("drugs.db")
        , receive_timeout_ms(20)
        , refresh_interval(300)
        , sweep_interval(5) {}
};

class RecognitionServer {
public:
    // text_recognizer may be null; OCR requests then report it unavailable
    explicit RecognitionServer(const ServerConfig& config,
                               TextRecognizer* text_recognizer = nullptr);
    ~RecognitionServer();

    // Serve requests (blocking call)
    void run();

    // Stop the server
    void stop();

    // Check if server is running
    bool is_running() const;

    RecognitionEngine& engine() {
        return *engine_;
    }

    // Get statistics
    size_t get_requests_received() const;
    size_t get_replies_sent() const;
    size_t get_malformed_requests() const;

private:
    struct PendingReply {
        std::vector<uint8_t> identity;
        std::string request_id;
        std::future<RecognitionResponse> response;
    };

    // Dispatch one decoded request by message type
    void handle(const IncomingRequest& request);

    void handle_recognize(const IncomingRequest& request);
    void handle_progress(const IncomingRequest& request);
    void handle_cancel(const IncomingRequest& request);

    void send(const std::vector<uint8_t>& identity, const std::vector<uint8_t>& payload);

    void send_error(const std::vector<uint8_t>& identity, const std::string& request_id,
                    ErrorKind kind, const std::string& message);

    // Reply to every finished recognition; only the I/O thread calls this
    void flush_completed();

    // Cancel what is still running and deliver the final replies
    void drain();

    // Periodic catalog refresh and job sweep, off the I/O thread
    void maintenance_loop();

    ServerConfig config_;

    std::unique_ptr<SqliteCatalogStore> store_;
    std::unique_ptr<RecognitionEngine> engine_;
    std::unique_ptr<RequestServer> server_;

    std::vector<PendingReply> pending_;

    std::thread maintenance_thread_;
    std::mutex maintenance_mutex_;
    std::condition_variable maintenance_cv_;

    std::atomic<bool> running_;
    std::atomic<size_t> requests_received_;
    std::atomic<size_t> replies_sent_;
    std::atomic<size_t> malformed_requests_;
};

}  // namespace dre
