#include "recognition_server.hpp"
#include "errors.hpp"
#include "serialization.hpp"
#include <iostream>

namespace dre {

RecognitionServer::RecognitionServer(const ServerConfig& config, TextRecognizer* text_recognizer)
    : config_(config)
    , running_(false)
    , requests_received_(0)
    , replies_sent_(0)
    , malformed_requests_(0) {

    store_ = std::make_unique<SqliteCatalogStore>(config_.database_path);
    std::cout << "Catalog database opened: " << config_.database_path << std::endl;

    engine_ = std::make_unique<RecognitionEngine>(*store_, text_recognizer, config_.engine);

    server_ = std::make_unique<RequestServer>(config_.endpoint, config_.receive_timeout_ms);
    std::cout << "Server bound to " << config_.endpoint << std::endl;
}

RecognitionServer::~RecognitionServer() {
    stop();
    maintenance_cv_.notify_all();
    if (maintenance_thread_.joinable()) {
        maintenance_thread_.join();
    }
}

void RecognitionServer::run() {
    running_ = true;

    const EngineConfig& engine_config = config_.engine;

    std::cout << "\n=== Starting Recognition Server ===" << std::endl;
    std::cout << "Endpoint: " << config_.endpoint << std::endl;
    std::cout << "Database: " << config_.database_path << std::endl;
    std::cout << "Workers: " << engine_->get_worker_count() << std::endl;
    std::cout << "Batch size: " << engine_config.search.batch_size << std::endl;
    std::cout << "Job TTL: " << engine_config.jobs.ttl.count() << "ms, max duration: "
              << engine_config.jobs.max_duration.count() << "ms" << std::endl;
    std::cout << "Refresh interval: " << config_.refresh_interval.count() << "s" << std::endl;
    std::cout << "Mode thresholds: text density " << engine_config.mode_selector.text_density_threshold
              << ", small contours " << engine_config.mode_selector.small_contour_threshold
              << ", max contours " << engine_config.mode_selector.max_object_contours
              << ", edge density " << engine_config.mode_selector.edge_density_threshold << std::endl;
    std::cout << "OCR: " << (engine_->ocr_available() ? "available" : "unavailable") << std::endl;
    std::cout << "===================================\n" << std::endl;

    if (!engine_->refresh_catalog()) {
        std::cerr << "Catalog not loaded; recognition requests will report it unavailable "
                  << "until a refresh succeeds" << std::endl;
    }

    maintenance_thread_ = std::thread(&RecognitionServer::maintenance_loop, this);

    std::cout << "Waiting for requests..." << std::endl;

    while (running_) {
        try {
            IncomingRequest request = server_->receive();

            if (!request.empty()) {
                requests_received_++;
                handle(request);
            }

            flush_completed();

        } catch (const std::exception& e) {
            std::cerr << "Error in request loop: " << e.what() << std::endl;
            // Continue serving
        }
    }

    drain();

    maintenance_cv_.notify_all();
    if (maintenance_thread_.joinable()) {
        maintenance_thread_.join();
    }

    std::cout << "\n=== Recognition Server Stopped ===" << std::endl;
    std::cout << "Requests received: " << requests_received_ << std::endl;
    std::cout << "Replies sent: " << replies_sent_ << std::endl;
    std::cout << "Malformed requests: " << malformed_requests_ << std::endl;
    std::cout << "Recognitions completed: " << engine_->get_requests_completed()
              << ", failed: " << engine_->get_requests_failed()
              << ", cancelled: " << engine_->get_requests_cancelled() << std::endl;
}

void RecognitionServer::stop() {
    running_ = false;
}

bool RecognitionServer::is_running() const {
    return running_;
}

void RecognitionServer::handle(const IncomingRequest& request) {
    MessageType type;
    try {
        type = Serializer::peek_type(request.payload);
    } catch (const SerializationError& e) {
        malformed_requests_++;
        send_error(request.identity, Serializer::peek_request_id(request.payload),
                   ErrorKind::MALFORMED_REQUEST, e.what());
        return;
    }

    switch (type) {
        case MessageType::RECOGNIZE_REQUEST:
            handle_recognize(request);
            break;
        case MessageType::PROGRESS_REQUEST:
            handle_progress(request);
            break;
        case MessageType::CANCEL_REQUEST:
            handle_cancel(request);
            break;
        default:
            malformed_requests_++;
            send_error(request.identity, Serializer::peek_request_id(request.payload),
                       ErrorKind::MALFORMED_REQUEST, "Message type is not a request");
            break;
    }
}

void RecognitionServer::handle_recognize(const IncomingRequest& request) {
    RecognitionRequest recognition;
    try {
        recognition = Serializer::deserialize_recognize_request(request.payload);
    } catch (const SerializationError& e) {
        malformed_requests_++;
        send_error(request.identity, Serializer::peek_request_id(request.payload),
                   ErrorKind::MALFORMED_REQUEST, e.what());
        return;
    }

    std::cout << "Recognize " << (recognition.request_id.empty() ? "(unnamed)" : recognition.request_id)
              << ": " << recognition.image_data.size() << " bytes, mode "
              << to_string(recognition.mode) << ", top " << recognition.top_k << std::endl;

    PendingReply pending;
    pending.identity = request.identity;
    pending.request_id = recognition.request_id;
    pending.response = engine_->submit(std::move(recognition));

    pending_.push_back(std::move(pending));
}

void RecognitionServer::handle_progress(const IncomingRequest& request) {
    ProgressQuery query;
    try {
        query = Serializer::deserialize_progress_query(request.payload);
    } catch (const SerializationError& e) {
        malformed_requests_++;
        send_error(request.identity, Serializer::peek_request_id(request.payload),
                   ErrorKind::MALFORMED_REQUEST, e.what());
        return;
    }

    ProgressReply reply;
    reply.request_id = query.request_id;

    try {
        reply.progress = engine_->get_progress(query.request_id);
        reply.found = true;
    } catch (const NotFoundError& e) {
        reply.found = false;
        reply.error = e.kind();
        reply.message = e.what();
    }

    send(request.identity, Serializer::serialize(reply));
}

void RecognitionServer::handle_cancel(const IncomingRequest& request) {
    CancelQuery query;
    try {
        query = Serializer::deserialize_cancel_query(request.payload);
    } catch (const SerializationError& e) {
        malformed_requests_++;
        send_error(request.identity, Serializer::peek_request_id(request.payload),
                   ErrorKind::MALFORMED_REQUEST, e.what());
        return;
    }

    CancelReply reply;
    reply.request_id = query.request_id;
    reply.acknowledged = engine_->cancel(query.request_id);

    std::cout << "Cancel " << query.request_id << ": "
              << (reply.acknowledged ? "acknowledged" : "no active job") << std::endl;

    send(request.identity, Serializer::serialize(reply));
}

void RecognitionServer::send(const std::vector<uint8_t>& identity, const std::vector<uint8_t>& payload) {
    server_->reply(identity, payload);
    replies_sent_++;
}

void RecognitionServer::send_error(const std::vector<uint8_t>& identity, const std::string& request_id,
                                   ErrorKind kind, const std::string& message) {
    std::cerr << "Rejecting request " << (request_id.empty() ? "(unknown)" : request_id)
              << " (" << to_string(kind) << "): " << message << std::endl;

    ErrorReply reply;
    reply.request_id = request_id;
    reply.error = kind;
    reply.message = message;
    send(identity, Serializer::serialize(reply));
}

void RecognitionServer::flush_completed() {
    for (auto it = pending_.begin(); it != pending_.end();) {
        if (it->response.wait_for(std::chrono::seconds(0)) != std::future_status::ready) {
            ++it;
            continue;
        }

        PendingReply done = std::move(*it);
        it = pending_.erase(it);

        try {
            RecognitionResponse response = done.response.get();

            std::cout << "Finished " << response.request_id << ": " << to_string(response.status)
                      << " via " << to_string(response.method_used) << ", "
                      << response.results.size() << " results";
            if (response.error != ErrorKind::NONE) {
                std::cout << " (" << to_string(response.error) << ")";
            }
            std::cout << std::endl;

            send(done.identity, Serializer::serialize(response));

        } catch (const RecognitionError& e) {
            // Coordinator misuse surfaced by the worker
            send_error(done.identity, done.request_id, e.kind(), e.what());
        }
    }
}

void RecognitionServer::drain() {
    if (pending_.empty()) {
        return;
    }

    std::cout << "Cancelling " << pending_.size() << " in-flight requests..." << std::endl;

    for (const auto& pending : pending_) {
        if (!pending.request_id.empty()) {
            engine_->cancel(pending.request_id);
        }
    }

    for (auto& pending : pending_) {
        pending.response.wait();
    }

    try {
        flush_completed();
    } catch (const IPCError& e) {
        std::cerr << "Failed to deliver final replies: " << e.what() << std::endl;
    }
}

void RecognitionServer::maintenance_loop() {
    auto last_refresh = std::chrono::steady_clock::now();
    auto last_sweep = last_refresh;

    std::unique_lock<std::mutex> lock(maintenance_mutex_);

    while (running_) {
        maintenance_cv_.wait_for(lock, std::chrono::milliseconds(250), [this] {
            return !running_;
        });

        if (!running_) {
            break;
        }

        auto now = std::chrono::steady_clock::now();

        if (now - last_sweep >= config_.sweep_interval) {
            engine_->sweep();
            last_sweep = now;
        }

        if (config_.refresh_interval.count() > 0 && now - last_refresh >= config_.refresh_interval) {
            engine_->refresh_catalog();
            last_refresh = now;
        }
    }
}

size_t RecognitionServer::get_requests_received() const {
    return requests_received_;
}

size_t RecognitionServer::get_replies_sent() const {
    return replies_sent_;
}

size_t RecognitionServer::get_malformed_requests() const {
    return malformed_requests_;
}

}  // namespace dre
