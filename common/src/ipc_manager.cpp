#include "ipc_manager.hpp"
#include <zmq.h>
#include <cerrno>
#include <cstring>

namespace dre {

namespace {

// Owns a context and one socket; closes both on any failure
struct SocketHandle {
    void* context;
    void* socket;

    SocketHandle(int type, const char* role)
        : context(nullptr), socket(nullptr) {
        context = zmq_ctx_new();
        if (!context) {
            throw IPCError("Failed to create ZeroMQ context");
        }

        socket = zmq_socket(context, type);
        if (!socket) {
            zmq_ctx_destroy(context);
            throw IPCError(std::string("Failed to create ") + role + " socket");
        }

        int linger = 0;
        zmq_setsockopt(socket, ZMQ_LINGER, &linger, sizeof(linger));
    }

    ~SocketHandle() {
        if (socket) {
            zmq_close(socket);
        }
        if (context) {
            zmq_ctx_destroy(context);
        }
    }

    SocketHandle(const SocketHandle&) = delete;
    SocketHandle& operator=(const SocketHandle&) = delete;

    void set_option(int option, int value, const char* what) {
        if (zmq_setsockopt(socket, option, &value, sizeof(value)) != 0) {
            throw IPCError(std::string("Failed to set ") + what + ": " +
                           std::string(zmq_strerror(zmq_errno())));
        }
    }
};

// Receives one frame. Returns false on timeout.
bool receive_frame(void* socket, std::vector<uint8_t>& frame, bool& more) {
    zmq_msg_t msg;
    if (zmq_msg_init(&msg) != 0) {
        throw IPCError("Failed to initialize message");
    }

    int rc = zmq_msg_recv(&msg, socket, 0);
    if (rc == -1) {
        int err = zmq_errno();
        zmq_msg_close(&msg);

        // Timeout is not an error
        if (err == EAGAIN) {
            return false;
        }

        throw IPCError("Failed to receive message: " + std::string(zmq_strerror(err)));
    }

    size_t size = zmq_msg_size(&msg);
    frame.resize(size);
    if (size > 0) {
        std::memcpy(frame.data(), zmq_msg_data(&msg), size);
    }
    more = zmq_msg_more(&msg) != 0;

    zmq_msg_close(&msg);
    return true;
}

void send_frame(void* socket, const void* data, size_t size, int flags) {
    if (zmq_send(socket, data, size, flags) == -1) {
        throw IPCError("Failed to send message: " + std::string(zmq_strerror(zmq_errno())));
    }
}

}  // namespace

// RequestServer Implementation
class RequestServer::Impl {
public:
    Impl(const std::string& endpoint, int timeout_ms)
        : handle_(ZMQ_ROUTER, "router")
        , endpoint_(endpoint) {

        handle_.set_option(ZMQ_RCVTIMEO, timeout_ms, "receive timeout");

        if (zmq_bind(handle_.socket, endpoint.c_str()) != 0) {
            throw IPCError("Failed to bind server to " + endpoint + ": " +
                           std::string(zmq_strerror(zmq_errno())));
        }
    }

    IncomingRequest receive() {
        IncomingRequest request;
        bool more = false;

        if (!receive_frame(handle_.socket, request.identity, more)) {
            return IncomingRequest();
        }

        // REQ peers put an empty delimiter before the payload
        std::vector<uint8_t> frame;
        while (more) {
            if (!receive_frame(handle_.socket, frame, more)) {
                throw IPCError("Multipart message truncated");
            }
            if (!frame.empty()) {
                request.payload.swap(frame);
            }
        }

        if (request.payload.empty()) {
            return IncomingRequest();
        }
        return request;
    }

    void reply(const std::vector<uint8_t>& identity, const std::vector<uint8_t>& payload) {
        if (payload.empty()) {
            throw IPCError("Cannot send empty data");
        }

        send_frame(handle_.socket, identity.data(), identity.size(), ZMQ_SNDMORE);
        send_frame(handle_.socket, nullptr, 0, ZMQ_SNDMORE);
        send_frame(handle_.socket, payload.data(), payload.size(), 0);
    }

    void set_timeout(int timeout_ms) {
        handle_.set_option(ZMQ_RCVTIMEO, timeout_ms, "receive timeout");
    }

    bool is_bound() const {
        return handle_.socket != nullptr;
    }

private:
    SocketHandle handle_;
    std::string endpoint_;
};

RequestServer::RequestServer(const std::string& endpoint, int timeout_ms)
    : pimpl_(std::make_unique<Impl>(endpoint, timeout_ms)) {}

RequestServer::~RequestServer() = default;

RequestServer::RequestServer(RequestServer&&) noexcept = default;
RequestServer& RequestServer::operator=(RequestServer&&) noexcept = default;

IncomingRequest RequestServer::receive() {
    return pimpl_->receive();
}

void RequestServer::reply(const std::vector<uint8_t>& identity, const std::vector<uint8_t>& payload) {
    pimpl_->reply(identity, payload);
}

void RequestServer::set_timeout(int timeout_ms) {
    pimpl_->set_timeout(timeout_ms);
}

bool RequestServer::is_bound() const {
    return pimpl_->is_bound();
}

// RequestClient Implementation
class RequestClient::Impl {
public:
    Impl(const std::string& endpoint, int timeout_ms)
        : handle_(ZMQ_REQ, "request")
        , endpoint_(endpoint) {

        handle_.set_option(ZMQ_RCVTIMEO, timeout_ms, "receive timeout");
        handle_.set_option(ZMQ_SNDTIMEO, timeout_ms, "send timeout");

        // Allow a new request after a timed out one
        handle_.set_option(ZMQ_REQ_RELAXED, 1, "relaxed mode");
        handle_.set_option(ZMQ_REQ_CORRELATE, 1, "request correlation");

        if (zmq_connect(handle_.socket, endpoint.c_str()) != 0) {
            throw IPCError("Failed to connect client to " + endpoint + ": " +
                           std::string(zmq_strerror(zmq_errno())));
        }
    }

    std::vector<uint8_t> request(const std::vector<uint8_t>& payload) {
        if (payload.empty()) {
            throw IPCError("Cannot send empty data");
        }

        send_frame(handle_.socket, payload.data(), payload.size(), 0);

        std::vector<uint8_t> reply;
        bool more = false;
        if (!receive_frame(handle_.socket, reply, more)) {
            throw IPCError("Timed out waiting for reply from " + endpoint_);
        }

        std::vector<uint8_t> extra;
        while (more) {
            if (!receive_frame(handle_.socket, extra, more)) {
                throw IPCError("Multipart reply truncated");
            }
        }

        return reply;
    }

    void set_timeout(int timeout_ms) {
        handle_.set_option(ZMQ_RCVTIMEO, timeout_ms, "receive timeout");
        handle_.set_option(ZMQ_SNDTIMEO, timeout_ms, "send timeout");
    }

    bool is_connected() const {
        return handle_.socket != nullptr;
    }

private:
    SocketHandle handle_;
    std::string endpoint_;
};

RequestClient::RequestClient(const std::string& endpoint, int timeout_ms)
    : pimpl_(std::make_unique<Impl>(endpoint, timeout_ms)) {}

RequestClient::~RequestClient() = default;

RequestClient::RequestClient(RequestClient&&) noexcept = default;
RequestClient& RequestClient::operator=(RequestClient&&) noexcept = default;

std::vector<uint8_t> RequestClient::request(const std::vector<uint8_t>& payload) {
    return pimpl_->request(payload);
}

void RequestClient::set_timeout(int timeout_ms) {
    pimpl_->set_timeout(timeout_ms);
}

bool RequestClient::is_connected() const {
    return pimpl_->is_connected();
}

}  // namespace dre
