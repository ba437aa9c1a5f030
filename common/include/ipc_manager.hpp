#pragma once

#include "message_types.hpp"
#include <cstdint>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

namespace dre {

class IPCError : public std::runtime_error {
public:
    explicit IPCError(const std::string& msg)
        : std::runtime_error(msg) {}
};

// Raw request as seen by the server: routing identity plus payload
struct IncomingRequest {
    std::vector<uint8_t> identity;
    std::vector<uint8_t> payload;

    bool empty() const {
        return payload.empty();
    }
};

// ZeroMQ ROUTER socket - answers many REQ clients from one thread
class RequestServer {
public:
    explicit RequestServer(const std::string& endpoint, int timeout_ms = 20);
    ~RequestServer();

    // Disable copy, allow move
    RequestServer(const RequestServer&) = delete;
    RequestServer& operator=(const RequestServer&) = delete;
    RequestServer(RequestServer&&) noexcept;
    RequestServer& operator=(RequestServer&&) noexcept;

    // Blocks up to the receive timeout; returns an empty request on timeout
    IncomingRequest receive();

    // Routes payload back to the client that sent identity
    void reply(const std::vector<uint8_t>& identity, const std::vector<uint8_t>& payload);

    void set_timeout(int timeout_ms);

    bool is_bound() const;

private:
    class Impl;
    std::unique_ptr<Impl> pimpl_;
};

// ZeroMQ REQ socket - one outstanding request at a time
class RequestClient {
public:
    explicit RequestClient(const std::string& endpoint, int timeout_ms = 5000);
    ~RequestClient();

    // Disable copy, allow move
    RequestClient(const RequestClient&) = delete;
    RequestClient& operator=(const RequestClient&) = delete;
    RequestClient(RequestClient&&) noexcept;
    RequestClient& operator=(RequestClient&&) noexcept;

    // Sends and waits for the reply; throws IPCError on timeout
    std::vector<uint8_t> request(const std::vector<uint8_t>& payload);

    void set_timeout(int timeout_ms);

    bool is_connected() const;

private:
    class Impl;
    std::unique_ptr<Impl> pimpl_;
};

}  // namespace dre
