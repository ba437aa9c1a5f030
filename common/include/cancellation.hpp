#pragma once

#include <atomic>
#include <cstdint>
#include <memory>

namespace dre {

enum class CancelReason : uint32_t {
    NONE = 0,
    USER = 1,     // client asked for it
    TIMEOUT = 2   // server-side deadline
};

// Cooperative per-job cancellation flag, polled at batch boundaries
class CancellationToken {
public:
    CancellationToken() : reason_(static_cast<uint32_t>(CancelReason::NONE)) {}

    // First reason wins; returns false if already cancelled
    bool cancel(CancelReason reason) {
        uint32_t expected = static_cast<uint32_t>(CancelReason::NONE);
        return reason_.compare_exchange_strong(expected, static_cast<uint32_t>(reason));
    }

    bool cancelled() const {
        return reason_.load() != static_cast<uint32_t>(CancelReason::NONE);
    }

    CancelReason reason() const {
        return static_cast<CancelReason>(reason_.load());
    }

private:
    std::atomic<uint32_t> reason_;
};

using CancellationTokenPtr = std::shared_ptr<CancellationToken>;

}  // namespace dre
