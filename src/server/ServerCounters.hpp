#pragma once

#include <atomic>
#include <cstddef>
#include <cstdint>

namespace LogStream {

// Server-wide counters, shared by the acceptor and all sessions.
struct ServerCounters {
    // Sessions holding a connection slot.
    std::atomic<size_t> liveConnections{0};
    std::atomic<uint64_t> accepted{0};
    std::atomic<uint64_t> rejected{0};
    std::atomic<uint64_t> entriesReceived{0};
    std::atomic<uint64_t> malformedLines{0};
    std::atomic<uint64_t> protocolViolations{0};
    std::atomic<uint64_t> fileFailures{0};
};

// Holds one unit of ServerCounters::liveConnections; released on
// destruction.
class ConnectionSlot {
   public:
    explicit ConnectionSlot(std::atomic<size_t>* counter) : counter_(counter) {}
    ~ConnectionSlot() {
        if (counter_ != nullptr) {
            counter_->fetch_sub(1);
        }
    }

    ConnectionSlot(ConnectionSlot&& other) noexcept
        : counter_(other.counter_) {
        other.counter_ = nullptr;
    }
    ConnectionSlot& operator=(ConnectionSlot&&) = delete;
    ConnectionSlot(const ConnectionSlot&) = delete;
    ConnectionSlot& operator=(const ConnectionSlot&) = delete;

   private:
    std::atomic<size_t>* counter_;
};

}  // namespace LogStream
