#pragma once

#include <absl/status/status.h>

#include <atomic>
#include <cstdint>
#include <functional>
#include <memory>
#include <vector>

#include "backends/Backend.hpp"
#include "entry/LogEntry.hpp"

namespace LogStream {

/**
 * Fans entries out to the configured backends.
 *
 * Best-effort backends are written first; their failures are logged and
 * counted but never reach the caller. The outcome of the durable (file)
 * backends is delivered through the completion passed to route(), which
 * may run on another thread.
 */
class MessageRouter {
   public:
    using Completion = std::function<void(absl::Status)>;

    struct Stats {
        uint64_t routed;
        uint64_t fileFailures;
        uint64_t auxFailures;
    };

    explicit MessageRouter(std::vector<Backend> backends);

    // Safe to call from many sessions at once. Entries routed by one
    // caller reach each backend in call order.
    void route(const LogEntry& entry, Completion done);

    [[nodiscard]] Stats stats() const;
    [[nodiscard]] size_t backendCount() const { return backends_.size(); }

   private:
    std::vector<Backend> backends_;
    size_t durableCount_ = 0;

    std::atomic<uint64_t> routed_{0};
    std::shared_ptr<std::atomic<uint64_t>> fileFailures_;
    std::atomic<uint64_t> auxFailures_{0};
};

}  // namespace LogStream
