#include "MessageRouter.hpp"

#include <LogCompat.hpp>
#include <fmt/format.h>

#include <memory>
#include <mutex>
#include <type_traits>
#include <utility>

namespace LogStream {

namespace {

// Joins the outcomes of all durable backends for one entry.
struct PendingOutcome {
    PendingOutcome(size_t count, MessageRouter::Completion callback)
        : remaining(count), done(std::move(callback)) {}

    void complete(absl::Status status) {
        {
            std::lock_guard<std::mutex> lock(mutex);
            if (first.ok()) {
                first = std::move(status);
            }
        }
        if (remaining.fetch_sub(1) == 1 && done) {
            done(first);
        }
    }

    std::atomic<size_t> remaining;
    std::mutex mutex;
    absl::Status first;
    MessageRouter::Completion done;
};

}  // namespace

MessageRouter::MessageRouter(std::vector<Backend> backends)
    : backends_(std::move(backends)),
      fileFailures_(std::make_shared<std::atomic<uint64_t>>(0)) {
    for (const auto& backend : backends_) {
        std::visit(
            [this](const auto& b) {
                using T = std::decay_t<decltype(b)>;
                if constexpr (T::kDurable) {
                    ++durableCount_;
                }
            },
            backend);
        LOG(INFO) << "Routing to backend: " << backendName(backend);
    }
}

void MessageRouter::route(const LogEntry& entry, Completion done) {
    ++routed_;

    for (auto& backend : backends_) {
        std::visit(
            [&](auto& b) {
                using T = std::decay_t<decltype(b)>;
                if constexpr (!T::kDurable) {
                    if (auto status = b.write(entry); !status.ok()) {
                        ++auxFailures_;
                        LOG(WARNING) << fmt::format("{} backend: {}", b.name(),
                                                    status.ToString());
                    }
                }
            },
            backend);
    }

    if (durableCount_ == 0) {
        if (done) {
            done(absl::OkStatus());
        }
        return;
    }

    auto pending =
        std::make_shared<PendingOutcome>(durableCount_, std::move(done));
    for (auto& backend : backends_) {
        std::visit(
            [&](auto& b) {
                using T = std::decay_t<decltype(b)>;
                if constexpr (T::kDurable) {
                    b.write(entry, [pending, failures = fileFailures_,
                                    name = b.name()](absl::Status status) {
                        if (!status.ok()) {
                            ++*failures;
                            LOG(ERROR) << fmt::format("{} backend: {}", name,
                                                      status.ToString());
                        }
                        pending->complete(std::move(status));
                    });
                }
            },
            backend);
    }
}

MessageRouter::Stats MessageRouter::stats() const {
    return {routed_.load(), fileFailures_->load(), auxFailures_.load()};
}

}  // namespace LogStream
