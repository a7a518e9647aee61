#include <fmt/format.h>

#include <ManagedThreads.hpp>
#include <stop_token>

namespace LogStream {

void ThreadRunner::run() {
    if (mgr_priv.stopToken.stop_requested()) {
        LOG(WARNING) << fmt::format("{}: manager is shutting down, not started",
                                    mgr_priv.usage);
        return;
    }
    ++(*mgr_priv.launched);
    isRunning = true;
    threadP = std::jthread(&ThreadRunner::threadFunction, this);
}

void ThreadRunner::threadFunction() {
    DLOG(INFO) << fmt::format("{} started (launched: {})", mgr_priv.usage,
                              mgr_priv.launched->load());
    auto callback = std::make_unique<StopCallBackJust>(mgr_priv.stopToken,
                                                       [this] { onPreStop(); });
    runFunction(mgr_priv.stopToken);
    if (!mgr_priv.stopToken.stop_requested()) {
        LOG(WARNING) << fmt::format("{} has stopped before stop request",
                                    mgr_priv.usage);
    }
    callback.reset();
    isRunning = false;
    mgr_priv.completeLatch->count_down();
    DLOG(INFO) << fmt::format("{} joined the latch", mgr_priv.usage);
}

}  // namespace LogStream
