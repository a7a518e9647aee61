#include <fmt/chrono.h>
#include <fmt/format.h>

#include <ManagedThreads.hpp>
#include <chrono>
#include <mutex>
#include <shared_mutex>

namespace LogStream {

ThreadManager::~ThreadManager() { destroy(); }

bool ThreadManager::destroy(std::chrono::milliseconds grace) {
    const std::lock_guard<std::shared_mutex> _(mControllerLock);
    if (destroyed) {
        return true;
    }
    destroyed = true;

    DLOG(INFO) << "Starting ThreadManager::destroy, launchCount="
               << launchCount;
    // Request stop first so that no runner can be launched after the
    // countdown below has been computed.
    stopSource.request_stop();
    auto countdown = static_cast<int>(Usage::MAX) - launchCount;
    latch.count_down(countdown);
    DLOG(INFO) << "Counted down " << countdown << " times...";
    LOG(INFO) << "Requested stop, now waiting...";

    bool graceful = latch.wait_with_timeout(grace);
    if (!graceful) {
        LOG(ERROR) << fmt::format(
            "Timed out waiting for threads to finish (waited {})", grace);
        for (const auto& thread : kControllers) {
            if (thread.second && thread.second->running()) {
                LOG(ERROR) << fmt::format("Aborting thread {}", thread.first);
                thread.second->onAbort();
            }
        }
    }
    for (const auto& thread : kControllers) {
        if (thread.second && thread.second->threadP.joinable()) {
            thread.second->threadP.join();
        }
    }
    kControllers.clear();
    return graceful;
}

}  // namespace LogStream
