#pragma once

#include <LogCompat.hpp>
#include <fmt/format.h>

#include <atomic>
#include <chrono>
#include <concepts>
#include <condition_variable>
#include <functional>
#include <latch>
#include <memory>
#include <mutex>
#include <shared_mutex>
#include <stop_token>
#include <string_view>
#include <thread>
#include <type_traits>
#include <unordered_map>
#include <utility>

namespace LogStream {

struct ThreadRunner;

class LatchWithTimeout {
   public:
    explicit LatchWithTimeout(std::ptrdiff_t count) : latch(count) {}

    void count_down(std::ptrdiff_t update = 1) {
        {
            std::lock_guard<std::mutex> lock(mtx);
            latch.count_down(update);
        }
        cv.notify_all();
    }

    template <typename Rep, typename Period>
    bool wait_with_timeout(std::chrono::duration<Rep, Period> timeout) {
        std::unique_lock<std::mutex> lock(mtx);
        return cv.wait_for(lock, timeout, [this] { return latch.try_wait(); });
    }

    void wait() { latch.wait(); }

   private:
    std::latch latch;
    std::condition_variable cv;
    std::mutex mtx;
};

class ThreadManager {
   public:
    ThreadManager() : latch(static_cast<int>(Usage::MAX)) {}
    ~ThreadManager();

    enum class Usage {
        ROTATION_ENGINE,
        COMPRESSOR,
        CLIENT_CONNECTOR,
        MAX
    };

    // Default time destroy() waits for runners before abandoning them.
    static constexpr std::chrono::seconds kShutdownDelay{5};

    template <std::derived_from<ThreadRunner> T = ThreadRunner,
              typename... Args>
        requires std::is_constructible_v<T, Args...>
    T* create(Usage usage, Args&&... args);

    template <std::derived_from<ThreadRunner> T = ThreadRunner>
    T* get(Usage usage);

    // Stop all controllers managed by this manager and join them.
    // Runners still busy after |grace| are asked to abort their queued work.
    // Returns false if the grace period elapsed.
    bool destroy(std::chrono::milliseconds grace = kShutdownDelay);

   private:
    std::shared_mutex mControllerLock;
    std::unordered_map<Usage, std::unique_ptr<ThreadRunner>> kControllers;
    std::stop_source stopSource;
    LatchWithTimeout latch;
    std::atomic_int launchCount;
    bool destroyed = false;
};

}  // namespace LogStream

template <>
struct fmt::formatter<LogStream::ThreadManager::Usage>
    : formatter<std::string_view> {
    // parse is inherited from formatter<string_view>.
    auto format(LogStream::ThreadManager::Usage c,
                format_context& ctx) const -> format_context::iterator {
        string_view name = "unknown";
        switch (c) {
            case LogStream::ThreadManager::Usage::ROTATION_ENGINE:
                name = "ROTATION_ENGINE";
                break;
            case LogStream::ThreadManager::Usage::COMPRESSOR:
                name = "COMPRESSOR";
                break;
            case LogStream::ThreadManager::Usage::CLIENT_CONNECTOR:
                name = "CLIENT_CONNECTOR";
                break;
            default:
                LOG(ERROR) << "Unknown usage: " << static_cast<int>(c);
                break;
        }
        return formatter<string_view>::format(name, ctx);
    }
};

namespace LogStream {

struct ThreadRunner {
    using just_function = std::function<void(void)>;
    using StopCallBackJust = std::stop_callback<just_function>;

    // Run the thread. Must be called after ThreadManager::create() returned
    // this runner; a runner of a destroyed manager does not start.
    void run();

    ThreadRunner() = default;
    virtual ~ThreadRunner() = default;

    friend class ThreadManager;

   protected:
    // The main thread function.
    virtual void runFunction(const std::stop_token& token) = 0;

    // The function called before (or to make it) stop.
    virtual void onPreStop() {}

    // Called when the shutdown grace period ran out while this runner was
    // still busy. Queued work should be abandoned.
    virtual void onAbort() {}

   private:
    // Underlying thread handle
    std::jthread threadP;
    // Wrapper around 'runFunction'
    void threadFunction();

    std::atomic_bool isRunning = false;

   public:
    struct {
        size_t size{};
        ThreadManager::Usage usage;
        std::stop_token stopToken;
        std::atomic_int* launched;
        LatchWithTimeout* completeLatch;
    } mgr_priv{};

    [[nodiscard]] bool running() const noexcept { return isRunning; }
};

template <std::derived_from<ThreadRunner> T, typename... Args>
    requires std::is_constructible_v<T, Args...>
T* ThreadManager::create(Usage usage, Args&&... args) {
    std::unique_ptr<T> newIt;

    if (get<T>(usage)) {
        LOG(ERROR) << fmt::format("MGR: {} has already started", usage);
        return nullptr;
    }

    std::lock_guard<std::shared_mutex> lock(mControllerLock);

    LOG(INFO) << fmt::format("MGR: Starting {}...", usage);
    if constexpr (sizeof...(args) != 0) {
        newIt = std::make_unique<T>(std::forward<Args>(args)...);
    } else {
        newIt = std::make_unique<T>();
    }
    newIt->mgr_priv.usage = usage;
    newIt->mgr_priv.size = sizeof(T);
    newIt->mgr_priv.stopToken = stopSource.get_token();
    newIt->mgr_priv.launched = &launchCount;
    newIt->mgr_priv.completeLatch = &latch;
    kControllers[usage] = std::move(newIt);

    return static_cast<T*>(kControllers[usage].get());
}

template <std::derived_from<ThreadRunner> T>
T* ThreadManager::get(Usage usage) {
    std::shared_lock<std::shared_mutex> lock(mControllerLock);
    auto it = kControllers.find(usage);
    if (it == kControllers.end()) {
        DLOG(INFO) << fmt::format("MGR: {} is not created", usage);
        return nullptr;
    }
    if (it->second->mgr_priv.size != sizeof(T)) {
        LOG(ERROR) << fmt::format(
            "MGR: {} wasn't created with size {}, expected {}", usage,
            sizeof(T), it->second->mgr_priv.size);
        return nullptr;
    }
    return static_cast<T*>(it->second.get());
}

}  // namespace LogStream
