#pragma once

#include <absl/status/status.h>

#include <ManagedThreads.hpp>
#include <atomic>
#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/steady_timer.hpp>
#include <memory>
#include <mutex>
#include <optional>
#include <thread>
#include <vector>

#include "Acceptor.hpp"
#include "ServerCounters.hpp"
#include "config/ServerConfig.hpp"
#include "rotation/RotationEngine.hpp"
#include "router/MessageRouter.hpp"

namespace LogStream {

/**
 * The aggregation daemon: acceptor, router, backends and the rotation
 * engine, wired from a ServerConfig.
 *
 * start() returns once the socket is listening; I/O runs on a pool of
 * threads owned by the server. stop() drains within the configured grace
 * period and is also run by the destructor.
 */
class LogServer {
   public:
    explicit LogServer(ServerConfig config);
    ~LogServer();

    LogServer(const LogServer&) = delete;
    LogServer& operator=(const LogServer&) = delete;

    absl::Status start();
    void stop();

    [[nodiscard]] const ServerConfig& config() const { return config_; }
    [[nodiscard]] const ServerCounters& counters() const { return counters_; }
    [[nodiscard]] MessageRouter::Stats routerStats() const;
    // Null when the file backend is disabled or before start().
    [[nodiscard]] RotationEngine* rotationEngine() const { return engine_; }
    [[nodiscard]] Acceptor* acceptor() const { return acceptor_.get(); }

   private:
    absl::Status buildBackends(std::vector<Backend>* backends);
    void scheduleRetention();

    const ServerConfig config_;
    ServerCounters counters_;

    boost::asio::io_context io_;
    std::optional<
        boost::asio::executor_work_guard<boost::asio::io_context::executor_type>>
        work_;
    std::vector<std::thread> ioThreads_;

    ThreadManager threads_;
    RotationEngine* engine_ = nullptr;
    std::unique_ptr<MessageRouter> router_;
    std::unique_ptr<Acceptor> acceptor_;

    std::unique_ptr<boost::asio::steady_timer> retentionTimer_;
    // Touched on the timer's strand only.
    bool retentionStopped_ = false;

    std::mutex lifecycleMutex_;
    bool started_ = false;
    bool stopped_ = false;
};

}  // namespace LogStream
