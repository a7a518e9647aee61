#pragma once

#include <absl/status/status.h>

#include <ManagedThreads.hpp>
#include <atomic>
#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/local/stream_protocol.hpp>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <thread>

#include "Backoff.hpp"
#include "config/ClientConfig.hpp"
#include "entry/LogEntry.hpp"

namespace LogStream {

/**
 * Client side of the session protocol.
 *
 * Connection life cycle: Disconnected -> Connecting -> Handshaking ->
 * Connected. Any I/O failure goes back to Disconnected. While not connected,
 * entries wait in a bounded queue that drops its oldest line when full; after
 * a reconnect the queue is sent in order before new entries go out directly.
 *
 * With autoReconnect, a background runner retries failed connections with
 * exponential backoff. All methods are thread safe.
 */
class LogClient {
   public:
    enum class State {
        Disconnected,
        Connecting,
        Handshaking,
        Connected,
    };

    explicit LogClient(ClientConfig config);
    ~LogClient();

    LogClient(const LogClient&) = delete;
    LogClient& operator=(const LogClient&) = delete;

    // One connection attempt, bounded by the configured timeout. On success
    // any queued entries are sent. With autoReconnect the background runner
    // is started regardless of the outcome.
    absl::Status connect();

    // Sends or queues an entry. Entries below the minimum level are
    // discarded and reported as OK.
    absl::Status log(LogLevel level, std::string message,
                     LogFields fields = {});

    absl::Status emergency(std::string message, LogFields fields = {});
    absl::Status alert(std::string message, LogFields fields = {});
    absl::Status critical(std::string message, LogFields fields = {});
    absl::Status error(std::string message, LogFields fields = {});
    absl::Status warning(std::string message, LogFields fields = {});
    absl::Status notice(std::string message, LogFields fields = {});
    absl::Status info(std::string message, LogFields fields = {});
    absl::Status debug(std::string message, LogFields fields = {});

    // Waits until the queue has been sent. DeadlineExceeded if it did not
    // empty within |timeout|, Unavailable if nothing can send it.
    absl::Status flush(std::chrono::milliseconds timeout);

    // Stops the runner and closes the connection. Entries still queued are
    // discarded. Further log() calls fail with FailedPrecondition.
    void close();

    [[nodiscard]] State state() const { return state_.load(); }
    [[nodiscard]] size_t dropped() const;
    [[nodiscard]] size_t queued() const;
    [[nodiscard]] const ClientConfig& config() const { return config_; }

   private:
    using protocol = boost::asio::local::stream_protocol;
    class Connector;

    // Connect and handshake; takes ioMutex_.
    absl::Status attemptConnection();
    // Sends the queue in order. Stops at the first failure.
    absl::Status drainQueue();
    // Callers hold ioMutex_. On failure the socket is closed.
    absl::Status writeLocked(std::string_view data,
                             std::chrono::milliseconds timeout);
    void closeSocketLocked();
    // Callers hold mutex_.
    void enqueueLocked(std::string line, bool front);
    void markDisconnected(const absl::Status& reason);
    void runConnector(const std::stop_token& token);

    const ClientConfig config_;
    const uint32_t pid_;
    const std::string hostname_;

    boost::asio::io_context io_;
    std::optional<
        boost::asio::executor_work_guard<boost::asio::io_context::executor_type>>
        work_;
    std::thread ioThread_;

    // Guards the socket. Taken after mutex_ when both are needed.
    std::mutex ioMutex_;
    protocol::socket socket_;

    mutable std::mutex mutex_;
    std::condition_variable_any cv_;
    std::deque<std::string> queue_;
    size_t dropped_ = 0;
    bool draining_ = false;
    bool closed_ = false;
    ExponentialBackoff backoff_;

    std::atomic<State> state_ = State::Disconnected;

    ThreadManager threads_;
    bool connectorStarted_ = false;
};

std::string_view clientStateName(LogClient::State state);

}  // namespace LogStream
