#include "LogClient.hpp"

#include <LogCompat.hpp>
#include <fmt/chrono.h>
#include <fmt/format.h>
#include <unistd.h>

#include <algorithm>
#include <boost/asio/buffer.hpp>
#include <boost/asio/ip/host_name.hpp>
#include <boost/asio/use_future.hpp>
#include <boost/asio/write.hpp>
#include <boost/system/system_error.hpp>
#include <future>
#include <utility>

#include "entry/EntryCodec.hpp"

namespace LogStream {

namespace {

std::string localHostname() {
    boost::system::error_code ec;
    std::string name = boost::asio::ip::host_name(ec);
    if (ec) {
        DLOG(INFO) << "Cannot determine host name: " << ec.message();
        return {};
    }
    return name;
}

}  // namespace

class LogClient::Connector : public ThreadRunner {
   public:
    explicit Connector(LogClient* client) : client_(client) {}

   protected:
    void runFunction(const std::stop_token& token) override {
        client_->runConnector(token);
    }

   private:
    LogClient* client_;
};

std::string_view clientStateName(LogClient::State state) {
    switch (state) {
        case LogClient::State::Disconnected:
            return "Disconnected";
        case LogClient::State::Connecting:
            return "Connecting";
        case LogClient::State::Handshaking:
            return "Handshaking";
        case LogClient::State::Connected:
            return "Connected";
    }
    return "Unknown";
}

LogClient::LogClient(ClientConfig config)
    : config_(std::move(config)),
      pid_(static_cast<uint32_t>(::getpid())),
      hostname_(localHostname()),
      socket_(io_),
      backoff_(config_.initialBackoff, config_.maxBackoff) {
    work_.emplace(io_.get_executor());
    ioThread_ = std::thread([this] { io_.run(); });
}

LogClient::~LogClient() { close(); }

absl::Status LogClient::connect() {
    if (auto status = config_.validate(); !status.ok()) {
        return status;
    }
    {
        const std::lock_guard<std::mutex> lock(mutex_);
        if (closed_) {
            return absl::FailedPreconditionError("Client is closed");
        }
    }

    auto status = attemptConnection();
    if (status.ok()) {
        status = drainQueue();
    } else {
        LOG(WARNING) << "Cannot connect to log server: " << status.message();
    }

    if (config_.autoReconnect) {
        const std::lock_guard<std::mutex> lock(mutex_);
        if (!connectorStarted_ && !closed_) {
            auto* connector = threads_.create<Connector>(
                ThreadManager::Usage::CLIENT_CONNECTOR, this);
            if (connector != nullptr) {
                connector->run();
                connectorStarted_ = true;
            }
        }
    }
    return status;
}

absl::Status LogClient::attemptConnection() {
    {
        const std::lock_guard<std::mutex> io(ioMutex_);
        if (state_ == State::Connected) {
            return absl::OkStatus();
        }
        const auto deadline = std::chrono::steady_clock::now() + config_.timeout;
        state_ = State::Connecting;
        closeSocketLocked();

        try {
            const protocol::endpoint endpoint(config_.socketPath);
            auto connected =
                socket_.async_connect(endpoint, boost::asio::use_future);
            if (connected.wait_until(deadline) != std::future_status::ready) {
                closeSocketLocked();
                connected.wait();
                state_ = State::Disconnected;
                return absl::DeadlineExceededError(
                    fmt::format("Connecting to {} timed out after {}",
                                config_.socketPath, config_.timeout));
            }
            connected.get();
        } catch (const boost::system::system_error& e) {
            closeSocketLocked();
            state_ = State::Disconnected;
            return absl::UnavailableError(
                fmt::format("Cannot connect to {}: {}", config_.socketPath,
                            e.code().message()));
        }

        state_ = State::Handshaking;
        const auto remaining =
            std::chrono::duration_cast<std::chrono::milliseconds>(
                deadline - std::chrono::steady_clock::now());
        if (auto status = writeLocked(config_.daemonName + "\n",
                                      std::max(remaining,
                                               std::chrono::milliseconds(1)));
            !status.ok()) {
            state_ = State::Disconnected;
            return status;
        }
        state_ = State::Connected;
    }

    {
        const std::lock_guard<std::mutex> lock(mutex_);
        backoff_.reset();
        cv_.notify_all();
    }
    LOG(INFO) << fmt::format("Connected to {} as '{}'", config_.socketPath,
                             config_.daemonName);
    return absl::OkStatus();
}

absl::Status LogClient::writeLocked(std::string_view data,
                                    std::chrono::milliseconds timeout) {
    auto written = boost::asio::async_write(
        socket_, boost::asio::buffer(data.data(), data.size()),
        boost::asio::use_future);
    if (written.wait_for(timeout) != std::future_status::ready) {
        closeSocketLocked();
        // The buffer must outlive the cancelled operation.
        written.wait();
        return absl::DeadlineExceededError(
            fmt::format("Write timed out after {}", timeout));
    }
    try {
        written.get();
    } catch (const boost::system::system_error& e) {
        closeSocketLocked();
        return absl::UnavailableError(
            fmt::format("Write failed: {}", e.code().message()));
    }
    return absl::OkStatus();
}

void LogClient::closeSocketLocked() {
    if (!socket_.is_open()) {
        return;
    }
    boost::system::error_code ec;
    socket_.shutdown(protocol::socket::shutdown_both, ec);  // NOLINT
    socket_.close(ec);                                      // NOLINT
    if (ec) {
        DLOG(INFO) << "Close: " << ec.message();
    }
}

absl::Status LogClient::log(LogLevel level, std::string message,
                            LogFields fields) {
    if (!isAtLeast(level, config_.minLevel)) {
        return absl::OkStatus();
    }
    PartialEntry partial;
    partial.level = level;
    partial.message = std::move(message);
    partial.fields = std::move(fields);
    partial.pid = pid_;
    if (!hostname_.empty()) {
        partial.hostname = hostname_;
    }
    std::string line = serializePartialEntry(partial);
    line.push_back('\n');

    std::unique_lock<std::mutex> lock(mutex_);
    if (closed_) {
        return absl::FailedPreconditionError("Client is closed");
    }
    if (state_ == State::Connected && queue_.empty() && !draining_) {
        absl::Status status;
        {
            const std::lock_guard<std::mutex> io(ioMutex_);
            status = writeLocked(line, config_.timeout);
        }
        if (status.ok()) {
            return status;
        }
        markDisconnected(status);
        enqueueLocked(std::move(line), true);
        return absl::OkStatus();
    }
    enqueueLocked(std::move(line), false);
    return absl::OkStatus();
}

void LogClient::enqueueLocked(std::string line, bool front) {
    if (queue_.size() >= config_.queueCapacity) {
        ++dropped_;
        DLOG(INFO) << fmt::format("Queue full ({}), dropping oldest entry",
                                  queue_.size());
        if (front) {
            // |line| is older than everything queued.
            return;
        }
        queue_.pop_front();
    }
    if (front) {
        queue_.push_front(std::move(line));
    } else {
        queue_.push_back(std::move(line));
    }
    cv_.notify_all();
}

void LogClient::markDisconnected(const absl::Status& reason) {
    if (state_.exchange(State::Disconnected) != State::Disconnected) {
        LOG(WARNING) << "Disconnected from log server: " << reason.message();
    }
    cv_.notify_all();
}

absl::Status LogClient::drainQueue() {
    std::unique_lock<std::mutex> lock(mutex_);
    if (draining_) {
        return absl::OkStatus();
    }
    draining_ = true;
    size_t sent = 0;
    while (!queue_.empty() && !closed_ && state_ == State::Connected) {
        std::string line = std::move(queue_.front());
        queue_.pop_front();
        lock.unlock();
        absl::Status status;
        {
            const std::lock_guard<std::mutex> io(ioMutex_);
            status = writeLocked(line, config_.timeout);
        }
        lock.lock();
        if (!status.ok()) {
            draining_ = false;
            enqueueLocked(std::move(line), true);
            markDisconnected(status);
            return status;
        }
        ++sent;
    }
    draining_ = false;
    cv_.notify_all();
    if (sent != 0) {
        DLOG(INFO) << fmt::format("Sent {} queued entries", sent);
    }
    return absl::OkStatus();
}

void LogClient::runConnector(const std::stop_token& token) {
    while (!token.stop_requested()) {
        {
            std::unique_lock<std::mutex> lock(mutex_);
            const bool wake = cv_.wait(lock, token, [this] {
                return closed_ || state_ != State::Connected ||
                       (!queue_.empty() && !draining_);
            });
            if (!wake || closed_) {
                return;
            }
        }

        if (state_ != State::Connected) {
            auto status = attemptConnection();
            if (!status.ok()) {
                std::unique_lock<std::mutex> lock(mutex_);
                const auto delay = backoff_.nextDelay();
                LOG(WARNING) << fmt::format(
                    "Connection attempt {} failed: {}. Retrying in {}",
                    backoff_.attempt(), std::string(status.message()), delay);
                cv_.wait_for(lock, token, delay, [this] { return closed_; });
                continue;
            }
        }
        if (auto status = drainQueue(); !status.ok()) {
            DLOG(INFO) << "Queue drain interrupted: " << status.message();
        }
    }
}

absl::Status LogClient::flush(std::chrono::milliseconds timeout) {
    bool hasConnector = false;
    {
        const std::lock_guard<std::mutex> lock(mutex_);
        if (closed_) {
            return absl::FailedPreconditionError("Client is closed");
        }
        if (queue_.empty() && !draining_) {
            return absl::OkStatus();
        }
        hasConnector = connectorStarted_;
    }
    if (!hasConnector) {
        if (state_ != State::Connected) {
            return absl::UnavailableError(
                fmt::format("Not connected, {} entries queued", queued()));
        }
        if (auto status = drainQueue(); !status.ok()) {
            return status;
        }
    }

    std::unique_lock<std::mutex> lock(mutex_);
    if (!cv_.wait_for(lock, timeout, [this] {
            return closed_ || (queue_.empty() && !draining_);
        })) {
        return absl::DeadlineExceededError(fmt::format(
            "{} entries still queued after {}", queue_.size(), timeout));
    }
    if (closed_) {
        return absl::CancelledError("Client was closed while flushing");
    }
    return absl::OkStatus();
}

void LogClient::close() {
    {
        const std::lock_guard<std::mutex> lock(mutex_);
        if (closed_) {
            return;
        }
        closed_ = true;
        if (!queue_.empty()) {
            LOG(WARNING) << fmt::format(
                "Closing with {} unsent entries discarded", queue_.size());
            queue_.clear();
        }
        cv_.notify_all();
    }
    // The runner may be in the middle of a bounded connection attempt.
    threads_.destroy(config_.timeout + std::chrono::seconds(1));
    {
        const std::lock_guard<std::mutex> io(ioMutex_);
        closeSocketLocked();
    }
    state_ = State::Disconnected;
    work_.reset();
    io_.stop();
    if (ioThread_.joinable()) {
        ioThread_.join();
    }
}

size_t LogClient::dropped() const {
    const std::lock_guard<std::mutex> lock(mutex_);
    return dropped_;
}

size_t LogClient::queued() const {
    const std::lock_guard<std::mutex> lock(mutex_);
    return queue_.size();
}

#define LOGSTREAM_LEVEL_METHOD(name, level)                              \
    absl::Status LogClient::name(std::string message, LogFields fields) { \
        return log(LogLevel::level, std::move(message), std::move(fields)); \
    }

LOGSTREAM_LEVEL_METHOD(emergency, Emergency)
LOGSTREAM_LEVEL_METHOD(alert, Alert)
LOGSTREAM_LEVEL_METHOD(critical, Critical)
LOGSTREAM_LEVEL_METHOD(error, Error)
LOGSTREAM_LEVEL_METHOD(warning, Warning)
LOGSTREAM_LEVEL_METHOD(notice, Notice)
LOGSTREAM_LEVEL_METHOD(info, Info)
LOGSTREAM_LEVEL_METHOD(debug, Debug)

#undef LOGSTREAM_LEVEL_METHOD

}  // namespace LogStream
