#include "LogServer.hpp"

#include <LogCompat.hpp>
#include <fmt/chrono.h>
#include <fmt/format.h>

#include <algorithm>
#include <boost/asio/ip/host_name.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/strand.hpp>
#include <chrono>
#include <utility>

#include "backends/SyslogBackend.hpp"

namespace LogStream {

namespace {

constexpr std::chrono::milliseconds kDrainPollInterval(10);

std::string localHostname() {
    boost::system::error_code ec;
    std::string name = boost::asio::ip::host_name(ec);
    if (ec) {
        LOG(WARNING) << "Cannot determine host name: " << ec.message();
        return {};
    }
    return name;
}

}  // namespace

LogServer::LogServer(ServerConfig config) : config_(std::move(config)) {}

LogServer::~LogServer() { stop(); }

MessageRouter::Stats LogServer::routerStats() const {
    if (!router_) {
        return {0, 0, 0};
    }
    return router_->stats();
}

absl::Status LogServer::buildBackends(std::vector<Backend>* backends) {
    if (config_.journald.enabled) {
        backends->emplace_back(std::in_place_type<JournaldBackend>,
                               config_.journald.syslogIdentifier,
                               config_.journald.socketPath);
    }
    if (config_.syslog.enabled) {
        auto facility = parseSyslogFacility(config_.syslog.facility);
        if (!facility.ok()) {
            return facility.status();
        }
        backends->emplace_back(std::in_place_type<SyslogBackend>, "logstream",
                               *facility);
    }
    if (config_.file.enabled) {
        Compressor* compressor = nullptr;
        if (config_.file.compression) {
            compressor = threads_.create<Compressor>(
                ThreadManager::Usage::COMPRESSOR, config_.file.algorithm);
            compressor->run();
        }
        engine_ = threads_.create<RotationEngine>(
            ThreadManager::Usage::ROTATION_ENGINE, config_.rotationOptions(),
            compressor);
        if (auto status = engine_->open(); !status.ok()) {
            return status;
        }
        engine_->run();
        backends->emplace_back(std::in_place_type<FileBackend>, engine_);
    }
    return absl::OkStatus();
}

absl::Status LogServer::start() {
    const std::lock_guard<std::mutex> lock(lifecycleMutex_);
    if (started_ || stopped_) {
        return absl::FailedPreconditionError("Server was already started");
    }
    if (auto status = config_.validate(); !status.ok()) {
        return status;
    }

    std::vector<Backend> backends;
    if (auto status = buildBackends(&backends); !status.ok()) {
        threads_.destroy();
        engine_ = nullptr;
        return status;
    }
    router_ = std::make_unique<MessageRouter>(std::move(backends));

    AcceptorOptions acceptorOptions{config_.server.socketPath,
                                    config_.server.maxConnections,
                                    config_.server.bufferSize,
                                    localHostname()};
    acceptor_ = std::make_unique<Acceptor>(io_, std::move(acceptorOptions),
                                           *router_, counters_);
    if (auto status = acceptor_->start(); !status.ok()) {
        threads_.destroy();
        engine_ = nullptr;
        return status;
    }

    if (config_.metrics.enabled) {
        LOG(WARNING) << fmt::format(
            "Metrics export is not available, port {} is ignored",
            config_.metrics.port);
    }

    work_.emplace(io_.get_executor());
    if (engine_ != nullptr && config_.rotation.enabled) {
        retentionTimer_ = std::make_unique<boost::asio::steady_timer>(
            boost::asio::make_strand(io_));
        scheduleRetention();
    }
    const unsigned threadCount = config_.effectiveIoThreads();
    for (unsigned i = 0; i < threadCount; ++i) {
        ioThreads_.emplace_back([this] { io_.run(); });
    }
    started_ = true;
    LOG(INFO) << fmt::format("LogStream server started with {} I/O thread(s)",
                             threadCount);
    return absl::OkStatus();
}

void LogServer::scheduleRetention() {
    retentionTimer_->expires_after(config_.rotation.retentionInterval);
    retentionTimer_->async_wait([this](const boost::system::error_code& ec) {
        if (ec || retentionStopped_) {
            return;
        }
        engine_->requestRetention(nowMicros());
        scheduleRetention();
    });
}

void LogServer::stop() {
    const std::lock_guard<std::mutex> lock(lifecycleMutex_);
    if (!started_ || stopped_) {
        return;
    }
    stopped_ = true;

    const auto deadline =
        std::chrono::steady_clock::now() + config_.server.shutdownGrace;
    LOG(INFO) << fmt::format("Shutting down (grace period {})",
                             config_.server.shutdownGrace);

    acceptor_->stop();
    if (retentionTimer_) {
        boost::asio::post(retentionTimer_->get_executor(), [this] {
            retentionStopped_ = true;
            retentionTimer_->cancel();
        });
    }

    while (acceptor_->liveConnections() != 0 &&
           std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(kDrainPollInterval);
    }
    if (const size_t live = acceptor_->liveConnections(); live != 0) {
        LOG(WARNING) << fmt::format(
            "{} session(s) still open after the grace period, closing", live);
    }

    work_.reset();
    io_.stop();
    for (auto& thread : ioThreads_) {
        thread.join();
    }
    ioThreads_.clear();

    const auto remaining = std::max(
        std::chrono::milliseconds(0),
        std::chrono::duration_cast<std::chrono::milliseconds>(
            deadline - std::chrono::steady_clock::now()));
    threads_.destroy(remaining);
    acceptor_->removeSocketFile();

    const auto stats = routerStats();
    LOG(INFO) << fmt::format(
        "Server stopped: {} connection(s) accepted, {} rejected, {} entries "
        "routed, {} malformed, {} protocol violation(s), {} file failure(s), "
        "{} auxiliary failure(s)",
        counters_.accepted.load(), counters_.rejected.load(), stats.routed,
        counters_.malformedLines.load(), counters_.protocolViolations.load(),
        stats.fileFailures, stats.auxFailures);
}

}  // namespace LogStream
