#include "Acceptor.hpp"

#include <LogCompat.hpp>
#include <fmt/format.h>

#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/error.hpp>
#include <boost/asio/post.hpp>
#include <boost/system/system_error.hpp>
#include <system_error>
#include <utility>

namespace LogStream {

Acceptor::Acceptor(boost::asio::io_context& io, AcceptorOptions options,
                   MessageRouter& router, ServerCounters& counters)
    : io_(io),
      strand_(boost::asio::make_strand(io)),
      acceptor_(strand_),
      options_(std::move(options)),
      router_(router),
      counters_(counters) {}

absl::Status Acceptor::start() {
    LOG(INFO) << "Acceptor: Path=" << options_.socketPath;
    std::error_code ec;
    if (std::filesystem::remove(options_.socketPath, ec)) {
        LOG(INFO) << "Removed stale file.";
    } else if (ec && ec != std::make_error_code(
                               std::errc::no_such_file_or_directory)) {
        return absl::UnavailableError(fmt::format(
            "Cannot remove stale file {}: {}", options_.socketPath.string(),
            ec.message()));
    }

    boost::system::error_code bec;
    const protocol::endpoint endpoint(options_.socketPath.string());
    acceptor_.open(endpoint.protocol(), bec);  // NOLINT
    if (!bec) {
        acceptor_.bind(endpoint, bec);  // NOLINT
    }
    if (!bec) {
        acceptor_.listen(protocol::acceptor::max_listen_connections,
                         bec);  // NOLINT
    }
    if (bec) {
        boost::system::error_code ignored;
        acceptor_.close(ignored);  // NOLINT
        return absl::UnavailableError(
            fmt::format("Cannot bind to endpoint {}: {}",
                        options_.socketPath.string(), bec.message()));
    }
    LOG(INFO) << fmt::format("Listening on {} (max {} connections)",
                             options_.socketPath.string(),
                             options_.maxConnections);
    boost::asio::post(strand_, [this] { doAccept(); });
    return absl::OkStatus();
}

void Acceptor::doAccept() {
    if (stopping_) {
        return;
    }
    // Each accepted socket gets its own strand.
    acceptor_.async_accept(
        boost::asio::any_io_executor(boost::asio::make_strand(io_)),
        [this](const boost::system::error_code& ec, protocol::socket socket) {
            onAccept(ec, std::move(socket));
        });
}

void Acceptor::onAccept(const boost::system::error_code& ec,
                        protocol::socket socket) {
    if (ec) {
        if (ec == boost::asio::error::operation_aborted || stopping_) {
            return;
        }
        LOG(ERROR) << "Accept error: " << ec.message();
        doAccept();
        return;
    }

    if (stopping_) {
        // Accepted just before the acceptor was closed.
        boost::system::error_code ignored;
        socket.close(ignored);  // NOLINT
        return;
    }

    if (counters_.liveConnections.fetch_add(1) >= options_.maxConnections) {
        counters_.liveConnections.fetch_sub(1);
        ++counters_.rejected;
        LOG(WARNING) << fmt::format(
            "Rejecting connection: {} connections already live",
            options_.maxConnections);
        boost::system::error_code ignored;
        socket.close(ignored);  // NOLINT
        doAccept();
        return;
    }
    ConnectionSlot slot(&counters_.liveConnections);
    ++counters_.accepted;

    const uint64_t id = ++nextSessionId_;
    Session::Context context{
        &router_, &counters_, options_.bufferSize, options_.hostname,
        [this](uint64_t closedId) {
            boost::asio::post(strand_,
                              [this, closedId] { sessions_.erase(closedId); });
        }};
    auto session = std::make_shared<Session>(id, std::move(socket),
                                             std::move(context),
                                             std::move(slot));
    sessions_.emplace(id, session);
    DLOG(INFO) << fmt::format("Accepted session {} ({} live)", id,
                              counters_.liveConnections.load());
    session->start();
    doAccept();
}

void Acceptor::stop() {
    boost::asio::post(strand_, [this] {
        if (stopping_) {
            return;
        }
        stopping_ = true;
        boost::system::error_code ec;
        acceptor_.close(ec);  // NOLINT
        if (ec) {
            LOG(WARNING) << "Cannot close acceptor: " << ec.message();
        }
        LOG(INFO) << fmt::format("Stopping {} session(s)", sessions_.size());
        for (const auto& [id, weak] : sessions_) {
            if (auto session = weak.lock()) {
                session->shutdown();
            }
        }
    });
}

void Acceptor::removeSocketFile() const {
    std::error_code ec;
    std::filesystem::remove(options_.socketPath, ec);
    if (ec) {
        LOG(WARNING) << "Cannot remove " << options_.socketPath << ": "
                     << ec.message();
    }
}

std::future<size_t> Acceptor::liveSessions() {
    auto promise = std::make_shared<std::promise<size_t>>();
    auto future = promise->get_future();
    boost::asio::post(strand_,
                      [this, promise] { promise->set_value(sessions_.size()); });
    return future;
}

}  // namespace LogStream
