#include "Session.hpp"

#include <LogCompat.hpp>
#include <fmt/format.h>

#include <algorithm>
#include <boost/asio/buffer.hpp>
#include <boost/asio/error.hpp>
#include <boost/asio/post.hpp>
#include <utility>

#include "entry/EntryCodec.hpp"
#include "entry/LogEntry.hpp"
#include "router/MessageRouter.hpp"

namespace LogStream {

Session::Session(uint64_t id, protocol::socket socket, Context context,
                 ConnectionSlot slot)
    : id_(id),
      socket_(std::move(socket)),
      executor_(socket_.get_executor()),
      context_(std::move(context)),
      slot_(std::move(slot)),
      readBuffer_(context_.bufferSize),
      framer_(context_.bufferSize,
              context_.bufferSize * kMaxLineMultiplier) {}

Session::~Session() {
    DLOG(INFO) << fmt::format("Session {} destroyed", id_);
}

void Session::start() {
    boost::asio::post(executor_,
                      [self = shared_from_this()] { self->doRead(); });
}

void Session::shutdown() {
    boost::asio::post(executor_, [self = shared_from_this()] {
        self->stopping_ = true;
        if (self->pendingRoutes_ == 0) {
            self->close("server shutdown");
        }
    });
}

void Session::doRead() {
    if (closed_) {
        return;
    }
    socket_.async_read_some(
        boost::asio::buffer(readBuffer_),
        [self = shared_from_this()](const boost::system::error_code& ec,
                                    size_t bytes) { self->onRead(ec, bytes); });
}

void Session::onRead(const boost::system::error_code& ec, size_t bytes) {
    if (ec) {
        if (ec == boost::asio::error::eof) {
            if (framer_.pending() != 0) {
                DLOG(INFO) << fmt::format(
                    "Session {}: discarding {} bytes of unterminated input",
                    id_, framer_.pending());
            }
            close("end of stream");
        } else if (ec == boost::asio::error::operation_aborted) {
            close("cancelled");
        } else {
            close(ec.message());
        }
        return;
    }

    if (auto status = framer_.feed({readBuffer_.data(), bytes});
        !status.ok()) {
        ++context_.counters->protocolViolations;
        LOG(WARNING) << fmt::format("Session {} ({}): protocol violation: {}",
                                    id_, daemon_, std::string(status.message()));
        // Complete lines before the oversized one are still delivered.
        stopping_ = true;
    }
    processLines();
}

void Session::processLines() {
    while (!closed_) {
        auto line = framer_.nextLine();
        if (!line) {
            break;
        }
        if (!handshakeDone_) {
            if (!handleHandshake(*line)) {
                return;
            }
            continue;
        }
        if (line->empty()) {
            continue;
        }
        handleEntryLine(*line);
    }
    if (closed_ || pendingRoutes_ != 0) {
        return;
    }
    if (stopping_) {
        close("server shutdown");
        return;
    }
    doRead();
}

bool Session::handleHandshake(const std::string& line) {
    if (line.empty()) {
        ++context_.counters->protocolViolations;
        LOG(WARNING) << fmt::format("Session {}: empty handshake", id_);
        close("protocol violation");
        return false;
    }
    daemon_ = line;
    handshakeDone_ = true;
    LOG(INFO) << fmt::format("Session {}: daemon '{}' connected", id_,
                             daemon_);
    return true;
}

void Session::handleEntryLine(const std::string& line) {
    auto partial = parsePartialEntry(line);
    if (!partial.ok()) {
        ++malformed_;
        ++context_.counters->malformedLines;
        LOG(WARNING) << fmt::format(
            "Session {} ({}): malformed entry discarded: {}", id_, daemon_,
            std::string(partial.status().message()));
        return;
    }

    lastTimestamp_ = std::max(nowMicros(), lastTimestamp_);
    const LogEntry entry = LogEntry::fromPartial(
        std::move(*partial), daemon_, lastTimestamp_, context_.hostname);
    ++entries_;
    ++context_.counters->entriesReceived;

    ++pendingRoutes_;
    context_.router->route(
        entry, [self = shared_from_this()](absl::Status status) {
            boost::asio::post(self->executor_,
                              [self, status = std::move(status)] {
                                  self->onRouted(status);
                              });
        });
}

void Session::onRouted(const absl::Status& status) {
    if (!status.ok()) {
        ++context_.counters->fileFailures;
    }
    if (--pendingRoutes_ == 0) {
        processLines();
    }
}

void Session::close(std::string_view reason) {
    if (closed_) {
        return;
    }
    closed_ = true;

    boost::system::error_code ec;
    socket_.shutdown(protocol::socket::shutdown_both, ec);  // NOLINT
    socket_.close(ec);                                      // NOLINT
    if (ec) {
        LOG(WARNING) << "Cannot close socket: " << ec.message();
    }
    LOG(INFO) << fmt::format(
        "Session {} ({}) closed: {} ({} entries, {} malformed)", id_,
        daemon_.empty() ? "<no handshake>" : daemon_, reason, entries_,
        malformed_);
    if (context_.onClosed) {
        context_.onClosed(id_);
    }
}

}  // namespace LogStream
