#pragma once

#include <absl/status/status.h>

#include <boost/asio/io_context.hpp>
#include <boost/asio/local/stream_protocol.hpp>
#include <boost/asio/strand.hpp>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <future>
#include <memory>
#include <string>
#include <unordered_map>

#include "ServerCounters.hpp"
#include "Session.hpp"

namespace LogStream {

class MessageRouter;

struct AcceptorOptions {
    std::filesystem::path socketPath;
    size_t maxConnections = 1000;
    size_t bufferSize = 8192;
    std::string hostname;
};

/**
 * Listens on the local socket and spawns one Session per connection.
 *
 * Connections beyond maxConnections are closed right after accept. The
 * session registry is only touched on the acceptor's strand.
 */
class Acceptor {
   public:
    using protocol = boost::asio::local::stream_protocol;

    Acceptor(boost::asio::io_context& io, AcceptorOptions options,
             MessageRouter& router, ServerCounters& counters);

    // Removes a stale socket file, binds, listens and starts accepting.
    absl::Status start();

    // Stops accepting and asks every session to shut down.
    void stop();

    // Unlinks the socket file.
    void removeSocketFile() const;

    [[nodiscard]] size_t liveConnections() const {
        return counters_.liveConnections.load();
    }
    // Number of registered sessions, read on the strand.
    std::future<size_t> liveSessions();

   private:
    void doAccept();
    void onAccept(const boost::system::error_code& ec, protocol::socket socket);

    boost::asio::io_context& io_;
    boost::asio::strand<boost::asio::io_context::executor_type> strand_;
    protocol::acceptor acceptor_;
    const AcceptorOptions options_;
    MessageRouter& router_;
    ServerCounters& counters_;

    // Strand-owned
    std::unordered_map<uint64_t, std::weak_ptr<Session>> sessions_;
    uint64_t nextSessionId_ = 0;
    bool stopping_ = false;
};

}  // namespace LogStream
