#pragma once

#include <absl/status/status.h>

#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/local/stream_protocol.hpp>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

#include "LineFramer.hpp"
#include "ServerCounters.hpp"
#include "entry/Timestamp.hpp"

namespace LogStream {

class MessageRouter;

// Longest accepted line, as a multiple of the configured buffer size.
inline constexpr size_t kMaxLineMultiplier = 16;

/**
 * One client connection.
 *
 * The first line is the daemon name, every further non-empty line a JSON
 * entry. All handlers run on the socket's strand. Lines of one read are
 * routed in order, and the next read is issued only after the router
 * completed all of them.
 */
class Session : public std::enable_shared_from_this<Session> {
   public:
    using protocol = boost::asio::local::stream_protocol;

    struct Context {
        MessageRouter* router;
        ServerCounters* counters;
        size_t bufferSize;
        std::string hostname;
        // Called on the session strand once the connection is closed.
        std::function<void(uint64_t)> onClosed;
    };

    // |socket| must have been accepted onto its own strand.
    Session(uint64_t id, protocol::socket socket, Context context,
            ConnectionSlot slot);
    ~Session();

    void start();
    // Finish routed work, then close. Callable from any thread.
    void shutdown();

    [[nodiscard]] uint64_t id() const { return id_; }

   private:
    void doRead();
    void onRead(const boost::system::error_code& ec, size_t bytes);
    void processLines();
    bool handleHandshake(const std::string& line);
    void handleEntryLine(const std::string& line);
    void onRouted(const absl::Status& status);
    void close(std::string_view reason);

    const uint64_t id_;
    protocol::socket socket_;
    const boost::asio::any_io_executor executor_;
    Context context_;
    ConnectionSlot slot_;

    std::vector<char> readBuffer_;
    LineFramer framer_;
    std::string daemon_;
    bool handshakeDone_ = false;
    size_t pendingRoutes_ = 0;
    bool stopping_ = false;
    bool closed_ = false;
    TimePoint lastTimestamp_{};

    uint64_t entries_ = 0;
    uint64_t malformed_ = 0;
};

}  // namespace LogStream
