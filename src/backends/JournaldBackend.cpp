#include "JournaldBackend.hpp"

#include <LogCompat.hpp>
#include <absl/strings/ascii.h>
#include <fmt/format.h>

#include <boost/asio/buffer.hpp>
#include <boost/asio/error.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/local/datagram_protocol.hpp>
#include <boost/system/error_code.hpp>
#include <cstdint>
#include <iterator>
#include <mutex>
#include <utility>

namespace LogStream {

namespace {

void appendField(std::string& out, std::string_view key,
                 std::string_view value) {
    if (value.find('\n') == std::string_view::npos) {
        fmt::format_to(std::back_inserter(out), "{}={}\n", key, value);
        return;
    }
    out.append(key);
    out.push_back('\n');
    uint64_t length = value.size();
    for (int i = 0; i < 8; ++i) {
        out.push_back(static_cast<char>(length & 0xFF));
        length >>= 8;
    }
    out.append(value);
    out.push_back('\n');
}

// Journal field names: uppercase letters, digits and underscores, not
// starting with an underscore or digit.
std::string journalFieldName(std::string_view key) {
    std::string name;
    name.reserve(key.size() + 1);
    for (const char c : key) {
        name.push_back(absl::ascii_isalnum(static_cast<unsigned char>(c))
                           ? absl::ascii_toupper(static_cast<unsigned char>(c))
                           : '_');
    }
    if (name.empty() ||
        !absl::ascii_isalpha(static_cast<unsigned char>(name.front()))) {
        name.insert(name.begin(), 'F');
    }
    return name;
}

}  // namespace

std::string encodeJournalEntry(const LogEntry& entry,
                               std::string_view syslogIdentifier) {
    std::string out;
    appendField(out, "MESSAGE", entry.message());
    appendField(out, "PRIORITY",
                std::to_string(static_cast<int>(entry.level())));
    appendField(out, "SYSLOG_IDENTIFIER", syslogIdentifier);
    appendField(out, "LOGSTREAM_DAEMON", entry.daemon());
    appendField(out, "LOGSTREAM_ID", entry.id());
    appendField(out, "LOGSTREAM_TIMESTAMP", formatIso8601(entry.timestamp()));
    if (entry.pid()) {
        appendField(out, "SYSLOG_PID", std::to_string(*entry.pid()));
    }
    if (entry.hostname()) {
        appendField(out, "LOGSTREAM_HOSTNAME", *entry.hostname());
    }
    for (const auto& [key, value] : entry.fields()) {
        appendField(out, journalFieldName(key), value);
    }
    return out;
}

struct JournaldBackend::Connection {
    using protocol = boost::asio::local::datagram_protocol;

    explicit Connection(std::string path) : socket(io), endpoint(path) {
        boost::system::error_code ec;
        socket.open(protocol(), ec);
        if (!ec) {
            // Sent from the session threads; a stalled journald must not
            // hold them up.
            socket.non_blocking(true, ec);  // NOLINT
        }
        if (ec) {
            LOG(WARNING) << "Cannot open journald socket: " << ec.message();
            boost::system::error_code ignored;
            socket.close(ignored);  // NOLINT
        }
    }

    boost::asio::io_context io;
    protocol::socket socket;
    protocol::endpoint endpoint;
    std::mutex mutex;
};

JournaldBackend::JournaldBackend(std::string syslogIdentifier,
                                 std::string socketPath)
    : syslogIdentifier_(std::move(syslogIdentifier)),
      connection_(std::make_unique<Connection>(std::move(socketPath))) {}

JournaldBackend::~JournaldBackend() = default;
JournaldBackend::JournaldBackend(JournaldBackend&&) noexcept = default;
JournaldBackend& JournaldBackend::operator=(JournaldBackend&&) noexcept =
    default;

absl::Status JournaldBackend::write(const LogEntry& entry) {
    const std::string payload = encodeJournalEntry(entry, syslogIdentifier_);

    std::lock_guard<std::mutex> lock(connection_->mutex);
    if (!connection_->socket.is_open()) {
        return absl::UnavailableError("journald socket is not open");
    }
    boost::system::error_code ec;
    connection_->socket.send_to(boost::asio::buffer(payload),
                                connection_->endpoint, 0, ec);
    if (ec == boost::asio::error::would_block) {
        return absl::UnavailableError(fmt::format(
            "journald ({}) is not keeping up, entry dropped",
            connection_->endpoint.path()));
    }
    if (ec) {
        return absl::UnavailableError(
            fmt::format("Sending to journald ({}): {}",
                        connection_->endpoint.path(), ec.message()));
    }
    return absl::OkStatus();
}

}  // namespace LogStream
