#pragma once

#include <absl/status/status.h>

#include <memory>
#include <string>
#include <string_view>

#include "entry/LogEntry.hpp"

namespace LogStream {

// Encodes |entry| in the native journal protocol: one KEY=VALUE per line,
// values containing newlines use the length-prefixed binary form.
std::string encodeJournalEntry(const LogEntry& entry,
                               std::string_view syslogIdentifier);

// Best-effort backend sending entries to systemd-journald as datagrams.
class JournaldBackend {
   public:
    static constexpr bool kDurable = false;
    static constexpr std::string_view kDefaultSocketPath =
        "/run/systemd/journal/socket";

    explicit JournaldBackend(
        std::string syslogIdentifier,
        std::string socketPath = std::string(kDefaultSocketPath));
    ~JournaldBackend();
    JournaldBackend(JournaldBackend&&) noexcept;
    JournaldBackend& operator=(JournaldBackend&&) noexcept;

    absl::Status write(const LogEntry& entry);

    [[nodiscard]] std::string_view name() const { return "journald"; }

   private:
    struct Connection;
    std::string syslogIdentifier_;
    std::unique_ptr<Connection> connection_;
};

}  // namespace LogStream
