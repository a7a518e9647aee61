#pragma once

#include <absl/status/statusor.h>
#include <fmt/format.h>

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <string_view>

#include "Timestamp.hpp"

namespace LogStream {

// Syslog-compatible severity. Lower value means more severe.
enum class LogLevel : int {
    Emergency = 0,
    Alert = 1,
    Critical = 2,
    Error = 3,
    Warning = 4,
    Notice = 5,
    Info = 6,
    Debug = 7,
};

inline constexpr int kMaxLogLevel = static_cast<int>(LogLevel::Debug);

// "Emergency", "Info", ...
std::string_view canonicalName(LogLevel level);
// "EMERG", "INFO", ...
std::string_view displayName(LogLevel level);

// Accepts a canonical or display name (case-insensitive) or "0".."7".
absl::StatusOr<LogLevel> parseLogLevel(std::string_view text);
absl::StatusOr<LogLevel> logLevelFromInt(int64_t value);

// True if |level| is at least as severe as |threshold|.
constexpr bool isAtLeast(LogLevel level, LogLevel threshold) {
    return static_cast<int>(level) <= static_cast<int>(threshold);
}

using LogFields = std::map<std::string, std::string>;

// Client-supplied part of an entry, as received on the wire.
struct PartialEntry {
    LogLevel level = LogLevel::Info;
    std::string message;
    LogFields fields;
    std::optional<uint32_t> pid;
    std::optional<std::string> hostname;
};

class LogEntry {
   public:
    // Builds an entry with a fresh random id. The timestamp, daemon and
    // hostname fallback are supplied by the server.
    static LogEntry fromPartial(PartialEntry partial, std::string daemon,
                                TimePoint timestamp,
                                std::string_view fallbackHostname);

    // Rebuilds an entry from persisted values (all fields given).
    LogEntry(std::string id, TimePoint timestamp, LogLevel level,
             std::string daemon, std::string message, LogFields fields,
             std::optional<uint32_t> pid, std::optional<std::string> hostname);

    [[nodiscard]] const std::string& id() const { return id_; }
    [[nodiscard]] TimePoint timestamp() const { return timestamp_; }
    [[nodiscard]] LogLevel level() const { return level_; }
    [[nodiscard]] const std::string& daemon() const { return daemon_; }
    [[nodiscard]] const std::string& message() const { return message_; }
    [[nodiscard]] const LogFields& fields() const { return fields_; }
    [[nodiscard]] std::optional<uint32_t> pid() const { return pid_; }
    [[nodiscard]] const std::optional<std::string>& hostname() const {
        return hostname_;
    }

    bool operator==(const LogEntry& other) const = default;

   private:
    std::string id_;
    TimePoint timestamp_;
    LogLevel level_;
    std::string daemon_;
    std::string message_;
    LogFields fields_;
    std::optional<uint32_t> pid_;
    std::optional<std::string> hostname_;
};

// Random 128-bit identifier in UUID text form.
std::string generateEntryId();

}  // namespace LogStream

template <>
struct fmt::formatter<LogStream::LogLevel> : formatter<std::string_view> {
    auto format(LogStream::LogLevel level,
                format_context& ctx) const -> format_context::iterator {
        return formatter<std::string_view>::format(
            LogStream::canonicalName(level), ctx);
    }
};
