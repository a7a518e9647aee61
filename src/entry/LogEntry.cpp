#include "LogEntry.hpp"

#include <absl/status/status.h>
#include <absl/strings/match.h>
#include <absl/strings/numbers.h>

#include <array>
#include <boost/uuid/random_generator.hpp>
#include <boost/uuid/uuid_io.hpp>
#include <utility>

namespace LogStream {

namespace {

struct LevelNames {
    LogLevel level;
    std::string_view canonical;
    std::string_view display;
};

constexpr std::array<LevelNames, 8> kLevelNames = {{
    {LogLevel::Emergency, "Emergency", "EMERG"},
    {LogLevel::Alert, "Alert", "ALERT"},
    {LogLevel::Critical, "Critical", "CRIT"},
    {LogLevel::Error, "Error", "ERROR"},
    {LogLevel::Warning, "Warning", "WARN"},
    {LogLevel::Notice, "Notice", "NOTICE"},
    {LogLevel::Info, "Info", "INFO"},
    {LogLevel::Debug, "Debug", "DEBUG"},
}};

const LevelNames& namesOf(LogLevel level) {
    return kLevelNames[static_cast<size_t>(level)];
}

}  // namespace

std::string_view canonicalName(LogLevel level) {
    return namesOf(level).canonical;
}

std::string_view displayName(LogLevel level) { return namesOf(level).display; }

absl::StatusOr<LogLevel> logLevelFromInt(int64_t value) {
    if (value < 0 || value > kMaxLogLevel) {
        return absl::InvalidArgumentError(
            fmt::format("Log level {} out of range 0..{}", value, kMaxLogLevel));
    }
    return static_cast<LogLevel>(value);
}

absl::StatusOr<LogLevel> parseLogLevel(std::string_view text) {
    const absl::string_view absl_text(text.data(), text.size());
    int64_t numeric = 0;
    if (absl::SimpleAtoi(absl_text, &numeric)) {
        return logLevelFromInt(numeric);
    }
    for (const auto& names : kLevelNames) {
        if (absl::EqualsIgnoreCase(absl_text,
                                   absl::string_view(names.canonical.data(),
                                                     names.canonical.size())) ||
            absl::EqualsIgnoreCase(absl_text,
                                   absl::string_view(names.display.data(),
                                                     names.display.size()))) {
            return names.level;
        }
    }
    if (absl::EqualsIgnoreCase(absl_text, "err")) {
        return LogLevel::Error;
    }
    return absl::InvalidArgumentError(
        fmt::format("Unknown log level '{}'", text));
}

std::string generateEntryId() {
    thread_local boost::uuids::random_generator generator;
    return boost::uuids::to_string(generator());
}

LogEntry::LogEntry(std::string id, TimePoint timestamp, LogLevel level,
                   std::string daemon, std::string message, LogFields fields,
                   std::optional<uint32_t> pid,
                   std::optional<std::string> hostname)
    : id_(std::move(id)),
      timestamp_(timestamp),
      level_(level),
      daemon_(std::move(daemon)),
      message_(std::move(message)),
      fields_(std::move(fields)),
      pid_(pid),
      hostname_(std::move(hostname)) {}

LogEntry LogEntry::fromPartial(PartialEntry partial, std::string daemon,
                               TimePoint timestamp,
                               std::string_view fallbackHostname) {
    std::optional<std::string> hostname = std::move(partial.hostname);
    if (!hostname && !fallbackHostname.empty()) {
        hostname = std::string(fallbackHostname);
    }
    return {generateEntryId(),         timestamp,
            partial.level,             std::move(daemon),
            std::move(partial.message), std::move(partial.fields),
            partial.pid,               std::move(hostname)};
}

}  // namespace LogStream
