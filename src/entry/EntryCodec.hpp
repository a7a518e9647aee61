#pragma once

#include <absl/status/statusor.h>

#include <string>
#include <string_view>

#include "LogEntry.hpp"

namespace LogStream {

// Record layout used by the file backend.
enum class OutputFormat {
    Json,
    Human,
    Syslog,
};

absl::StatusOr<OutputFormat> parseOutputFormat(std::string_view text);
std::string_view outputFormatName(OutputFormat format);

// Wire side. A line is a JSON object with "level" and "message" members,
// optionally "fields", "pid" and "hostname". Other members are ignored.
absl::StatusOr<PartialEntry> parsePartialEntry(std::string_view line);
// Single line JSON, without the terminating newline.
std::string serializePartialEntry(const PartialEntry& entry);

// Persisted side. None of these emit a trailing newline.
std::string formatJson(const LogEntry& entry);
std::string formatHuman(const LogEntry& entry);
std::string formatSyslog(const LogEntry& entry);
std::string formatEntry(const LogEntry& entry, OutputFormat format);

// Inverse of formatJson().
absl::StatusOr<LogEntry> parseJsonRecord(std::string_view line);

}  // namespace LogStream
