#pragma once

#include <absl/status/statusor.h>

#include <chrono>
#include <string>
#include <string_view>

namespace LogStream {

using Clock = std::chrono::system_clock;
// All entry timestamps carry microsecond precision.
using TimePoint = std::chrono::time_point<Clock, std::chrono::microseconds>;

// Current UTC time truncated to microseconds.
TimePoint nowMicros();

// "2026-10-17T08:30:00.123456Z"
std::string formatIso8601(TimePoint tp);
absl::StatusOr<TimePoint> parseIso8601(std::string_view text);

// "2026-10-17 08:30:00.123" (millisecond precision, used by human format)
std::string formatHumanTime(TimePoint tp);

// "20261017-083000.123456", used as rotated file suffix
std::string formatArchiveSuffix(TimePoint tp);
absl::StatusOr<TimePoint> parseArchiveSuffix(std::string_view text);

}  // namespace LogStream
