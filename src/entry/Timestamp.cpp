#include "Timestamp.hpp"

#include <absl/status/status.h>
#include <fmt/chrono.h>
#include <fmt/format.h>

#include <cctype>
#include <ctime>
#include <iomanip>
#include <sstream>

namespace LogStream {

namespace {

std::tm toUtcTm(TimePoint tp) {
    const auto secs = std::chrono::floor<std::chrono::seconds>(tp);
    const std::time_t t = Clock::to_time_t(secs);
    std::tm tm{};
    gmtime_r(&t, &tm);
    return tm;
}

long long subsecondMicros(TimePoint tp) {
    const auto secs = std::chrono::floor<std::chrono::seconds>(tp);
    return (tp - secs).count();
}

// Parses "<calendar part matching format><sep><digits>[Z]". Fraction digits
// beyond microseconds are truncated, missing ones are zero-filled.
absl::StatusOr<TimePoint> parseWithFraction(std::string_view text,
                                            const char* format, char sep,
                                            bool trailingZ) {
    std::string input(text);
    if (trailingZ) {
        if (input.empty() || input.back() != 'Z') {
            return absl::InvalidArgumentError(
                fmt::format("Timestamp '{}' is missing 'Z' suffix", text));
        }
        input.pop_back();
    }
    const auto sepPos = input.rfind(sep);
    if (sepPos == std::string::npos) {
        return absl::InvalidArgumentError(
            fmt::format("Timestamp '{}' has no fractional part", text));
    }
    std::string fraction = input.substr(sepPos + 1);
    input.resize(sepPos);
    if (fraction.empty()) {
        return absl::InvalidArgumentError(
            fmt::format("Timestamp '{}' has empty fraction", text));
    }
    for (const char c : fraction) {
        if (std::isdigit(static_cast<unsigned char>(c)) == 0) {
            return absl::InvalidArgumentError(
                fmt::format("Timestamp '{}' has invalid fraction", text));
        }
    }
    fraction.resize(6, '0');

    std::tm tm{};
    std::istringstream iss(input);
    iss >> std::get_time(&tm, format);
    if (iss.fail() || iss.peek() != std::char_traits<char>::eof()) {
        return absl::InvalidArgumentError(
            fmt::format("Cannot parse timestamp '{}'", text));
    }
    const std::time_t seconds = timegm(&tm);
    if (seconds == static_cast<std::time_t>(-1)) {
        return absl::InvalidArgumentError(
            fmt::format("Timestamp '{}' out of range", text));
    }
    return TimePoint(std::chrono::seconds(seconds)) +
           std::chrono::microseconds(std::stoll(fraction));
}

}  // namespace

TimePoint nowMicros() {
    return std::chrono::time_point_cast<std::chrono::microseconds>(
        Clock::now());
}

std::string formatIso8601(TimePoint tp) {
    return fmt::format("{:%Y-%m-%dT%H:%M:%S}.{:06d}Z", toUtcTm(tp),
                       subsecondMicros(tp));
}

absl::StatusOr<TimePoint> parseIso8601(std::string_view text) {
    return parseWithFraction(text, "%Y-%m-%dT%H:%M:%S", '.', true);
}

std::string formatHumanTime(TimePoint tp) {
    return fmt::format("{:%Y-%m-%d %H:%M:%S}.{:03d}", toUtcTm(tp),
                       subsecondMicros(tp) / 1000);
}

std::string formatArchiveSuffix(TimePoint tp) {
    return fmt::format("{:%Y%m%d-%H%M%S}.{:06d}", toUtcTm(tp),
                       subsecondMicros(tp));
}

absl::StatusOr<TimePoint> parseArchiveSuffix(std::string_view text) {
    return parseWithFraction(text, "%Y%m%d-%H%M%S", '.', false);
}

}  // namespace LogStream
