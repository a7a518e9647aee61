#pragma once

/**
 * Stream-style logging macros on top of spdlog.
 *
 * LOG(INFO) << "text" << value;   // emitted at the given severity
 * DLOG(INFO) << ...;              // emitted at debug level (--verbose)
 * PLOG(ERROR) << ...;             // prefixed with strerror(errno)
 *
 * Severities: INFO, WARNING, ERROR, FATAL. FATAL maps to spdlog's critical
 * level and does not terminate the process.
 */

#include <spdlog/spdlog.h>

#include <cerrno>
#include <cstring>
#include <ostream>
#include <sstream>
#include <string>

namespace LogStream::detail {

// Severity tokens consumed by the LOG() family of macros.
inline constexpr auto INFO = spdlog::level::info;
inline constexpr auto WARNING = spdlog::level::warn;
inline constexpr auto ERROR = spdlog::level::err;
inline constexpr auto FATAL = spdlog::level::critical;

class LogMessage {
    std::ostringstream oss;
    spdlog::level::level_enum level;

   public:
    explicit LogMessage(spdlog::level::level_enum l) : level(l) {}

    LogMessage(const LogMessage&) = delete;
    LogMessage& operator=(const LogMessage&) = delete;

    template <typename T>
    LogMessage& operator<<(const T& value) {
        oss << value;
        return *this;
    }

    // Manipulators like std::endl
    LogMessage& operator<<(std::ostream& (*manip)(std::ostream&)) {
        manip(oss);
        return *this;
    }

    ~LogMessage() {
        const std::string msg = oss.str();
        if (!msg.empty()) {
            spdlog::log(level, "{}", msg);
        }
    }
};

inline std::string errnoString(int savedErrno) {
    return std::strerror(savedErrno);
}

}  // namespace LogStream::detail

#define LOG(severity) \
    ::LogStream::detail::LogMessage(::LogStream::detail::severity)

// The severity argument is kept for call-site symmetry with LOG().
#define DLOG(severity) \
    ::LogStream::detail::LogMessage(::spdlog::level::debug)

#define PLOG(severity) \
    LOG(severity) << ::LogStream::detail::errnoString(errno) << ": "
