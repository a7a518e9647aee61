#pragma once

#include <absl/status/status.h>
#include <absl/status/statusor.h>

#include <memory>
#include <string>
#include <string_view>

#include "entry/LogEntry.hpp"

namespace LogStream {

// "LOG_USER", "LOG_DAEMON", "LOG_LOCAL0".."LOG_LOCAL7" (the "LOG_" prefix
// is optional, case-insensitive).
absl::StatusOr<int> parseSyslogFacility(std::string_view name);

// "daemon[pid]: message key=value..."
std::string formatSyslogMessage(const LogEntry& entry);

// Best-effort backend forwarding entries to syslog(3).
class SyslogBackend {
   public:
    static constexpr bool kDurable = false;

    SyslogBackend(std::string ident, int facility);

    absl::Status write(const LogEntry& entry);

    [[nodiscard]] std::string_view name() const { return "syslog"; }
    [[nodiscard]] int facility() const { return facility_; }

   private:
    class Handle;
    std::shared_ptr<Handle> handle_;
    int facility_;
};

}  // namespace LogStream
