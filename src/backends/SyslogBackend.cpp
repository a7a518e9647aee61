#include "SyslogBackend.hpp"

#include <absl/strings/ascii.h>
#include <absl/strings/match.h>
#include <absl/strings/strip.h>
#include <fmt/format.h>
#include <syslog.h>

#include <array>
#include <iterator>
#include <utility>

namespace LogStream {

namespace {

struct FacilityName {
    std::string_view name;
    int value;
};

constexpr std::array<FacilityName, 10> kFacilities = {{
    {"USER", LOG_USER},
    {"DAEMON", LOG_DAEMON},
    {"LOCAL0", LOG_LOCAL0},
    {"LOCAL1", LOG_LOCAL1},
    {"LOCAL2", LOG_LOCAL2},
    {"LOCAL3", LOG_LOCAL3},
    {"LOCAL4", LOG_LOCAL4},
    {"LOCAL5", LOG_LOCAL5},
    {"LOCAL6", LOG_LOCAL6},
    {"LOCAL7", LOG_LOCAL7},
}};

}  // namespace

// openlog() state is process wide; the handle keeps the ident string alive
// for as long as any backend copy uses it.
class SyslogBackend::Handle {
   public:
    Handle(std::string ident, int facility) : ident_(std::move(ident)) {
        openlog(ident_.c_str(), LOG_NDELAY, facility);
    }
    ~Handle() { closelog(); }

    Handle(const Handle&) = delete;
    Handle& operator=(const Handle&) = delete;

   private:
    std::string ident_;
};

absl::StatusOr<int> parseSyslogFacility(std::string_view name) {
    std::string upper =
        absl::AsciiStrToUpper(absl::string_view(name.data(), name.size()));
    absl::string_view absl_view(upper);
    absl::ConsumePrefix(&absl_view, "LOG_");
    std::string_view view(absl_view.data(), absl_view.size());
    for (const auto& facility : kFacilities) {
        if (view == facility.name) {
            return facility.value;
        }
    }
    return absl::InvalidArgumentError(fmt::format(
        "Unknown syslog facility '{}' (LOG_USER, LOG_DAEMON, LOG_LOCAL0-7)",
        name));
}

std::string formatSyslogMessage(const LogEntry& entry) {
    std::string out = entry.daemon();
    if (entry.pid()) {
        fmt::format_to(std::back_inserter(out), "[{}]", *entry.pid());
    }
    fmt::format_to(std::back_inserter(out), ": {}", entry.message());
    for (const auto& [key, value] : entry.fields()) {
        fmt::format_to(std::back_inserter(out), " {}={}", key, value);
    }
    return out;
}

SyslogBackend::SyslogBackend(std::string ident, int facility)
    : handle_(std::make_shared<Handle>(std::move(ident), facility)),
      facility_(facility) {}

absl::Status SyslogBackend::write(const LogEntry& entry) {
    const std::string message = formatSyslogMessage(entry);
    syslog(facility_ | static_cast<int>(entry.level()), "%s", message.c_str());
    return absl::OkStatus();
}

}  // namespace LogStream
