#include "ServerConfig.hpp"

#include <fmt/format.h>

#include <algorithm>
#include <thread>

#include "backends/SyslogBackend.hpp"

namespace LogStream {

namespace {
constexpr unsigned kMaxAutoIoThreads = 4;
}  // namespace

absl::Status ServerConfig::validate() const {
    if (server.socketPath.empty()) {
        return absl::InvalidArgumentError("Socket path cannot be empty");
    }
    if (server.maxConnections == 0) {
        return absl::InvalidArgumentError("max_connections must be positive");
    }
    if (server.bufferSize == 0) {
        return absl::InvalidArgumentError("buffer_size must be positive");
    }
    if (storage.maxFileSize == 0) {
        return absl::InvalidArgumentError("max_file_size must be positive");
    }
    if (storage.fileName.empty() ||
        storage.fileName.find('/') != std::string::npos) {
        return absl::InvalidArgumentError(fmt::format(
            "file_name '{}' must be a plain file name", storage.fileName));
    }
    if (rotation.enabled && rotation.retentionInterval.count() <= 0) {
        return absl::InvalidArgumentError(
            "retention_interval_secs must be positive");
    }
    if (syslog.enabled) {
        if (auto facility = parseSyslogFacility(syslog.facility);
            !facility.ok()) {
            return facility.status();
        }
    }
    if (journald.enabled && journald.syslogIdentifier.empty()) {
        return absl::InvalidArgumentError(
            "journald syslog_identifier cannot be empty");
    }
    if (!file.enabled && !journald.enabled && !syslog.enabled) {
        return absl::InvalidArgumentError("No backend is enabled");
    }
    return absl::OkStatus();
}

RotationOptions ServerConfig::rotationOptions() const {
    RotationOptions options;
    options.directory = storage.outputDirectory;
    options.fileName = storage.fileName;
    options.maxFileSize = storage.maxFileSize;
    options.rotationEnabled = rotation.enabled;
    options.limits.keepFiles = rotation.keepFiles;
    options.limits.maxAgeHours = rotation.maxAgeHours;
    options.format = file.format;
    return options;
}

unsigned ServerConfig::effectiveIoThreads() const {
    if (server.ioThreads != 0) {
        return server.ioThreads;
    }
    return std::clamp(std::thread::hardware_concurrency(), 1U,
                      kMaxAutoIoThreads);
}

}  // namespace LogStream
