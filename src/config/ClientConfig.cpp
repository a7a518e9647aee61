#include "ClientConfig.hpp"

namespace LogStream {

absl::Status ClientConfig::validate() const {
    if (socketPath.empty()) {
        return absl::InvalidArgumentError("Socket path cannot be empty");
    }
    if (daemonName.empty()) {
        return absl::InvalidArgumentError("Daemon name cannot be empty");
    }
    if (daemonName.find_first_of("\r\n") != std::string::npos) {
        return absl::InvalidArgumentError("Daemon name cannot contain newlines");
    }
    if (queueCapacity == 0) {
        return absl::InvalidArgumentError("Queue capacity must be positive");
    }
    if (timeout.count() <= 0) {
        return absl::InvalidArgumentError("Timeout must be positive");
    }
    if (initialBackoff.count() <= 0 || maxBackoff < initialBackoff) {
        return absl::InvalidArgumentError(
            "Backoff must satisfy 0 < initial <= max");
    }
    return absl::OkStatus();
}

}  // namespace LogStream
