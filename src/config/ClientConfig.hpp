#pragma once

#include <absl/status/status.h>

#include <chrono>
#include <cstddef>
#include <string>

#include "entry/LogEntry.hpp"

namespace LogStream {

struct ClientConfig {
    std::string socketPath = "/tmp/logstream.sock";
    std::string daemonName = "unknown";
    // Entries less severe than this are dropped by the client.
    LogLevel minLevel = LogLevel::Info;
    // Bounds connect and handshake, and each write.
    std::chrono::milliseconds timeout{5000};
    bool autoReconnect = true;
    // Entries kept while disconnected; the oldest is dropped when full.
    size_t queueCapacity = 4096;
    std::chrono::milliseconds initialBackoff{100};
    std::chrono::milliseconds maxBackoff{5000};

    absl::Status validate() const;
};

}  // namespace LogStream
