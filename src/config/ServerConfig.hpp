#pragma once

#include <absl/status/status.h>

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <string>

#include "entry/EntryCodec.hpp"
#include "rotation/Compressor.hpp"
#include "rotation/RotationEngine.hpp"

namespace LogStream {

inline constexpr std::string_view kDefaultSocketPath = "/tmp/logstream.sock";

struct ServerConfig {
    struct Server {
        std::string socketPath{kDefaultSocketPath};
        size_t maxConnections = 1000;
        size_t bufferSize = 8192;
        // 0 selects hardware concurrency, capped at 4.
        unsigned ioThreads = 0;
        std::chrono::seconds shutdownGrace{5};
    } server;

    struct Storage {
        std::filesystem::path outputDirectory = "/var/log/logstream";
        std::string fileName = "logstream.log";
        uint64_t maxFileSize = 100ULL * 1024 * 1024;
    } storage;

    struct Rotation {
        bool enabled = true;
        uint32_t maxAgeHours = 24;
        uint32_t keepFiles = 7;
        std::chrono::seconds retentionInterval{60};
    } rotation;

    struct File {
        bool enabled = true;
        OutputFormat format = OutputFormat::Json;
        bool compression = false;
        CompressionAlgorithm algorithm = CompressionAlgorithm::Gzip;
    } file;

    struct Journald {
        bool enabled = false;
        std::string syslogIdentifier = "logstream";
        std::string socketPath = "/run/systemd/journal/socket";
    } journald;

    struct Syslog {
        bool enabled = false;
        std::string facility = "LOG_USER";
    } syslog;

    // Accepted for compatibility; no exporter is started.
    struct Metrics {
        bool enabled = false;
        uint16_t port = 9090;
    } metrics;

    // InvalidArgument describing the first violated constraint.
    absl::Status validate() const;

    [[nodiscard]] RotationOptions rotationOptions() const;
    [[nodiscard]] unsigned effectiveIoThreads() const;
};

}  // namespace LogStream
