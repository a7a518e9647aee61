#pragma once

#include <absl/status/statusor.h>

#include <filesystem>
#include <istream>
#include <string>

#include "ClientConfig.hpp"
#include "ServerConfig.hpp"
#include "entry/LogEntry.hpp"

namespace LogStream {

inline constexpr std::string_view kDefaultServerConfigPath =
    "/etc/logstream/server.ini";

// Overlays the INI document in |input| onto |config|. Keys not present keep
// their current value; unknown keys are an error.
absl::Status applyConfigFile(std::istream& input, ServerConfig* config);

// Loads |path| over the defaults. A missing file yields the defaults.
absl::StatusOr<ServerConfig> loadServerConfigFile(
    const std::filesystem::path& path);

struct ServerOptions {
    ServerConfig config;
    bool verbose = false;
    // -h was given; |usage| holds the text to print.
    bool showHelp = false;
    std::string usage;
};

// Parses the server command line, loads the config file it names (or the
// default one), applies command line overrides and validates the result.
absl::StatusOr<ServerOptions> parseServerCommandLine(int argc,
                                                     const char* const* argv);

struct LoggerOptions {
    ClientConfig client;
    LogLevel level = LogLevel::Info;
    LogFields fields;
    bool showHelp = false;
    std::string usage;
};

absl::StatusOr<LoggerOptions> parseLoggerCommandLine(int argc,
                                                     const char* const* argv);

}  // namespace LogStream
