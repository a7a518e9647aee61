#include "ConfigLoader.hpp"

#include <LogCompat.hpp>
#include <absl/strings/str_split.h>
#include <fmt/format.h>

#include <boost/program_options.hpp>
#include <fstream>
#include <sstream>
#include <system_error>
#include <utility>
#include <vector>

namespace po = boost::program_options;

namespace LogStream {

namespace {

// INI values may be written quoted: socket_path = "/tmp/logstream.sock"
std::string unquote(std::string value) {
    if (value.size() >= 2 && (value.front() == '"' || value.front() == '\'') &&
        value.back() == value.front()) {
        return value.substr(1, value.size() - 2);
    }
    return value;
}

po::options_description serverFileOptions() {
    po::options_description desc("LogStream server configuration");
    // clang-format off
    desc.add_options()
        ("server.socket_path", po::value<std::string>(),
            "Unix socket path to bind to")
        ("server.max_connections", po::value<size_t>(),
            "Maximum concurrent connections")
        ("server.buffer_size", po::value<size_t>(),
            "Read buffer size in bytes")
        ("server.io_threads", po::value<unsigned>(),
            "Number of I/O threads, 0 for automatic")
        ("server.shutdown_grace_secs", po::value<unsigned>(),
            "Seconds granted to drain on shutdown")
        ("storage.output_directory", po::value<std::string>(),
            "Directory to store log files")
        ("storage.file_name", po::value<std::string>(),
            "Name of the active log file")
        ("storage.max_file_size", po::value<uint64_t>(),
            "Maximum file size before rotation (bytes)")
        ("rotation.enabled", po::value<bool>(), "Enable log rotation")
        ("rotation.max_age_hours", po::value<uint32_t>(),
            "Maximum age of rotated files (hours), 0 to disable")
        ("rotation.keep_files", po::value<uint32_t>(),
            "Number of rotated files to keep, 0 to disable")
        ("rotation.retention_interval_secs", po::value<unsigned>(),
            "Seconds between retention passes")
        ("file.enabled", po::value<bool>(), "Enable file backend")
        ("file.format", po::value<std::string>(),
            "Record format: json, human or syslog")
        ("file.compression", po::value<bool>(),
            "Compress rotated files")
        ("file.compression_algorithm", po::value<std::string>(),
            "Compression algorithm: gzip or zstd")
        ("journald.enabled", po::value<bool>(), "Enable journald backend")
        ("journald.syslog_identifier", po::value<std::string>(),
            "SYSLOG_IDENTIFIER of journald entries")
        ("journald.socket_path", po::value<std::string>(),
            "journald native socket")
        ("syslog.enabled", po::value<bool>(), "Enable syslog backend")
        ("syslog.facility", po::value<std::string>(), "Syslog facility")
        ("metrics.enabled", po::value<bool>(), "Enable metrics")
        ("metrics.port", po::value<uint16_t>(), "Metrics port");
    // clang-format on
    return desc;
}

template <typename T>
void assignIfSet(const po::variables_map& vm, const char* key, T* out) {
    if (vm.count(key) != 0) {
        *out = vm[key].as<T>();
    }
}

void assignIfSet(const po::variables_map& vm, const char* key,
                 std::string* out) {
    if (vm.count(key) != 0) {
        *out = unquote(vm[key].as<std::string>());
    }
}

void assignIfSet(const po::variables_map& vm, const char* key,
                 std::chrono::seconds* out) {
    if (vm.count(key) != 0) {
        *out = std::chrono::seconds(vm[key].as<unsigned>());
    }
}

absl::Status applyVariables(const po::variables_map& vm,
                            ServerConfig* config) {
    std::string path;

    assignIfSet(vm, "server.socket_path", &config->server.socketPath);
    assignIfSet(vm, "server.max_connections", &config->server.maxConnections);
    assignIfSet(vm, "server.buffer_size", &config->server.bufferSize);
    assignIfSet(vm, "server.io_threads", &config->server.ioThreads);
    assignIfSet(vm, "server.shutdown_grace_secs",
                &config->server.shutdownGrace);

    if (vm.count("storage.output_directory") != 0) {
        assignIfSet(vm, "storage.output_directory", &path);
        config->storage.outputDirectory = path;
    }
    assignIfSet(vm, "storage.file_name", &config->storage.fileName);
    assignIfSet(vm, "storage.max_file_size", &config->storage.maxFileSize);

    assignIfSet(vm, "rotation.enabled", &config->rotation.enabled);
    assignIfSet(vm, "rotation.max_age_hours", &config->rotation.maxAgeHours);
    assignIfSet(vm, "rotation.keep_files", &config->rotation.keepFiles);
    assignIfSet(vm, "rotation.retention_interval_secs",
                &config->rotation.retentionInterval);

    assignIfSet(vm, "file.enabled", &config->file.enabled);
    assignIfSet(vm, "file.compression", &config->file.compression);
    if (vm.count("file.format") != 0) {
        std::string name;
        assignIfSet(vm, "file.format", &name);
        auto format = parseOutputFormat(name);
        if (!format.ok()) {
            return format.status();
        }
        config->file.format = *format;
    }
    if (vm.count("file.compression_algorithm") != 0) {
        std::string name;
        assignIfSet(vm, "file.compression_algorithm", &name);
        auto algorithm = parseCompressionAlgorithm(name);
        if (!algorithm.ok()) {
            return algorithm.status();
        }
        config->file.algorithm = *algorithm;
    }

    assignIfSet(vm, "journald.enabled", &config->journald.enabled);
    assignIfSet(vm, "journald.syslog_identifier",
                &config->journald.syslogIdentifier);
    assignIfSet(vm, "journald.socket_path", &config->journald.socketPath);

    assignIfSet(vm, "syslog.enabled", &config->syslog.enabled);
    assignIfSet(vm, "syslog.facility", &config->syslog.facility);

    assignIfSet(vm, "metrics.enabled", &config->metrics.enabled);
    assignIfSet(vm, "metrics.port", &config->metrics.port);
    return absl::OkStatus();
}

}  // namespace

absl::Status applyConfigFile(std::istream& input, ServerConfig* config) {
    po::variables_map vm;
    try {
        po::store(po::parse_config_file(input, serverFileOptions()), vm);
        po::notify(vm);
    } catch (const po::error& e) {
        return absl::InvalidArgumentError(
            fmt::format("Config file: {}", e.what()));
    }
    return applyVariables(vm, config);
}

absl::StatusOr<ServerConfig> loadServerConfigFile(
    const std::filesystem::path& path) {
    ServerConfig config;
    std::ifstream ifs(path);
    if (ifs.fail()) {
        std::error_code ec;
        if (!std::filesystem::exists(path, ec)) {
            LOG(INFO) << "Config file " << path
                      << " not found, using defaults";
            return config;
        }
        return absl::InvalidArgumentError(
            fmt::format("Opening {} failed", path.string()));
    }
    if (auto status = applyConfigFile(ifs, &config); !status.ok()) {
        return status;
    }
    LOG(INFO) << "Loaded configuration from " << path;
    return config;
}

absl::StatusOr<ServerOptions> parseServerCommandLine(int argc,
                                                     const char* const* argv) {
    po::options_description desc("Usage: logstream-server [options]");
    // clang-format off
    desc.add_options()
        ("help,h", "Show this help")
        ("config,c", po::value<std::string>()->default_value(
            std::string(kDefaultServerConfigPath)), "Configuration file")
        ("socket,s", po::value<std::string>(), "Override the socket path")
        ("output,o", po::value<std::string>(),
            "Override the output directory")
        ("verbose,v", po::bool_switch(), "Enable debug logging")
        ("journald", po::bool_switch(), "Enable the journald backend")
        ("syslog", po::bool_switch(), "Enable the syslog backend")
        ("no-file", po::bool_switch(), "Disable the file backend")
        ("metrics-port", po::value<uint16_t>(),
            "Enable metrics on the given port");
    // clang-format on

    po::variables_map vm;
    try {
        po::store(po::parse_command_line(argc, argv, desc), vm);
        po::notify(vm);
    } catch (const po::error& e) {
        return absl::InvalidArgumentError(
            fmt::format("Command line: {}", e.what()));
    }

    ServerOptions options;
    std::ostringstream usage;
    usage << desc;
    options.usage = usage.str();
    if (vm.count("help") != 0) {
        options.showHelp = true;
        return options;
    }
    options.verbose = vm["verbose"].as<bool>();

    auto config = loadServerConfigFile(vm["config"].as<std::string>());
    if (!config.ok()) {
        return config.status();
    }
    options.config = std::move(*config);

    if (vm.count("socket") != 0) {
        options.config.server.socketPath = vm["socket"].as<std::string>();
    }
    if (vm.count("output") != 0) {
        options.config.storage.outputDirectory = vm["output"].as<std::string>();
    }
    if (vm["journald"].as<bool>()) {
        options.config.journald.enabled = true;
    }
    if (vm["syslog"].as<bool>()) {
        options.config.syslog.enabled = true;
    }
    if (vm["no-file"].as<bool>()) {
        options.config.file.enabled = false;
    }
    if (vm.count("metrics-port") != 0) {
        options.config.metrics.enabled = true;
        options.config.metrics.port = vm["metrics-port"].as<uint16_t>();
    }

    if (auto status = options.config.validate(); !status.ok()) {
        return status;
    }
    return options;
}

absl::StatusOr<LoggerOptions> parseLoggerCommandLine(int argc,
                                                     const char* const* argv) {
    po::options_description desc("Usage: logstream-logger [options] < input");
    // clang-format off
    desc.add_options()
        ("help,h", "Show this help")
        ("socket,s", po::value<std::string>()->default_value(
            std::string(kDefaultSocketPath)), "Server socket path")
        ("name,n", po::value<std::string>()->default_value("logstream-logger"),
            "Daemon name sent in the handshake")
        ("level,l", po::value<std::string>()->default_value("info"),
            "Level of every entry")
        ("field,f", po::value<std::vector<std::string>>()->composing(),
            "Extra field as key=value, repeatable")
        ("timeout", po::value<unsigned>()->default_value(5),
            "Connect and flush timeout in seconds");
    // clang-format on

    po::variables_map vm;
    try {
        po::store(po::parse_command_line(argc, argv, desc), vm);
        po::notify(vm);
    } catch (const po::error& e) {
        return absl::InvalidArgumentError(
            fmt::format("Command line: {}", e.what()));
    }

    LoggerOptions options;
    std::ostringstream usage;
    usage << desc;
    options.usage = usage.str();
    if (vm.count("help") != 0) {
        options.showHelp = true;
        return options;
    }

    auto level = parseLogLevel(vm["level"].as<std::string>());
    if (!level.ok()) {
        return level.status();
    }
    options.level = *level;

    if (vm.count("field") != 0) {
        for (const auto& field : vm["field"].as<std::vector<std::string>>()) {
            std::pair<std::string, std::string> kv =
                absl::StrSplit(field, absl::MaxSplits('=', 1));
            if (kv.first.empty() || field.find('=') == std::string::npos) {
                return absl::InvalidArgumentError(fmt::format(
                    "Field '{}' is not of the form key=value", field));
            }
            options.fields[kv.first] = kv.second;
        }
    }

    options.client.socketPath = vm["socket"].as<std::string>();
    options.client.daemonName = vm["name"].as<std::string>();
    options.client.minLevel = LogLevel::Debug;
    options.client.timeout = std::chrono::seconds(vm["timeout"].as<unsigned>());
    if (auto status = options.client.validate(); !status.ok()) {
        return status;
    }
    return options;
}

}  // namespace LogStream
