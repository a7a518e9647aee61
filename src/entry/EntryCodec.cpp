#include "EntryCodec.hpp"

#include <absl/status/status.h>
#include <absl/strings/ascii.h>
#include <absl/strings/str_replace.h>
#include <fmt/format.h>
#include <json/json.h>

#include <iterator>
#include <limits>
#include <memory>
#include <utility>

namespace LogStream {

namespace {

// Facility "user" (1) in the RFC 5424 PRI value.
constexpr int kSyslogUserFacility = 1;

absl::StatusOr<Json::Value> parseJsonObject(std::string_view line) {
    Json::CharReaderBuilder builder;
    builder["collectComments"] = false;
    builder["rejectDupKeys"] = true;
    builder["failIfExtra"] = true;
    const std::unique_ptr<Json::CharReader> reader(builder.newCharReader());

    Json::Value root;
    std::string errors;
    if (!reader->parse(line.data(), line.data() + line.size(), &root,
                       &errors)) {
        return absl::InvalidArgumentError(
            fmt::format("Invalid JSON: {}",
                        std::string(absl::StripAsciiWhitespace(errors))));
    }
    if (!root.isObject()) {
        return absl::InvalidArgumentError("Entry is not a JSON object");
    }
    return root;
}

std::string writeCompact(const Json::Value& root) {
    Json::StreamWriterBuilder builder;
    builder["indentation"] = "";
    builder["emitUTF8"] = true;
    return Json::writeString(builder, root);
}

absl::StatusOr<LogLevel> levelFromJson(const Json::Value& value) {
    if (value.isInt64()) {
        return logLevelFromInt(value.asInt64());
    }
    if (value.isString()) {
        return parseLogLevel(value.asString());
    }
    return absl::InvalidArgumentError("'level' must be an integer or a name");
}

absl::Status fieldsFromJson(const Json::Value& value, LogFields* fields) {
    if (value.isNull()) {
        return absl::OkStatus();
    }
    if (!value.isObject()) {
        return absl::InvalidArgumentError("'fields' must be an object");
    }
    for (auto it = value.begin(); it != value.end(); ++it) {
        if (!it->isString()) {
            return absl::InvalidArgumentError(fmt::format(
                "Value of field '{}' must be a string", it.name()));
        }
        fields->emplace(it.name(), it->asString());
    }
    return absl::OkStatus();
}

absl::Status optionalsFromJson(const Json::Value& root,
                               std::optional<uint32_t>* pid,
                               std::optional<std::string>* hostname) {
    if (root.isMember("pid")) {
        const Json::Value& value = root["pid"];
        if (!value.isUInt64() ||
            value.asUInt64() > std::numeric_limits<uint32_t>::max()) {
            return absl::InvalidArgumentError(
                "'pid' must be a non-negative integer");
        }
        *pid = static_cast<uint32_t>(value.asUInt64());
    }
    if (root.isMember("hostname")) {
        const Json::Value& value = root["hostname"];
        if (!value.isString()) {
            return absl::InvalidArgumentError("'hostname' must be a string");
        }
        *hostname = value.asString();
    }
    return absl::OkStatus();
}

Json::Value fieldsToJson(const LogFields& fields) {
    Json::Value object(Json::objectValue);
    for (const auto& [key, value] : fields) {
        object[key] = value;
    }
    return object;
}

// Human and syslog records must stay on one line.
std::string singleLine(std::string_view text) {
    return absl::StrReplaceAll(absl::string_view(text.data(), text.size()),
                               {{"\r", "\\r"}, {"\n", "\\n"}});
}

}  // namespace

absl::StatusOr<OutputFormat> parseOutputFormat(std::string_view text) {
    const std::string lowered =
        absl::AsciiStrToLower(absl::string_view(text.data(), text.size()));
    if (lowered == "json") {
        return OutputFormat::Json;
    }
    if (lowered == "human") {
        return OutputFormat::Human;
    }
    if (lowered == "syslog") {
        return OutputFormat::Syslog;
    }
    return absl::InvalidArgumentError(
        fmt::format("Unknown output format '{}' (json, human, syslog)", text));
}

std::string_view outputFormatName(OutputFormat format) {
    switch (format) {
        case OutputFormat::Json:
            return "json";
        case OutputFormat::Human:
            return "human";
        case OutputFormat::Syslog:
            return "syslog";
    }
    return "unknown";
}

absl::StatusOr<PartialEntry> parsePartialEntry(std::string_view line) {
    auto root = parseJsonObject(line);
    if (!root.ok()) {
        return root.status();
    }

    PartialEntry entry;
    if (!root->isMember("level")) {
        return absl::InvalidArgumentError("Missing 'level'");
    }
    auto level = levelFromJson((*root)["level"]);
    if (!level.ok()) {
        return level.status();
    }
    entry.level = *level;

    const Json::Value& message = (*root)["message"];
    if (!message.isString()) {
        return absl::InvalidArgumentError("'message' must be a string");
    }
    entry.message = message.asString();

    if (auto status = fieldsFromJson((*root)["fields"], &entry.fields);
        !status.ok()) {
        return status;
    }
    if (auto status = optionalsFromJson(*root, &entry.pid, &entry.hostname);
        !status.ok()) {
        return status;
    }
    return entry;
}

std::string serializePartialEntry(const PartialEntry& entry) {
    Json::Value root(Json::objectValue);
    root["level"] = static_cast<int>(entry.level);
    root["message"] = entry.message;
    if (!entry.fields.empty()) {
        root["fields"] = fieldsToJson(entry.fields);
    }
    if (entry.pid) {
        root["pid"] = *entry.pid;
    }
    if (entry.hostname) {
        root["hostname"] = *entry.hostname;
    }
    return writeCompact(root);
}

std::string formatJson(const LogEntry& entry) {
    Json::Value root(Json::objectValue);
    root["id"] = entry.id();
    root["timestamp"] = formatIso8601(entry.timestamp());
    root["level"] = std::string(canonicalName(entry.level()));
    root["daemon"] = entry.daemon();
    root["message"] = entry.message();
    root["fields"] = fieldsToJson(entry.fields());
    if (entry.pid()) {
        root["pid"] = *entry.pid();
    }
    if (entry.hostname()) {
        root["hostname"] = *entry.hostname();
    }
    return writeCompact(root);
}

absl::StatusOr<LogEntry> parseJsonRecord(std::string_view line) {
    auto root = parseJsonObject(line);
    if (!root.ok()) {
        return root.status();
    }
    for (const char* member : {"id", "timestamp", "daemon", "message"}) {
        if (!(*root)[member].isString()) {
            return absl::InvalidArgumentError(
                fmt::format("'{}' must be a string", member));
        }
    }
    auto timestamp = parseIso8601((*root)["timestamp"].asString());
    if (!timestamp.ok()) {
        return timestamp.status();
    }
    auto level = levelFromJson((*root)["level"]);
    if (!level.ok()) {
        return level.status();
    }
    LogFields fields;
    if (auto status = fieldsFromJson((*root)["fields"], &fields);
        !status.ok()) {
        return status;
    }
    std::optional<uint32_t> pid;
    std::optional<std::string> hostname;
    if (auto status = optionalsFromJson(*root, &pid, &hostname);
        !status.ok()) {
        return status;
    }
    return LogEntry((*root)["id"].asString(), *timestamp, *level,
                    (*root)["daemon"].asString(),
                    (*root)["message"].asString(), std::move(fields), pid,
                    std::move(hostname));
}

std::string formatHuman(const LogEntry& entry) {
    std::string out =
        fmt::format("{} {} {}: {}", formatHumanTime(entry.timestamp()),
                    displayName(entry.level()), singleLine(entry.daemon()),
                    singleLine(entry.message()));
    for (const auto& [key, value] : entry.fields()) {
        fmt::format_to(std::back_inserter(out), " {}={}", singleLine(key),
                       singleLine(value));
    }
    return out;
}

std::string formatSyslog(const LogEntry& entry) {
    const int pri = kSyslogUserFacility * 8 + static_cast<int>(entry.level());
    const std::string pid =
        entry.pid() ? std::to_string(*entry.pid()) : std::string("-");
    return fmt::format("<{}>1 {} {} {} {} - - {}", pri,
                       formatIso8601(entry.timestamp()),
                       singleLine(entry.hostname().value_or("-")),
                       singleLine(entry.daemon()), pid,
                       singleLine(entry.message()));
}

std::string formatEntry(const LogEntry& entry, OutputFormat format) {
    switch (format) {
        case OutputFormat::Json:
            return formatJson(entry);
        case OutputFormat::Human:
            return formatHuman(entry);
        case OutputFormat::Syslog:
            return formatSyslog(entry);
    }
    return formatJson(entry);
}

}  // namespace LogStream
