#include <gtest/gtest.h>
#include <json/json.h>

#include <chrono>
#include <memory>

#include "entry/EntryCodec.hpp"

using namespace LogStream;

class EntryCodecTest : public testing::Test {
   protected:
    static TimePoint fixedTime() {
        using namespace std::chrono;
        return TimePoint(sys_days{year{2026} / January / 2}.time_since_epoch() +
                         hours(3) + minutes(4) + seconds(5) +
                         microseconds(678901));
    }

    static LogEntry sampleEntry() {
        return {"0b6f7a52-1e1c-4c1d-9a55-9e2d1b6f2b10",
                fixedTime(),
                LogLevel::Warning,
                "svc-A",
                "disk \"sda\" at 91%",
                {{"disk", "sda"}, {"usage", "91"}},
                1234,
                "node-1"};
    }
};

TEST_F(EntryCodecTest, ParsesMinimalWireEntry) {
    auto entry = parsePartialEntry(R"({"level":6,"message":"hello"})");
    ASSERT_TRUE(entry.ok()) << entry.status();
    EXPECT_EQ(entry->level, LogLevel::Info);
    EXPECT_EQ(entry->message, "hello");
    EXPECT_TRUE(entry->fields.empty());
    EXPECT_FALSE(entry->pid.has_value());
    EXPECT_FALSE(entry->hostname.has_value());
}

TEST_F(EntryCodecTest, ParsesFullWireEntry) {
    auto entry = parsePartialEntry(
        R"({"level":"error","message":"m","fields":{"a":"1","b":"2"},)"
        R"("pid":77,"hostname":"h","extra":true})");
    ASSERT_TRUE(entry.ok()) << entry.status();
    EXPECT_EQ(entry->level, LogLevel::Error);
    EXPECT_EQ(entry->fields.size(), 2U);
    EXPECT_EQ(entry->fields.at("b"), "2");
    EXPECT_EQ(entry->pid, 77U);
    EXPECT_EQ(entry->hostname, "h");
}

TEST_F(EntryCodecTest, RejectsMalformedWireEntries) {
    const char* const kBad[] = {
        "not json",
        "[1,2,3]",
        R"({"message":"no level"})",
        R"({"level":9,"message":"x"})",
        R"({"level":"loud","message":"x"})",
        R"({"level":6})",
        R"({"level":6,"message":5})",
        R"({"level":6,"message":"x","fields":[]})",
        R"({"level":6,"message":"x","fields":{"n":1}})",
        R"({"level":6,"message":"x","pid":-1})",
        R"({"level":6,"message":"x","hostname":1})",
        R"({"level":6,"message":"x"} trailing)",
        R"({"level":6,"level":5,"message":"x"})",
    };
    for (const char* line : kBad) {
        auto entry = parsePartialEntry(line);
        EXPECT_EQ(entry.status().code(), absl::StatusCode::kInvalidArgument)
            << line;
    }
}

TEST_F(EntryCodecTest, WireSerializationParsesBack) {
    PartialEntry partial;
    partial.level = LogLevel::Debug;
    partial.message = "line\nwith newline";
    partial.fields = {{"k", "v"}};
    partial.pid = 9;
    const std::string line = serializePartialEntry(partial);
    EXPECT_EQ(line.find('\n'), std::string::npos);

    auto parsed = parsePartialEntry(line);
    ASSERT_TRUE(parsed.ok()) << parsed.status();
    EXPECT_EQ(parsed->level, partial.level);
    EXPECT_EQ(parsed->message, partial.message);
    EXPECT_EQ(parsed->fields, partial.fields);
    EXPECT_EQ(parsed->pid, partial.pid);
}

TEST_F(EntryCodecTest, JsonRecordLayout) {
    const std::string record = formatJson(sampleEntry());
    EXPECT_EQ(record.find('\n'), std::string::npos);

    Json::Value root;
    Json::CharReaderBuilder builder;
    std::string errors;
    std::unique_ptr<Json::CharReader> reader(builder.newCharReader());
    ASSERT_TRUE(reader->parse(record.data(), record.data() + record.size(),
                              &root, &errors))
        << errors;
    EXPECT_EQ(root["id"].asString(), "0b6f7a52-1e1c-4c1d-9a55-9e2d1b6f2b10");
    EXPECT_EQ(root["timestamp"].asString(), "2026-01-02T03:04:05.678901Z");
    EXPECT_EQ(root["level"].asString(), "Warning");
    EXPECT_EQ(root["daemon"].asString(), "svc-A");
    EXPECT_EQ(root["fields"]["usage"].asString(), "91");
    EXPECT_EQ(root["pid"].asUInt(), 1234U);
    EXPECT_EQ(root["hostname"].asString(), "node-1");
}

TEST_F(EntryCodecTest, JsonRecordRoundTrip) {
    const LogEntry entry = sampleEntry();
    auto parsed = parseJsonRecord(formatJson(entry));
    ASSERT_TRUE(parsed.ok()) << parsed.status();
    EXPECT_EQ(*parsed, entry);
}

TEST_F(EntryCodecTest, JsonRecordWithoutOptionals) {
    const LogEntry entry("id-1", fixedTime(), LogLevel::Info, "d", "m", {},
                         std::nullopt, std::nullopt);
    auto parsed = parseJsonRecord(formatJson(entry));
    ASSERT_TRUE(parsed.ok()) << parsed.status();
    EXPECT_EQ(*parsed, entry);
}

TEST_F(EntryCodecTest, RejectsIncompleteRecord) {
    EXPECT_FALSE(parseJsonRecord(R"({"id":"x","level":"Info"})").ok());
    EXPECT_FALSE(parseJsonRecord(
                     R"({"id":"x","timestamp":"bad","level":"Info",)"
                     R"("daemon":"d","message":"m"})")
                     .ok());
}

TEST_F(EntryCodecTest, HumanFormat) {
    EXPECT_EQ(formatHuman(sampleEntry()),
              "2026-01-02 03:04:05.678 WARN svc-A: disk \"sda\" at 91% "
              "disk=sda usage=91");

    const LogEntry multiLine("id", fixedTime(), LogLevel::Info, "d",
                             "first\nsecond", {}, std::nullopt, std::nullopt);
    EXPECT_EQ(formatHuman(multiLine),
              "2026-01-02 03:04:05.678 INFO d: first\\nsecond");
}

TEST_F(EntryCodecTest, SyslogFormat) {
    EXPECT_EQ(formatSyslog(sampleEntry()),
              "<12>1 2026-01-02T03:04:05.678901Z node-1 svc-A 1234 - - "
              "disk \"sda\" at 91%");

    const LogEntry noPid("id", fixedTime(), LogLevel::Emergency, "d", "m", {},
                         std::nullopt, std::nullopt);
    EXPECT_EQ(formatSyslog(noPid),
              "<8>1 2026-01-02T03:04:05.678901Z - d - - - m");
}

TEST_F(EntryCodecTest, TextFormatsKeepOneRecordPerLine) {
    const LogEntry injected("id", fixedTime(), LogLevel::Info, "svc\nA",
                            "m", {{"a\nb", "v\r\n"}}, 7,
                            "host\n<14>1 forged svc-B");
    const std::string human = formatHuman(injected);
    const std::string syslog = formatSyslog(injected);
    EXPECT_EQ(human.find_first_of("\r\n"), std::string::npos) << human;
    EXPECT_EQ(syslog.find_first_of("\r\n"), std::string::npos) << syslog;
    EXPECT_EQ(human,
              "2026-01-02 03:04:05.678 INFO svc\\nA: m a\\nb=v\\r\\n");
    EXPECT_EQ(syslog,
              "<14>1 2026-01-02T03:04:05.678901Z host\\n<14>1 forged svc-B "
              "svc\\nA 7 - - m");
}

TEST_F(EntryCodecTest, OutputFormatNames) {
    EXPECT_EQ(parseOutputFormat("JSON").value(), OutputFormat::Json);
    EXPECT_EQ(parseOutputFormat("human").value(), OutputFormat::Human);
    EXPECT_EQ(parseOutputFormat("syslog").value(), OutputFormat::Syslog);
    EXPECT_FALSE(parseOutputFormat("xml").ok());
    EXPECT_EQ(outputFormatName(OutputFormat::Human), "human");
    EXPECT_EQ(formatEntry(sampleEntry(), OutputFormat::Json),
              formatJson(sampleEntry()));
}
