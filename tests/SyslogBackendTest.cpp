#include <gtest/gtest.h>
#include <syslog.h>

#include "backends/SyslogBackend.hpp"

using namespace LogStream;

TEST(SyslogBackendTest, ParsesFacilities) {
    EXPECT_EQ(parseSyslogFacility("LOG_USER").value(), LOG_USER);
    EXPECT_EQ(parseSyslogFacility("daemon").value(), LOG_DAEMON);
    EXPECT_EQ(parseSyslogFacility("log_local0").value(), LOG_LOCAL0);
    EXPECT_EQ(parseSyslogFacility("LOCAL7").value(), LOG_LOCAL7);
    EXPECT_EQ(parseSyslogFacility("LOG_KERN").status().code(),
              absl::StatusCode::kInvalidArgument);
    EXPECT_FALSE(parseSyslogFacility("").ok());
}

TEST(SyslogBackendTest, FormatsMessage) {
    const LogEntry entry("id", nowMicros(), LogLevel::Warning, "svc-A",
                         "queue is filling up", {{"depth", "900"}}, 55,
                         std::nullopt);
    EXPECT_EQ(formatSyslogMessage(entry),
              "svc-A[55]: queue is filling up depth=900");

    const LogEntry noPid("id", nowMicros(), LogLevel::Info, "svc-B", "ok", {},
                         std::nullopt, std::nullopt);
    EXPECT_EQ(formatSyslogMessage(noPid), "svc-B: ok");
}

TEST(SyslogBackendTest, WriteSucceeds) {
    SyslogBackend backend("logstream-test", LOG_USER);
    EXPECT_EQ(backend.facility(), LOG_USER);
    EXPECT_EQ(backend.name(), "syslog");
    const LogEntry entry("id", nowMicros(), LogLevel::Debug, "svc", "test", {},
                         std::nullopt, std::nullopt);
    EXPECT_TRUE(backend.write(entry).ok());
}
