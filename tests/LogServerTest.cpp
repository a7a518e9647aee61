#include <gtest/gtest.h>

#include <boost/asio/buffer.hpp>
#include <boost/asio/error.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/local/stream_protocol.hpp>
#include <boost/asio/write.hpp>
#include <chrono>
#include <filesystem>
#include <memory>
#include <string>
#include <vector>

#include "TestUtils.hpp"
#include "entry/EntryCodec.hpp"
#include "router/MessageRouter.hpp"
#include "server/Acceptor.hpp"
#include "server/LogServer.hpp"

using namespace LogStream;

namespace {

// Plain blocking client speaking the session protocol by hand.
class TestConnection {
   public:
    using protocol = boost::asio::local::stream_protocol;

    explicit TestConnection(const std::string& path) : socket_(io_) {
        socket_.connect(protocol::endpoint(path));
    }

    void send(std::string_view data) {
        boost::asio::write(socket_,
                           boost::asio::buffer(data.data(), data.size()));
    }

    void sendEntry(LogLevel level, std::string message, LogFields fields = {}) {
        PartialEntry entry;
        entry.level = level;
        entry.message = std::move(message);
        entry.fields = std::move(fields);
        send(serializePartialEntry(entry) + "\n");
    }

    // Blocks until the peer closes the connection.
    bool closedByPeer() {
        char byte = 0;
        boost::system::error_code ec;
        socket_.read_some(boost::asio::buffer(&byte, 1), ec);
        return ec == boost::asio::error::eof ||
               ec == boost::asio::error::connection_reset;
    }

    void close() {
        boost::system::error_code ec;
        socket_.close(ec);  // NOLINT
    }

   private:
    boost::asio::io_context io_;
    protocol::socket socket_;
};

}  // namespace

class LogServerTest : public testing::Test {
   protected:
    ServerConfig makeConfig() const {
        ServerConfig config;
        config.server.socketPath = socketPath();
        config.server.ioThreads = 2;
        config.server.shutdownGrace = std::chrono::seconds(2);
        config.storage.outputDirectory = logDir();
        return config;
    }

    std::string socketPath() const { return (dir_ / "logstream.sock").string(); }
    std::filesystem::path logDir() const { return dir_ / "logs"; }
    std::filesystem::path activeFile() const {
        return logDir() / "logstream.log";
    }

    std::unique_ptr<LogServer> startServer(ServerConfig config) {
        auto server = std::make_unique<LogServer>(std::move(config));
        auto status = server->start();
        EXPECT_TRUE(status.ok()) << status;
        return server;
    }

    std::vector<LogEntry> activeEntries() const {
        std::vector<LogEntry> entries;
        for (const auto& line : readLines(activeFile())) {
            auto entry = parseJsonRecord(line);
            EXPECT_TRUE(entry.ok()) << entry.status();
            if (entry.ok()) {
                entries.push_back(std::move(*entry));
            }
        }
        return entries;
    }

    bool waitForEntries(size_t count) const {
        return waitUntil([&] { return readLines(activeFile()).size() >= count; });
    }

    TempDirectory dir_;
};

TEST_F(LogServerTest, PersistsEntriesWithDaemonAndTimestamps) {
    auto server = startServer(makeConfig());
    TestConnection conn(socketPath());
    conn.send("svc-A\n");
    conn.sendEntry(LogLevel::Info, "first", {{"k", "v"}});
    conn.sendEntry(LogLevel::Info, "second");
    conn.sendEntry(LogLevel::Info, "third");

    ASSERT_TRUE(waitForEntries(3));
    const auto entries = activeEntries();
    ASSERT_EQ(entries.size(), 3U);
    EXPECT_EQ(entries[0].message(), "first");
    EXPECT_EQ(entries[1].message(), "second");
    EXPECT_EQ(entries[2].message(), "third");
    EXPECT_EQ(entries[0].fields().at("k"), "v");
    for (const auto& entry : entries) {
        EXPECT_EQ(entry.daemon(), "svc-A");
        EXPECT_EQ(entry.level(), LogLevel::Info);
        EXPECT_EQ(entry.id().size(), 36U);
    }
    EXPECT_LE(entries[0].timestamp(), entries[1].timestamp());
    EXPECT_LE(entries[1].timestamp(), entries[2].timestamp());
    EXPECT_NE(entries[0].id(), entries[1].id());
    EXPECT_EQ(server->counters().entriesReceived.load(), 3U);
}

TEST_F(LogServerTest, MalformedLineKeepsConnectionOpen) {
    auto server = startServer(makeConfig());
    TestConnection conn(socketPath());
    conn.send("svc-B\n");
    conn.send("this is not json\n");
    conn.sendEntry(LogLevel::Error, "valid");

    ASSERT_TRUE(waitForEntries(1));
    EXPECT_EQ(server->counters().malformedLines.load(), 1U);

    conn.sendEntry(LogLevel::Error, "still connected");
    ASSERT_TRUE(waitForEntries(2));
    const auto entries = activeEntries();
    ASSERT_EQ(entries.size(), 2U);
    EXPECT_EQ(entries[0].message(), "valid");
    EXPECT_EQ(entries[1].message(), "still connected");
    EXPECT_EQ(server->acceptor()->liveConnections(), 1U);
}

TEST_F(LogServerTest, EmptyHandshakeClosesConnection) {
    auto server = startServer(makeConfig());
    TestConnection conn(socketPath());
    conn.send("\n");
    EXPECT_TRUE(conn.closedByPeer());
    EXPECT_TRUE(waitUntil(
        [&] { return server->counters().protocolViolations.load() == 1; }));
}

TEST_F(LogServerTest, OversizedLineClosesAfterEarlierLines) {
    auto config = makeConfig();
    config.server.bufferSize = 64;
    auto server = startServer(config);

    TestConnection conn(socketPath());
    conn.send("svc-C\n");
    conn.sendEntry(LogLevel::Info, "before");
    conn.send(std::string(64 * 16 + 100, 'x'));

    EXPECT_TRUE(conn.closedByPeer());
    ASSERT_TRUE(waitForEntries(1));
    EXPECT_EQ(activeEntries().front().message(), "before");
    EXPECT_EQ(server->counters().protocolViolations.load(), 1U);
}

TEST_F(LogServerTest, RejectsConnectionsBeyondLimit) {
    auto config = makeConfig();
    config.server.maxConnections = 1;
    auto server = startServer(config);

    TestConnection first(socketPath());
    first.send("svc-A\n");
    ASSERT_TRUE(
        waitUntil([&] { return server->counters().accepted.load() == 1; }));

    TestConnection second(socketPath());
    EXPECT_TRUE(second.closedByPeer());
    EXPECT_EQ(server->counters().rejected.load(), 1U);

    // The slot is released once the first client leaves.
    first.close();
    ASSERT_TRUE(waitUntil(
        [&] { return server->acceptor()->liveConnections() == 0; }));
    TestConnection third(socketPath());
    third.send("svc-D\n");
    third.sendEntry(LogLevel::Info, "after");
    ASSERT_TRUE(waitForEntries(1));
    EXPECT_EQ(activeEntries().front().daemon(), "svc-D");
}

TEST_F(LogServerTest, InterleavesConnectionsKeepingPerConnectionOrder) {
    auto server = startServer(makeConfig());
    constexpr int kPerConnection = 20;
    {
        TestConnection a(socketPath());
        TestConnection b(socketPath());
        a.send("svc-A\n");
        b.send("svc-B\n");
        for (int i = 0; i < kPerConnection; ++i) {
            a.sendEntry(LogLevel::Info, fmt::format("a-{}", i));
            b.sendEntry(LogLevel::Info, fmt::format("b-{}", i));
        }
        ASSERT_TRUE(waitForEntries(2 * kPerConnection));
    }

    int nextA = 0;
    int nextB = 0;
    for (const auto& entry : activeEntries()) {
        if (entry.daemon() == "svc-A") {
            EXPECT_EQ(entry.message(), fmt::format("a-{}", nextA++));
        } else {
            EXPECT_EQ(entry.daemon(), "svc-B");
            EXPECT_EQ(entry.message(), fmt::format("b-{}", nextB++));
        }
    }
    EXPECT_EQ(nextA, kPerConnection);
    EXPECT_EQ(nextB, kPerConnection);
}

TEST_F(LogServerTest, RotatesOnTheFourthEntry) {
    // Measure one record with the same shape first.
    size_t recordSize = 0;
    {
        auto server = startServer(makeConfig());
        TestConnection conn(socketPath());
        conn.send("svc-A\n");
        conn.sendEntry(LogLevel::Info, "message 0");
        ASSERT_TRUE(waitForEntries(1));
        recordSize = readLines(activeFile()).front().size() + 1;
        server->stop();
    }
    std::filesystem::remove_all(logDir());

    auto config = makeConfig();
    config.storage.maxFileSize = 3 * recordSize + recordSize / 2;
    auto server = startServer(config);
    TestConnection conn(socketPath());
    conn.send("svc-A\n");
    for (int i = 1; i <= 4; ++i) {
        conn.sendEntry(LogLevel::Info, fmt::format("message {}", i));
    }
    // Records are written in order, so the last one marks completion.
    ASSERT_TRUE(waitUntil([&] {
        const auto active = activeEntries();
        return !active.empty() && active.back().message() == "message 4";
    }));

    const RotationState state = server->rotationEngine()->flush().get();
    ASSERT_EQ(state.archived.size(), 1U);
    const auto archived = readLines(state.archived.front().path);
    ASSERT_EQ(archived.size(), 3U);
    EXPECT_EQ(parseJsonRecord(archived.back())->message(), "message 3");
    const auto active = activeEntries();
    ASSERT_EQ(active.size(), 1U);
    EXPECT_EQ(active.front().message(), "message 4");
    EXPECT_EQ(state.activeSize, recordSize);
}

TEST_F(LogServerTest, StopClosesSessionsAndRemovesSocket) {
    auto server = startServer(makeConfig());
    TestConnection conn(socketPath());
    conn.send("svc-A\n");
    conn.sendEntry(LogLevel::Notice, "before shutdown");
    ASSERT_TRUE(waitForEntries(1));
    ASSERT_TRUE(std::filesystem::exists(socketPath()));

    server->stop();
    EXPECT_TRUE(conn.closedByPeer());
    EXPECT_FALSE(std::filesystem::exists(socketPath()));
    EXPECT_EQ(server->counters().liveConnections.load(), 0U);

    // Idempotent, and a stopped server cannot be restarted.
    server->stop();
    EXPECT_EQ(server->start().code(), absl::StatusCode::kFailedPrecondition);
}

TEST_F(LogServerTest, RemovesStaleSocketFile) {
    writeFile(socketPath(), "stale");
    auto server = startServer(makeConfig());
    TestConnection conn(socketPath());
    conn.send("svc-A\n");
    conn.sendEntry(LogLevel::Info, "hello");
    EXPECT_TRUE(waitForEntries(1));
}

TEST_F(LogServerTest, InvalidConfigurationFailsToStart) {
    auto config = makeConfig();
    config.file.enabled = false;
    LogServer server(config);
    EXPECT_EQ(server.start().code(), absl::StatusCode::kInvalidArgument);
    EXPECT_FALSE(std::filesystem::exists(socketPath()));
}

TEST_F(LogServerTest, UnbindableSocketPathFailsToStart) {
    auto config = makeConfig();
    config.server.socketPath = (dir_ / "missing" / "logstream.sock").string();
    LogServer server(config);
    EXPECT_EQ(server.start().code(), absl::StatusCode::kUnavailable);
    EXPECT_FALSE(std::filesystem::exists(dir_ / "missing"));
    server.stop();
}

TEST(AcceptorTest, ConnectionCompletingAfterStopIsClosed) {
    TempDirectory dir;
    const std::string path = (dir / "acceptor.sock").string();
    boost::asio::io_context io;
    MessageRouter router({});
    ServerCounters counters;
    Acceptor acceptor(io, AcceptorOptions{path, 4, 1024, "host"}, router,
                      counters);
    ASSERT_TRUE(acceptor.start().ok());

    // Queued in the listen backlog; its accept completes after stop().
    TestConnection conn(path);
    acceptor.stop();
    io.run_for(std::chrono::seconds(2));

    EXPECT_TRUE(conn.closedByPeer());
    EXPECT_EQ(counters.accepted.load(), 0U);
    EXPECT_EQ(counters.liveConnections.load(), 0U);
}
