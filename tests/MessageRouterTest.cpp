#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <ManagedThreads.hpp>
#include <future>
#include <vector>

#include "TestUtils.hpp"
#include "entry/EntryCodec.hpp"
#include "mocks/StatusMatchers.hpp"
#include "router/MessageRouter.hpp"

using namespace LogStream;

class MessageRouterTest : public testing::Test {
   protected:
    RotationEngine* startEngine(std::filesystem::path directory,
                                std::string fileName = "logstream.log") {
        RotationOptions options;
        options.directory = std::move(directory);
        options.fileName = std::move(fileName);
        auto* engine = manager_.create<RotationEngine>(
            ThreadManager::Usage::ROTATION_ENGINE, std::move(options),
            nullptr);
        if (engine == nullptr || !engine->open().ok()) {
            ADD_FAILURE() << "Cannot start rotation engine";
            return nullptr;
        }
        engine->run();
        return engine;
    }

    static LogEntry makeEntry(int seq) {
        return LogEntry::fromPartial({LogLevel::Info,
                                      fmt::format("entry {}", seq),
                                      {},
                                      std::nullopt,
                                      std::nullopt},
                                     "svc-A", nowMicros(), "host");
    }

    TempDirectory dir_;
    ThreadManager manager_;
};

TEST_F(MessageRouterTest, WithoutFileBackendCompletesImmediately) {
    MessageRouter router({});
    MockCompletion done;
    EXPECT_CALL(done, Call(IsOk()));
    router.route(makeEntry(0), done.AsStdFunction());
    testing::Mock::VerifyAndClearExpectations(&done);

    const auto stats = router.stats();
    EXPECT_EQ(stats.routed, 1U);
    EXPECT_EQ(stats.fileFailures, 0U);
    EXPECT_EQ(stats.auxFailures, 0U);
    EXPECT_EQ(router.backendCount(), 0U);
}

TEST_F(MessageRouterTest, FileBackendReceivesEntriesInOrder) {
    auto* engine = startEngine(dir_.path());
    ASSERT_NE(engine, nullptr);
    std::vector<Backend> backends;
    backends.emplace_back(std::in_place_type<FileBackend>, engine);
    MessageRouter router(std::move(backends));

    MockCompletion done;
    EXPECT_CALL(done, Call(IsOk())).Times(50);
    for (int i = 0; i < 50; ++i) {
        router.route(makeEntry(i), done.AsStdFunction());
    }
    const auto state = engine->flush().get();
    const auto lines = readLines(state.activePath);
    ASSERT_EQ(lines.size(), 50U);
    for (int i = 0; i < 50; ++i) {
        auto entry = parseJsonRecord(lines[i]);
        ASSERT_TRUE(entry.ok()) << entry.status();
        EXPECT_EQ(entry->message(), fmt::format("entry {}", i));
    }
    EXPECT_EQ(router.stats().routed, 50U);
}

TEST_F(MessageRouterTest, AuxiliaryFailureDoesNotAffectFile) {
    auto* engine = startEngine(dir_.path());
    ASSERT_NE(engine, nullptr);
    std::vector<Backend> backends;
    backends.emplace_back(std::in_place_type<JournaldBackend>, "logstream",
                          (dir_ / "no-journal.sock").string());
    backends.emplace_back(std::in_place_type<FileBackend>, engine);
    MessageRouter router(std::move(backends));

    MockCompletion done;
    EXPECT_CALL(done, Call(IsOk())).Times(2);
    router.route(makeEntry(0), done.AsStdFunction());
    router.route(makeEntry(1), done.AsStdFunction());
    const auto state = engine->flush().get();

    EXPECT_EQ(readLines(state.activePath).size(), 2U);
    const auto stats = router.stats();
    EXPECT_EQ(stats.routed, 2U);
    EXPECT_EQ(stats.auxFailures, 2U);
    EXPECT_EQ(stats.fileFailures, 0U);
}

TEST_F(MessageRouterTest, FileFailureReachesCaller) {
    if (!std::filesystem::exists("/dev/full")) {
        GTEST_SKIP() << "/dev/full is not available";
    }
    auto* engine = startEngine("/dev", "full");
    ASSERT_NE(engine, nullptr);
    std::vector<Backend> backends;
    backends.emplace_back(std::in_place_type<FileBackend>, engine);
    MessageRouter router(std::move(backends));

    std::promise<absl::Status> outcome;
    router.route(makeEntry(0), [&outcome](absl::Status status) {
        outcome.set_value(std::move(status));
    });
    auto future = outcome.get_future();
    ASSERT_EQ(future.wait_for(std::chrono::seconds(5)),
              std::future_status::ready);
    EXPECT_EQ(future.get().code(), absl::StatusCode::kInternal);
    EXPECT_EQ(router.stats().fileFailures, 1U);
}
