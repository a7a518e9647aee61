#include <gtest/gtest.h>

#include <ManagedThreads.hpp>
#include <future>
#include <mutex>
#include <string>
#include <vector>

#include "TestUtils.hpp"
#include "entry/EntryCodec.hpp"
#include "rotation/Compressor.hpp"

using namespace LogStream;

class CompressFileTest : public testing::TestWithParam<CompressionAlgorithm> {
   protected:
    TempDirectory dir_;
};

TEST_P(CompressFileTest, CompressesAndRemovesSource) {
    const auto source = dir_ / "logstream.log.20260101-000000.000000";
    std::string content;
    for (int i = 0; i < 500; ++i) {
        content += fmt::format("line {} of the rotated file\n", i);
    }
    writeFile(source, content);

    auto output = compressFile(source, GetParam());
    ASSERT_TRUE(output.ok()) << output.status();
    EXPECT_EQ(output->extension().string(), compressionExtension(GetParam()));
    EXPECT_FALSE(std::filesystem::exists(source));
    std::filesystem::path temporary = *output;
    temporary += ".tmp";
    EXPECT_FALSE(std::filesystem::exists(temporary));
    EXPECT_LT(std::filesystem::file_size(*output), content.size());

    auto decompressed = readLogFile(*output);
    ASSERT_TRUE(decompressed.ok()) << decompressed.status();
    EXPECT_EQ(*decompressed, content);
}

TEST_P(CompressFileTest, PersistedEntrySurvivesCompression) {
    const LogEntry entry("5d1c0c53-2f7e-4a43-8d8c-4a9a3d1f0e21", nowMicros(),
                         LogLevel::Critical, "svc-A", "power lost",
                         {{"rack", "7"}}, 99, "node-7");
    const auto source = dir_ / "logstream.log.20260101-000000.000001";
    writeFile(source, formatJson(entry) + "\n");

    auto output = compressFile(source, GetParam());
    ASSERT_TRUE(output.ok()) << output.status();
    const auto lines = readLines(*output);
    ASSERT_EQ(lines.size(), 1U);
    auto parsed = parseJsonRecord(lines[0]);
    ASSERT_TRUE(parsed.ok()) << parsed.status();
    EXPECT_EQ(parsed->id(), entry.id());
    EXPECT_EQ(parsed->timestamp(), entry.timestamp());
    EXPECT_EQ(parsed->daemon(), entry.daemon());
    EXPECT_EQ(*parsed, entry);
}

TEST_P(CompressFileTest, MissingSourceFailsWithoutLeftovers) {
    const auto source = dir_ / "does-not-exist";
    auto output = compressFile(source, GetParam());
    EXPECT_EQ(output.status().code(), absl::StatusCode::kInternal);
    EXPECT_TRUE(std::filesystem::is_empty(dir_.path()));
}

TEST_P(CompressFileTest, FailedRenameKeepsSource) {
    const auto source = dir_ / "logstream.log.20260101-000000.000002";
    const std::string content = "first\nsecond\n";
    writeFile(source, content);
    // A directory occupying the final name makes the rename fail.
    std::filesystem::path target = source;
    target += compressionExtension(GetParam());
    std::filesystem::create_directories(target / "occupied");

    auto output = compressFile(source, GetParam());
    EXPECT_EQ(output.status().code(), absl::StatusCode::kInternal);
    ASSERT_TRUE(std::filesystem::exists(source));
    auto kept = readLogFile(source);
    ASSERT_TRUE(kept.ok()) << kept.status();
    EXPECT_EQ(*kept, content);
    std::filesystem::path temporary = target;
    temporary += ".tmp";
    EXPECT_FALSE(std::filesystem::exists(temporary));
    EXPECT_TRUE(std::filesystem::is_directory(target));
}

INSTANTIATE_TEST_SUITE_P(Algorithms, CompressFileTest,
                         testing::Values(CompressionAlgorithm::Gzip,
                                         CompressionAlgorithm::Zstd));

TEST(CompressionAlgorithmTest, Names) {
    EXPECT_EQ(parseCompressionAlgorithm("gzip").value(),
              CompressionAlgorithm::Gzip);
    EXPECT_EQ(parseCompressionAlgorithm("ZSTD").value(),
              CompressionAlgorithm::Zstd);
    EXPECT_FALSE(parseCompressionAlgorithm("lz4").ok());
    EXPECT_EQ(compressionAlgorithmName(CompressionAlgorithm::Zstd), "zstd");
    EXPECT_EQ(compressionExtension(CompressionAlgorithm::Gzip), ".gz");
}

TEST(ReadLogFileTest, PlainFileAndMissingFile) {
    TempDirectory dir;
    writeFile(dir / "plain.log", "a\nb\n");
    EXPECT_EQ(readLogFile(dir / "plain.log").value(), "a\nb\n");
    EXPECT_EQ(readLogFile(dir / "missing.log").status().code(),
              absl::StatusCode::kNotFound);
}

TEST(ReadLogFileTest, CorruptArchiveIsReported) {
    TempDirectory dir;
    writeFile(dir / "broken.log.gz", "definitely not gzip");
    EXPECT_FALSE(readLogFile(dir / "broken.log.gz").ok());
}

TEST(CompressorWorkerTest, ProcessesJobsInOrder) {
    TempDirectory dir;
    ThreadManager manager;
    auto* compressor = manager.create<Compressor>(
        ThreadManager::Usage::COMPRESSOR, CompressionAlgorithm::Gzip);
    ASSERT_NE(compressor, nullptr);
    compressor->run();

    std::mutex mutex;
    std::vector<std::filesystem::path> finished;
    std::promise<void> allDone;
    constexpr int kJobs = 3;

    for (int i = 0; i < kJobs; ++i) {
        const auto path = dir / fmt::format("archive.{}", i);
        writeFile(path, fmt::format("content {}\n", i));
        ASSERT_TRUE(compressor->submit(path, [&](CompressionResult result) {
            EXPECT_TRUE(result.output.ok()) << result.output.status();
            std::lock_guard<std::mutex> lock(mutex);
            finished.push_back(result.source);
            if (finished.size() == static_cast<size_t>(kJobs)) {
                allDone.set_value();
            }
        }));
    }
    ASSERT_EQ(allDone.get_future().wait_for(std::chrono::seconds(10)),
              std::future_status::ready);
    for (int i = 0; i < kJobs; ++i) {
        EXPECT_EQ(finished[i], dir / fmt::format("archive.{}", i));
        EXPECT_TRUE(
            std::filesystem::exists(dir / fmt::format("archive.{}.gz", i)));
    }
    EXPECT_TRUE(manager.destroy());
}
