#pragma once

#include <absl/status/statusor.h>

#include <ManagedThreads.hpp>
#include <atomic>
#include <condition_variable>
#include <deque>
#include <filesystem>
#include <functional>
#include <mutex>
#include <string>
#include <string_view>

namespace LogStream {

enum class CompressionAlgorithm {
    Gzip,
    Zstd,
};

absl::StatusOr<CompressionAlgorithm> parseCompressionAlgorithm(
    std::string_view text);
std::string_view compressionAlgorithmName(CompressionAlgorithm algorithm);
// ".gz" / ".zst"
std::string_view compressionExtension(CompressionAlgorithm algorithm);

// Compresses |source| into "<source><ext>". The artifact is written to
// "<source><ext>.tmp" and renamed when complete; the source is removed only
// after the rename succeeded. On failure the source is left untouched.
absl::StatusOr<std::filesystem::path> compressFile(
    const std::filesystem::path& source, CompressionAlgorithm algorithm);

// Reads a log file, transparently decompressing .gz and .zst archives.
absl::StatusOr<std::string> readLogFile(const std::filesystem::path& path);

struct CompressionResult {
    std::filesystem::path source;
    absl::StatusOr<std::filesystem::path> output;
};

// Background worker compressing rotated files one at a time, in submission
// order.
class Compressor : public ThreadRunner {
   public:
    using Callback = std::function<void(CompressionResult)>;

    explicit Compressor(CompressionAlgorithm algorithm);

    // Returns false if the worker no longer accepts jobs.
    bool submit(std::filesystem::path source, Callback done);

    [[nodiscard]] CompressionAlgorithm algorithm() const { return algorithm_; }

   protected:
    void runFunction(const std::stop_token& token) override;
    void onPreStop() override;
    void onAbort() override;

   private:
    struct Job {
        std::filesystem::path source;
        Callback done;
    };

    const CompressionAlgorithm algorithm_;
    std::mutex mutex_;
    std::condition_variable cv_;
    std::deque<Job> jobs_;
    bool accepting_ = true;
    std::atomic_bool aborted_ = false;
};

}  // namespace LogStream
