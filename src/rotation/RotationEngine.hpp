#pragma once

#include <absl/status/status.h>

#include <ManagedThreads.hpp>
#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <filesystem>
#include <fstream>
#include <functional>
#include <future>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <variant>

#include "Compressor.hpp"
#include "RetentionPolicy.hpp"
#include "entry/EntryCodec.hpp"
#include "entry/LogEntry.hpp"

namespace LogStream {

struct RotationOptions {
    std::filesystem::path directory;
    std::string fileName = "logstream.log";
    uint64_t maxFileSize = 100ULL * 1024 * 1024;
    bool rotationEnabled = true;
    RetentionLimits limits;
    OutputFormat format = OutputFormat::Json;
};

// Snapshot of the engine-owned file state.
struct RotationState {
    std::filesystem::path activePath;
    uint64_t activeSize = 0;
    TimePoint createdAt;
    // Newest first.
    std::deque<ArchivedFile> archived;
};

/**
 * Owns the active log file of one file backend.
 *
 * All operations are requests queued to a single worker thread, which is
 * the only code touching the file handle and RotationState. Writes are
 * appended in submission order; when a record would push the active file
 * past maxFileSize the file is rotated first. Rotated files are optionally
 * handed to a Compressor, and retention removes archives beyond the
 * configured count or age.
 *
 * Usage: create through ThreadManager, call open(), then run().
 */
class RotationEngine : public ThreadRunner {
   public:
    using Completion = std::function<void(absl::Status)>;
    using RetentionDone = std::function<void(size_t removed)>;

    // |compressor| may be null to disable compression. It must outlive
    // the engine's worker thread.
    RotationEngine(RotationOptions options, Compressor* compressor);

    // Creates the output directory, opens (appends to) the active file and
    // loads archives already present in the directory.
    absl::Status open();

    // |done| runs on the worker thread once the record reached the OS, or
    // immediately with Cancelled when the engine is stopping.
    void write(LogEntry entry, Completion done);

    // Removes expired archives as of |now|.
    void requestRetention(TimePoint now, RetentionDone done = {});

    // Resolves after every previously queued request was processed.
    std::future<RotationState> flush();

    // Called by the compressor thread.
    void compressionFinished(CompressionResult result);

    [[nodiscard]] const RotationOptions& options() const { return options_; }

   protected:
    void runFunction(const std::stop_token& token) override;
    void onPreStop() override;
    void onAbort() override;

   private:
    struct WriteRequest {
        LogEntry entry;
        Completion done;
    };
    struct RetentionRequest {
        TimePoint now;
        RetentionDone done;
    };
    struct CompressionDoneRequest {
        CompressionResult result;
    };
    struct FlushRequest {
        std::shared_ptr<std::promise<RotationState>> promise;
    };
    using Request = std::variant<WriteRequest, RetentionRequest,
                                 CompressionDoneRequest, FlushRequest>;

    // Moves from |request| only when it was queued.
    bool enqueue(Request& request);
    void process(Request& request);
    void cancel(Request& request);

    absl::Status handleWrite(const LogEntry& entry);
    size_t handleRetention(TimePoint now);
    void handleCompressionDone(CompressionResult result);

    absl::Status openActive();
    absl::Status rotate();
    std::filesystem::path archivePathFor(TimePoint createdAt) const;
    void loadExistingArchives();
    void scheduleCompression(const std::filesystem::path& path);

    const RotationOptions options_;
    Compressor* const compressor_;

    // Worker-owned
    RotationState state_;
    std::ofstream active_;
    // Archives removed by retention while their compression was running.
    std::set<std::filesystem::path> pendingRemoval_;

    std::mutex queueMutex_;
    std::condition_variable queueCv_;
    std::deque<Request> queue_;
    bool accepting_ = true;
    std::atomic_bool aborted_ = false;
};

}  // namespace LogStream
