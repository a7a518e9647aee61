#include "RotationEngine.hpp"

#include <absl/strings/match.h>
#include <absl/strings/numbers.h>
#include <absl/strings/strip.h>
#include <fmt/format.h>

#include <algorithm>
#include <chrono>
#include <optional>
#include <system_error>
#include <utility>
#include <vector>

namespace LogStream {

namespace {

// "YYYYMMDD-HHMMSS.ffffff"
constexpr size_t kArchiveSuffixLength = 22;

template <class... Ts>
struct overloaded : Ts... {
    using Ts::operator()...;
};

bool pathTaken(const std::filesystem::path& base) {
    std::error_code ec;
    if (std::filesystem::exists(base, ec)) {
        return true;
    }
    for (const auto algorithm :
         {CompressionAlgorithm::Gzip, CompressionAlgorithm::Zstd}) {
        std::filesystem::path compressed = base;
        compressed += compressionExtension(algorithm);
        if (std::filesystem::exists(compressed, ec)) {
            return true;
        }
    }
    return false;
}

}  // namespace

RotationEngine::RotationEngine(RotationOptions options, Compressor* compressor)
    : options_(std::move(options)), compressor_(compressor) {}

absl::Status RotationEngine::open() {
    std::error_code ec;
    std::filesystem::create_directories(options_.directory, ec);
    if (ec) {
        return absl::UnavailableError(
            fmt::format("Cannot create output directory {}: {}",
                        options_.directory.string(), ec.message()));
    }
    state_.activePath = options_.directory / options_.fileName;
    if (auto status = openActive(); !status.ok()) {
        return status;
    }
    loadExistingArchives();
    LOG(INFO) << fmt::format(
        "Writing to {} (size {}, {} archive(s), format {})",
        state_.activePath.string(), state_.activeSize, state_.archived.size(),
        outputFormatName(options_.format));
    return absl::OkStatus();
}

absl::Status RotationEngine::openActive() {
    active_.clear();
    active_.open(state_.activePath, std::ios::binary | std::ios::app);
    if (!active_.is_open()) {
        return absl::InternalError(fmt::format(
            "Cannot open {} for writing", state_.activePath.string()));
    }
    std::error_code ec;
    const auto size = std::filesystem::file_size(state_.activePath, ec);
    state_.activeSize = ec ? 0 : size;
    state_.createdAt = nowMicros();
    if (state_.activeSize > 0) {
        // A file left by a previous run dates from its last write.
        const auto modified =
            std::filesystem::last_write_time(state_.activePath, ec);
        if (!ec) {
            state_.createdAt = std::chrono::time_point_cast<
                std::chrono::microseconds>(
                std::chrono::file_clock::to_sys(modified));
        }
    }
    return absl::OkStatus();
}

void RotationEngine::loadExistingArchives() {
    const std::string prefix = options_.fileName + ".";
    std::vector<std::filesystem::path> uncompressed;
    std::error_code ec;

    for (const auto& dirEntry :
         std::filesystem::directory_iterator(options_.directory, ec)) {
        if (!dirEntry.is_regular_file(ec)) {
            continue;
        }
        const std::string name = dirEntry.path().filename().string();
        if (!absl::StartsWith(name, prefix)) {
            continue;
        }
        absl::string_view rest(name);
        rest.remove_prefix(prefix.size());

        if (absl::EndsWith(rest, ".tmp")) {
            // Leftover of an interrupted compression.
            LOG(INFO) << "Removing stale " << dirEntry.path();
            std::filesystem::remove(dirEntry.path(), ec);
            continue;
        }
        bool compressed = false;
        for (const auto algorithm :
             {CompressionAlgorithm::Gzip, CompressionAlgorithm::Zstd}) {
            const std::string_view extension = compressionExtension(algorithm);
            if (absl::ConsumeSuffix(
                    &rest,
                    absl::string_view(extension.data(), extension.size()))) {
                compressed = true;
                break;
            }
        }
        if (rest.size() < kArchiveSuffixLength) {
            continue;
        }
        if (rest.size() > kArchiveSuffixLength) {
            absl::string_view counter = rest.substr(kArchiveSuffixLength);
            uint32_t unused = 0;
            if (!absl::ConsumePrefix(&counter, "-") ||
                !absl::SimpleAtoi(counter, &unused)) {
                continue;
            }
        }
        const absl::string_view suffix = rest.substr(0, kArchiveSuffixLength);
        auto createdAt =
            parseArchiveSuffix(std::string_view(suffix.data(), suffix.size()));
        if (!createdAt.ok()) {
            continue;
        }
        state_.archived.push_back({dirEntry.path(), *createdAt, false});
        if (!compressed) {
            uncompressed.push_back(dirEntry.path());
        }
    }
    if (ec) {
        LOG(WARNING) << fmt::format("Scanning {}: {}",
                                    options_.directory.string(), ec.message());
    }

    std::sort(state_.archived.begin(), state_.archived.end(),
              [](const ArchivedFile& a, const ArchivedFile& b) {
                  if (a.createdAt != b.createdAt) {
                      return a.createdAt > b.createdAt;
                  }
                  return a.path > b.path;
              });
    for (const auto& path : uncompressed) {
        scheduleCompression(path);
    }
}

std::filesystem::path RotationEngine::archivePathFor(TimePoint createdAt) const {
    const std::filesystem::path base =
        options_.directory /
        fmt::format("{}.{}", options_.fileName, formatArchiveSuffix(createdAt));
    if (!pathTaken(base)) {
        return base;
    }
    for (int n = 1;; ++n) {
        std::filesystem::path candidate = base;
        candidate += fmt::format("-{}", n);
        if (!pathTaken(candidate)) {
            return candidate;
        }
    }
}

void RotationEngine::scheduleCompression(const std::filesystem::path& path) {
    if (compressor_ == nullptr) {
        return;
    }
    auto it = std::find_if(
        state_.archived.begin(), state_.archived.end(),
        [&path](const ArchivedFile& file) { return file.path == path; });
    if (it == state_.archived.end()) {
        return;
    }
    it->compressing = compressor_->submit(
        path, [this](CompressionResult result) {
            compressionFinished(std::move(result));
        });
    if (!it->compressing) {
        LOG(WARNING) << "Compressor unavailable, keeping " << path
                     << " uncompressed";
    }
}

absl::Status RotationEngine::rotate() {
    active_.flush();
    active_.close();

    const TimePoint createdAt = state_.createdAt;
    const std::filesystem::path archivePath = archivePathFor(createdAt);
    std::error_code ec;
    std::filesystem::rename(state_.activePath, archivePath, ec);
    if (ec) {
        auto error = absl::InternalError(
            fmt::format("Cannot rotate {} to {}: {}",
                        state_.activePath.string(), archivePath.string(),
                        ec.message()));
        // Continue appending to the current file.
        if (auto status = openActive(); status.ok()) {
            state_.createdAt = createdAt;
        }
        return error;
    }
    state_.archived.push_front({archivePath, createdAt, false});
    LOG(INFO) << fmt::format("Rotated {} to {}", state_.activePath.string(),
                             archivePath.filename().string());

    auto status = openActive();
    scheduleCompression(archivePath);
    handleRetention(nowMicros());
    return status;
}

absl::Status RotationEngine::handleWrite(const LogEntry& entry) {
    std::string record = formatEntry(entry, options_.format);
    record.push_back('\n');

    if (!active_.is_open()) {
        if (auto status = openActive(); !status.ok()) {
            return status;
        }
    }
    if (options_.rotationEnabled && state_.activeSize > 0 &&
        state_.activeSize + record.size() > options_.maxFileSize) {
        if (auto status = rotate(); !status.ok()) {
            LOG(ERROR) << status;
            if (!active_.is_open()) {
                return status;
            }
        }
    }

    active_.write(record.data(), static_cast<std::streamsize>(record.size()));
    active_.flush();
    if (!active_) {
        active_.close();
        return absl::InternalError(fmt::format(
            "Write to {} failed", state_.activePath.string()));
    }
    state_.activeSize += record.size();
    return absl::OkStatus();
}

size_t RotationEngine::handleRetention(TimePoint now) {
    const auto expired = selectExpired(state_.archived, options_.limits, now);
    size_t removed = 0;

    for (auto it = expired.rbegin(); it != expired.rend(); ++it) {
        const auto position = state_.archived.begin() +
                              static_cast<std::ptrdiff_t>(*it);
        if (position->compressing) {
            // Deleted once the compressor is done with it.
            pendingRemoval_.insert(position->path);
        } else {
            std::error_code ec;
            std::filesystem::remove(position->path, ec);
            if (ec) {
                LOG(ERROR) << fmt::format("Cannot remove {}: {}",
                                          position->path.string(),
                                          ec.message());
                continue;
            }
            DLOG(INFO) << "Removed expired archive " << position->path;
        }
        state_.archived.erase(position);
        ++removed;
    }
    if (removed != 0) {
        LOG(INFO) << fmt::format("Retention removed {} archive(s), {} left",
                                 removed, state_.archived.size());
    }
    return removed;
}

void RotationEngine::handleCompressionDone(CompressionResult result) {
    if (pendingRemoval_.erase(result.source) != 0) {
        const std::filesystem::path& leftover =
            result.output.ok() ? *result.output : result.source;
        std::error_code ec;
        std::filesystem::remove(leftover, ec);
        if (ec) {
            LOG(ERROR) << fmt::format("Cannot remove {}: {}",
                                      leftover.string(), ec.message());
        }
        return;
    }
    for (auto& file : state_.archived) {
        if (file.path == result.source) {
            file.compressing = false;
            if (result.output.ok()) {
                file.path = *result.output;
            }
            return;
        }
    }
}

bool RotationEngine::enqueue(Request& request) {
    {
        std::lock_guard<std::mutex> lock(queueMutex_);
        if (!accepting_) {
            return false;
        }
        queue_.push_back(std::move(request));
    }
    queueCv_.notify_one();
    return true;
}

void RotationEngine::write(LogEntry entry, Completion done) {
    Request request = WriteRequest{std::move(entry), std::move(done)};
    if (!enqueue(request)) {
        cancel(request);
    }
}

void RotationEngine::requestRetention(TimePoint now, RetentionDone done) {
    Request request = RetentionRequest{now, std::move(done)};
    if (!enqueue(request)) {
        cancel(request);
    }
}

std::future<RotationState> RotationEngine::flush() {
    auto promise = std::make_shared<std::promise<RotationState>>();
    auto future = promise->get_future();
    Request request = FlushRequest{promise};
    if (!enqueue(request)) {
        LOG(WARNING) << "Flush requested on a stopped rotation engine";
        promise->set_value(RotationState{});
    }
    return future;
}

void RotationEngine::compressionFinished(CompressionResult result) {
    Request request = CompressionDoneRequest{std::move(result)};
    if (!enqueue(request)) {
        DLOG(INFO) << "Compression result arrived after shutdown";
    }
}

void RotationEngine::process(Request& request) {
    std::visit(overloaded{
                   [this](WriteRequest& r) {
                       auto status = handleWrite(r.entry);
                       if (!status.ok()) {
                           LOG(ERROR) << status;
                       }
                       if (r.done) {
                           r.done(status);
                       }
                   },
                   [this](RetentionRequest& r) {
                       const size_t removed = handleRetention(r.now);
                       if (r.done) {
                           r.done(removed);
                       }
                   },
                   [this](CompressionDoneRequest& r) {
                       handleCompressionDone(std::move(r.result));
                   },
                   [this](FlushRequest& r) { r.promise->set_value(state_); },
               },
               request);
}

void RotationEngine::cancel(Request& request) {
    std::visit(overloaded{
                   [](WriteRequest& r) {
                       if (r.done) {
                           r.done(absl::CancelledError(
                               "Rotation engine is shutting down"));
                       }
                   },
                   [](RetentionRequest& r) {
                       if (r.done) {
                           r.done(0);
                       }
                   },
                   [](CompressionDoneRequest&) {},
                   [this](FlushRequest& r) { r.promise->set_value(state_); },
               },
               request);
}

void RotationEngine::runFunction(const std::stop_token& token) {
    while (true) {
        std::optional<Request> request;
        {
            std::unique_lock<std::mutex> lock(queueMutex_);
            queueCv_.wait(lock, [&] {
                return !queue_.empty() || token.stop_requested() || aborted_;
            });
            if (aborted_ || queue_.empty()) {
                break;
            }
            request.emplace(std::move(queue_.front()));
            queue_.pop_front();
        }
        process(*request);
    }

    std::deque<Request> leftover;
    {
        std::lock_guard<std::mutex> lock(queueMutex_);
        accepting_ = false;
        leftover.swap(queue_);
    }
    if (!leftover.empty()) {
        LOG(WARNING) << fmt::format("Abandoning {} queued request(s)",
                                    leftover.size());
    }
    for (auto& request : leftover) {
        cancel(request);
    }
    if (active_.is_open()) {
        active_.flush();
        active_.close();
    }
    LOG(INFO) << "Rotation engine stopped";
}

void RotationEngine::onPreStop() {
    {
        std::lock_guard<std::mutex> lock(queueMutex_);
        accepting_ = false;
    }
    queueCv_.notify_all();
}

void RotationEngine::onAbort() {
    {
        std::lock_guard<std::mutex> lock(queueMutex_);
        aborted_ = true;
    }
    queueCv_.notify_all();
}

}  // namespace LogStream
