#include "Compressor.hpp"

#include <absl/status/status.h>
#include <absl/strings/ascii.h>
#include <fmt/format.h>

#include <boost/iostreams/copy.hpp>
#include <boost/iostreams/filter/gzip.hpp>
#include <boost/iostreams/filter/zstd.hpp>
#include <boost/iostreams/filtering_stream.hpp>
#include <fstream>
#include <iterator>
#include <sstream>
#include <system_error>
#include <utility>

namespace LogStream {

namespace io = boost::iostreams;

absl::StatusOr<CompressionAlgorithm> parseCompressionAlgorithm(
    std::string_view text) {
    const std::string lowered =
        absl::AsciiStrToLower(absl::string_view(text.data(), text.size()));
    if (lowered == "gzip" || lowered == "gz") {
        return CompressionAlgorithm::Gzip;
    }
    if (lowered == "zstd" || lowered == "zst") {
        return CompressionAlgorithm::Zstd;
    }
    return absl::InvalidArgumentError(fmt::format(
        "Unknown compression algorithm '{}' (gzip, zstd)", text));
}

std::string_view compressionAlgorithmName(CompressionAlgorithm algorithm) {
    switch (algorithm) {
        case CompressionAlgorithm::Gzip:
            return "gzip";
        case CompressionAlgorithm::Zstd:
            return "zstd";
    }
    return "unknown";
}

std::string_view compressionExtension(CompressionAlgorithm algorithm) {
    switch (algorithm) {
        case CompressionAlgorithm::Gzip:
            return ".gz";
        case CompressionAlgorithm::Zstd:
            return ".zst";
    }
    return "";
}

absl::StatusOr<std::filesystem::path> compressFile(
    const std::filesystem::path& source, CompressionAlgorithm algorithm) {
    std::filesystem::path target = source;
    target += compressionExtension(algorithm);
    std::filesystem::path temporary = target;
    temporary += ".tmp";
    std::error_code ec;

    auto fail = [&](const std::string& what) {
        std::filesystem::remove(temporary, ec);
        return absl::InternalError(
            fmt::format("Compressing {}: {}", source.string(), what));
    };

    std::ifstream input(source, std::ios::binary);
    if (!input) {
        return fail("cannot open source");
    }
    std::ofstream output(temporary, std::ios::binary | std::ios::trunc);
    if (!output) {
        return fail("cannot create " + temporary.string());
    }

    try {
        io::filtering_ostream stream;
        switch (algorithm) {
            case CompressionAlgorithm::Gzip:
                stream.push(io::gzip_compressor());
                break;
            case CompressionAlgorithm::Zstd:
                stream.push(io::zstd_compressor());
                break;
        }
        stream.push(output);
        io::copy(input, stream);
    } catch (const io::gzip_error& e) {
        return fail(e.what());
    } catch (const io::zstd_error& e) {
        return fail(e.what());
    } catch (const std::ios_base::failure& e) {
        return fail(e.what());
    }
    output.close();
    if (input.bad() || output.fail()) {
        return fail("I/O error");
    }

    std::filesystem::rename(temporary, target, ec);
    if (ec) {
        return fail("rename: " + ec.message());
    }
    if (!std::filesystem::remove(source, ec) && ec) {
        // Both copies exist; nothing is lost.
        LOG(WARNING) << fmt::format("Cannot remove {} after compression: {}",
                                    source.string(), ec.message());
    }
    return target;
}

absl::StatusOr<std::string> readLogFile(const std::filesystem::path& path) {
    std::ifstream input(path, std::ios::binary);
    if (!input) {
        return absl::NotFoundError(
            fmt::format("Cannot open {}", path.string()));
    }
    const std::string extension = path.extension().string();
    std::ostringstream content;
    try {
        io::filtering_istream stream;
        if (extension == compressionExtension(CompressionAlgorithm::Gzip)) {
            stream.push(io::gzip_decompressor());
        } else if (extension ==
                   compressionExtension(CompressionAlgorithm::Zstd)) {
            stream.push(io::zstd_decompressor());
        }
        stream.push(input);
        io::copy(stream, content);
    } catch (const io::gzip_error& e) {
        return absl::DataLossError(
            fmt::format("{}: {}", path.string(), e.what()));
    } catch (const io::zstd_error& e) {
        return absl::DataLossError(
            fmt::format("{}: {}", path.string(), e.what()));
    } catch (const std::ios_base::failure& e) {
        return absl::InternalError(
            fmt::format("{}: {}", path.string(), e.what()));
    }
    return content.str();
}

Compressor::Compressor(CompressionAlgorithm algorithm)
    : algorithm_(algorithm) {}

bool Compressor::submit(std::filesystem::path source, Callback done) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!accepting_) {
            return false;
        }
        jobs_.push_back({std::move(source), std::move(done)});
    }
    cv_.notify_one();
    return true;
}

void Compressor::runFunction(const std::stop_token& token) {
    while (true) {
        Job job;
        {
            std::unique_lock<std::mutex> lock(mutex_);
            cv_.wait(lock, [&] {
                return !jobs_.empty() || token.stop_requested() || aborted_;
            });
            if (aborted_ || jobs_.empty()) {
                break;
            }
            job = std::move(jobs_.front());
            jobs_.pop_front();
        }
        DLOG(INFO) << "Compressing " << job.source;
        auto output = compressFile(job.source, algorithm_);
        if (!output.ok()) {
            LOG(ERROR) << output.status();
        }
        if (job.done) {
            job.done({job.source, std::move(output)});
        }
    }

    std::lock_guard<std::mutex> lock(mutex_);
    if (!jobs_.empty()) {
        LOG(WARNING) << fmt::format(
            "Compressor exiting with {} file(s) left uncompressed",
            jobs_.size());
        jobs_.clear();
    }
}

void Compressor::onPreStop() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        accepting_ = false;
    }
    cv_.notify_all();
}

void Compressor::onAbort() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        aborted_ = true;
    }
    cv_.notify_all();
}

}  // namespace LogStream
