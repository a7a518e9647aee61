#include "FileBackend.hpp"

#include <absl/status/status.h>

#include <utility>

namespace LogStream {

FileBackend::FileBackend(RotationEngine* engine) : engine_(engine) {}

void FileBackend::write(const LogEntry& entry, Completion done) {
    if (engine_ == nullptr) {
        done(absl::FailedPreconditionError("File backend has no engine"));
        return;
    }
    engine_->write(entry, std::move(done));
}

}  // namespace LogStream
