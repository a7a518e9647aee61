#pragma once

#include <string_view>

#include "entry/LogEntry.hpp"
#include "rotation/RotationEngine.hpp"

namespace LogStream {

// Durable backend: hands entries to the rotation engine of its file.
class FileBackend {
   public:
    static constexpr bool kDurable = true;
    using Completion = RotationEngine::Completion;

    explicit FileBackend(RotationEngine* engine);

    // |done| receives the outcome, possibly on the engine thread.
    void write(const LogEntry& entry, Completion done);

    [[nodiscard]] std::string_view name() const { return "file"; }

   private:
    RotationEngine* engine_;
};

}  // namespace LogStream
