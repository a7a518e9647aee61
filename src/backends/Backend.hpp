#pragma once

#include <string_view>
#include <variant>

#include "FileBackend.hpp"
#include "JournaldBackend.hpp"
#include "SyslogBackend.hpp"

namespace LogStream {

// Closed set of output backends. Durable alternatives (kDurable) report
// their outcome through a completion callback; best-effort ones return it
// from write().
using Backend = std::variant<FileBackend, JournaldBackend, SyslogBackend>;

inline std::string_view backendName(const Backend& backend) {
    return std::visit([](const auto& b) { return b.name(); }, backend);
}

}  // namespace LogStream
