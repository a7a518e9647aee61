#pragma once

#include <absl/status/status.h>

#include <cstddef>
#include <deque>
#include <optional>
#include <string>
#include <string_view>

namespace LogStream {

// Splits a byte stream into '\n' terminated lines. A trailing '\r' is
// stripped. Lines longer than the limit are a protocol violation; once
// feed() failed the framer must be discarded.
class LineFramer {
   public:
    LineFramer(size_t initialCapacity, size_t maxLineLength);

    absl::Status feed(std::string_view data);
    std::optional<std::string> nextLine();

    [[nodiscard]] bool hasLine() const { return !lines_.empty(); }
    // Bytes of the unterminated tail.
    [[nodiscard]] size_t pending() const { return partial_.size(); }
    [[nodiscard]] size_t maxLineLength() const { return maxLineLength_; }

   private:
    std::string partial_;
    std::deque<std::string> lines_;
    size_t maxLineLength_;
};

}  // namespace LogStream
