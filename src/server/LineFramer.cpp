#include "LineFramer.hpp"

#include <fmt/format.h>

#include <utility>

namespace LogStream {

LineFramer::LineFramer(size_t initialCapacity, size_t maxLineLength)
    : maxLineLength_(maxLineLength) {
    partial_.reserve(initialCapacity);
}

absl::Status LineFramer::feed(std::string_view data) {
    while (!data.empty()) {
        const auto newline = data.find('\n');
        const std::string_view chunk = data.substr(0, newline);
        if (partial_.size() + chunk.size() > maxLineLength_) {
            partial_.clear();
            return absl::ResourceExhaustedError(fmt::format(
                "Line exceeds {} bytes", maxLineLength_));
        }
        partial_.append(chunk);
        if (newline == std::string_view::npos) {
            break;
        }
        if (!partial_.empty() && partial_.back() == '\r') {
            partial_.pop_back();
        }
        lines_.push_back(std::move(partial_));
        partial_.clear();
        data.remove_prefix(newline + 1);
    }
    return absl::OkStatus();
}

std::optional<std::string> LineFramer::nextLine() {
    if (lines_.empty()) {
        return std::nullopt;
    }
    std::string line = std::move(lines_.front());
    lines_.pop_front();
    return line;
}

}  // namespace LogStream
