#include "Backoff.hpp"

#include <algorithm>

namespace LogStream {

ExponentialBackoff::ExponentialBackoff(std::chrono::milliseconds initial,
                                       std::chrono::milliseconds max,
                                       unsigned factor)
    : initial_(initial),
      max_(std::max(initial, max)),
      factor_(std::max(factor, 1U)),
      current_(initial) {}

std::chrono::milliseconds ExponentialBackoff::nextDelay() {
    const auto delay = current_;
    ++attempt_;
    // Saturate before multiplying so the count cannot overflow.
    if (current_ > max_ / factor_) {
        current_ = max_;
    } else {
        current_ = std::min(current_ * factor_, max_);
    }
    return delay;
}

void ExponentialBackoff::reset() {
    current_ = initial_;
    attempt_ = 0;
}

}  // namespace LogStream
