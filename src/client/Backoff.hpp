#pragma once

#include <chrono>

namespace LogStream {

// Delay between reconnection attempts: initial, initial*factor, ... capped
// at max. reset() goes back to the initial delay.
class ExponentialBackoff {
   public:
    ExponentialBackoff(std::chrono::milliseconds initial,
                       std::chrono::milliseconds max, unsigned factor = 2);

    // Returns the delay to wait before the next attempt and advances.
    std::chrono::milliseconds nextDelay();
    [[nodiscard]] std::chrono::milliseconds peek() const { return current_; }
    [[nodiscard]] unsigned attempt() const { return attempt_; }
    void reset();

   private:
    std::chrono::milliseconds initial_;
    std::chrono::milliseconds max_;
    unsigned factor_;
    std::chrono::milliseconds current_;
    unsigned attempt_ = 0;
};

}  // namespace LogStream
