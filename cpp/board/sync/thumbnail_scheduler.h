#pragma once

#include <optional>

namespace board {

// Trailing debounce: every touch() restarts the timer; due() fires once after
// the board has been quiet for the configured delay.
class ThumbnailScheduler {
public:
    explicit ThumbnailScheduler(double delayMs) : delayMs_(delayMs) {}

    void touch(double nowMs) noexcept { deadlineMs_ = nowMs + delayMs_; }
    void cancel() noexcept { deadlineMs_.reset(); }
    bool armed() const noexcept { return deadlineMs_.has_value(); }

    // True once per armed period, when nowMs has reached the deadline.
    bool due(double nowMs) noexcept {
        if (!deadlineMs_ || nowMs < *deadlineMs_) return false;
        deadlineMs_.reset();
        return true;
    }

private:
    double delayMs_;
    std::optional<double> deadlineMs_;
};

} // namespace board
