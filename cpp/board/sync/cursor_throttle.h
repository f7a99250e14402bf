#pragma once

#include "board/core/types.h"

#include <optional>

namespace board {

/**
 * Leading + trailing throttle for the local cursor broadcast.
 *
 * offer() returns the point to send right away when the interval since the
 * last transmission has elapsed; otherwise the point is kept as pending and
 * the latest pending point is released by flush() once the window closes.
 */
class CursorThrottle {
public:
    explicit CursorThrottle(double intervalMs) : intervalMs_(intervalMs) {}

    std::optional<Point2> offer(Point2 point, double nowMs);
    std::optional<Point2> flush(double nowMs);

    void reset() noexcept;
    bool hasPending() const noexcept { return pending_.has_value(); }
    double intervalMs() const noexcept { return intervalMs_; }

private:
    bool windowOpen(double nowMs) const noexcept;

    double intervalMs_;
    std::optional<double> lastSentMs_;
    std::optional<Point2> pending_;
};

} // namespace board
