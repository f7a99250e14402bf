#include "board/sync/cursor_throttle.h"

namespace board {

bool CursorThrottle::windowOpen(double nowMs) const noexcept {
    if (!lastSentMs_) return true;
    const double elapsed = nowMs - *lastSentMs_;
    // A clock that went backwards reopens the window.
    return elapsed >= intervalMs_ || elapsed < 0.0;
}

std::optional<Point2> CursorThrottle::offer(Point2 point, double nowMs) {
    if (windowOpen(nowMs)) {
        pending_.reset();
        lastSentMs_ = nowMs;
        return point;
    }
    pending_ = point;
    return std::nullopt;
}

std::optional<Point2> CursorThrottle::flush(double nowMs) {
    if (!pending_ || !windowOpen(nowMs)) return std::nullopt;
    const Point2 out = *pending_;
    pending_.reset();
    lastSentMs_ = nowMs;
    return out;
}

void CursorThrottle::reset() noexcept {
    lastSentMs_.reset();
    pending_.reset();
}

} // namespace board
