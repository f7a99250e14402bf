#ifndef BOARD_CORE_UTIL_H
#define BOARD_CORE_UTIL_H

#include <cmath>

#ifdef EMSCRIPTEN
#include <emscripten/emscripten.h>
#else
#include <chrono>
// Polyfill for native builds and tests
inline double emscripten_get_now() {
    using namespace std::chrono;
    return duration_cast<duration<double, std::milli>>(system_clock::now().time_since_epoch()).count();
}
#endif

namespace board {

constexpr float kPi = 3.14159265358979323846f;
constexpr float kDegToRad = kPi / 180.0f;
constexpr float kRadToDeg = 180.0f / kPi;

// Wall clock in milliseconds, used for element timestamps.
inline double nowMs() {
    return emscripten_get_now();
}

inline bool isFinite(float v) noexcept {
    return std::isfinite(v);
}

// Normalizes an angle in degrees into [0, 360).
inline float normalizeDegrees(float deg) noexcept {
    float r = std::fmod(deg, 360.0f);
    if (r < 0.0f) r += 360.0f;
    if (r >= 360.0f) r -= 360.0f;
    return r;
}

} // namespace board

#endif // BOARD_CORE_UTIL_H
