#pragma once

#include "board/core/types.h"

#include <cstdint>
#include <optional>
#include <string_view>

namespace board::geometry {

enum class ResizeHandle : std::uint8_t {
    None = 0,
    TopLeft,
    TopRight,
    BottomLeft,
    BottomRight,
    TopMiddle,
    BottomMiddle,
    LeftMiddle,
    RightMiddle,
    Rotate,
};

enum class CursorShape : std::uint8_t {
    Default = 0,
    Crosshair,
    Move,
    Grab,
    Grabbing,
    NsResize,
    NeswResize,
    EwResize,
    NwseResize,
    Rotate,
};

// Compass-style codes: "tl", "tr", "bl", "br", "tm", "bm", "lm", "rm", "rot".
const char* handleCode(ResizeHandle handle) noexcept;
std::optional<ResizeHandle> parseHandleCode(std::string_view code) noexcept;

const char* cursorName(CursorShape cursor) noexcept;

bool isCornerHandle(ResizeHandle handle) noexcept;
bool handleMovesLeft(ResizeHandle handle) noexcept;
bool handleMovesRight(ResizeHandle handle) noexcept;
bool handleMovesTop(ResizeHandle handle) noexcept;
bool handleMovesBottom(ResizeHandle handle) noexcept;

// Handle position in the element's local (unrotated) frame.
Point2 handleLocalPosition(ResizeHandle handle, const BoundingBox& bounds, float zoom, float rotateOffsetPx) noexcept;

// Handle position in canvas space, after applying the element rotation.
Point2 handleWorldPosition(ResizeHandle handle, const BoundingBox& bounds, float zoom, float rotation, float rotateOffsetPx) noexcept;

/**
 * Returns the first handle (tl, tr, bl, br, tm, bm, lm, rm, rot) whose
 * local-frame position lies within `thresholdPx / zoom` of `point` after the
 * point is rotated into the local frame, or None.
 */
ResizeHandle findResizeHandle(
    Point2 point,
    const BoundingBox& bounds,
    float zoom,
    float rotation,
    float thresholdPx,
    float rotateOffsetPx) noexcept;

// Quantizes (base angle + rotation) into one of four resize cursors.
CursorShape cursorForHandle(ResizeHandle handle, float rotation) noexcept;

} // namespace board::geometry
