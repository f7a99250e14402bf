#include "board/geometry/handles.h"

#include "board/core/util.h"
#include "board/geometry/geometry.h"
#include "board/interaction/interaction_constants.h"

#include <cmath>

namespace board::geometry {

namespace {

constexpr ResizeHandle kSearchOrder[] = {
    ResizeHandle::TopLeft,
    ResizeHandle::TopRight,
    ResizeHandle::BottomLeft,
    ResizeHandle::BottomRight,
    ResizeHandle::TopMiddle,
    ResizeHandle::BottomMiddle,
    ResizeHandle::LeftMiddle,
    ResizeHandle::RightMiddle,
    ResizeHandle::Rotate,
};

inline float safeZoom(float zoom) noexcept {
    return (zoom > 1e-6f && std::isfinite(zoom)) ? zoom : 1.0f;
}

bool baseAngleFor(ResizeHandle handle, float& out) noexcept {
    using namespace interaction_constants;
    switch (handle) {
        case ResizeHandle::TopMiddle: out = CursorBaseAngle::TOP_MIDDLE; return true;
        case ResizeHandle::TopRight: out = CursorBaseAngle::TOP_RIGHT; return true;
        case ResizeHandle::RightMiddle: out = CursorBaseAngle::RIGHT_MIDDLE; return true;
        case ResizeHandle::BottomRight: out = CursorBaseAngle::BOTTOM_RIGHT; return true;
        case ResizeHandle::BottomMiddle: out = CursorBaseAngle::BOTTOM_MIDDLE; return true;
        case ResizeHandle::BottomLeft: out = CursorBaseAngle::BOTTOM_LEFT; return true;
        case ResizeHandle::LeftMiddle: out = CursorBaseAngle::LEFT_MIDDLE; return true;
        case ResizeHandle::TopLeft: out = CursorBaseAngle::TOP_LEFT; return true;
        default: return false;
    }
}

} // namespace

const char* handleCode(ResizeHandle handle) noexcept {
    switch (handle) {
        case ResizeHandle::TopLeft: return "tl";
        case ResizeHandle::TopRight: return "tr";
        case ResizeHandle::BottomLeft: return "bl";
        case ResizeHandle::BottomRight: return "br";
        case ResizeHandle::TopMiddle: return "tm";
        case ResizeHandle::BottomMiddle: return "bm";
        case ResizeHandle::LeftMiddle: return "lm";
        case ResizeHandle::RightMiddle: return "rm";
        case ResizeHandle::Rotate: return "rot";
        case ResizeHandle::None: break;
    }
    return "";
}

std::optional<ResizeHandle> parseHandleCode(std::string_view code) noexcept {
    for (const ResizeHandle h : kSearchOrder) {
        if (code == handleCode(h)) return h;
    }
    return std::nullopt;
}

const char* cursorName(CursorShape cursor) noexcept {
    switch (cursor) {
        case CursorShape::Default: return "default";
        case CursorShape::Crosshair: return "crosshair";
        case CursorShape::Move: return "move";
        case CursorShape::Grab: return "grab";
        case CursorShape::Grabbing: return "grabbing";
        case CursorShape::NsResize: return "ns-resize";
        case CursorShape::NeswResize: return "nesw-resize";
        case CursorShape::EwResize: return "ew-resize";
        case CursorShape::NwseResize: return "nwse-resize";
        case CursorShape::Rotate: return "rotate";
    }
    return "default";
}

bool isCornerHandle(ResizeHandle handle) noexcept {
    return handle == ResizeHandle::TopLeft || handle == ResizeHandle::TopRight ||
           handle == ResizeHandle::BottomLeft || handle == ResizeHandle::BottomRight;
}

bool handleMovesLeft(ResizeHandle handle) noexcept {
    return handle == ResizeHandle::TopLeft || handle == ResizeHandle::BottomLeft ||
           handle == ResizeHandle::LeftMiddle;
}

bool handleMovesRight(ResizeHandle handle) noexcept {
    return handle == ResizeHandle::TopRight || handle == ResizeHandle::BottomRight ||
           handle == ResizeHandle::RightMiddle;
}

bool handleMovesTop(ResizeHandle handle) noexcept {
    return handle == ResizeHandle::TopLeft || handle == ResizeHandle::TopRight ||
           handle == ResizeHandle::TopMiddle;
}

bool handleMovesBottom(ResizeHandle handle) noexcept {
    return handle == ResizeHandle::BottomLeft || handle == ResizeHandle::BottomRight ||
           handle == ResizeHandle::BottomMiddle;
}

Point2 handleLocalPosition(ResizeHandle handle, const BoundingBox& bounds, float zoom, float rotateOffsetPx) noexcept {
    const float cx = bounds.centerX();
    const float cy = bounds.centerY();
    switch (handle) {
        case ResizeHandle::TopLeft: return {bounds.minX, bounds.minY};
        case ResizeHandle::TopRight: return {bounds.maxX, bounds.minY};
        case ResizeHandle::BottomLeft: return {bounds.minX, bounds.maxY};
        case ResizeHandle::BottomRight: return {bounds.maxX, bounds.maxY};
        case ResizeHandle::TopMiddle: return {cx, bounds.minY};
        case ResizeHandle::BottomMiddle: return {cx, bounds.maxY};
        case ResizeHandle::LeftMiddle: return {bounds.minX, cy};
        case ResizeHandle::RightMiddle: return {bounds.maxX, cy};
        case ResizeHandle::Rotate: return {cx, bounds.minY - rotateOffsetPx / safeZoom(zoom)};
        case ResizeHandle::None: break;
    }
    return {cx, cy};
}

Point2 handleWorldPosition(ResizeHandle handle, const BoundingBox& bounds, float zoom, float rotation, float rotateOffsetPx) noexcept {
    return rotatePoint(handleLocalPosition(handle, bounds, zoom, rotateOffsetPx), bounds.center(), rotation);
}

ResizeHandle findResizeHandle(
    Point2 point,
    const BoundingBox& bounds,
    float zoom,
    float rotation,
    float thresholdPx,
    float rotateOffsetPx) noexcept {
    const float threshold = thresholdPx / safeZoom(zoom);
    const Point2 local = rotatePoint(point, bounds.center(), -rotation);

    for (const ResizeHandle h : kSearchOrder) {
        const Point2 pos = handleLocalPosition(h, bounds, zoom, rotateOffsetPx);
        if (std::hypot(local.x - pos.x, local.y - pos.y) < threshold) {
            return h;
        }
    }
    return ResizeHandle::None;
}

CursorShape cursorForHandle(ResizeHandle handle, float rotation) noexcept {
    if (handle == ResizeHandle::None) return CursorShape::Default;
    if (handle == ResizeHandle::Rotate) return CursorShape::Rotate;

    float base = 0.0f;
    if (!baseAngleFor(handle, base)) return CursorShape::Default;

    const float total = normalizeDegrees(base + (std::isfinite(rotation) ? rotation : 0.0f));

    if (total > 337.5f || total <= 22.5f) return CursorShape::NsResize;
    if (total <= 67.5f) return CursorShape::NeswResize;
    if (total <= 112.5f) return CursorShape::EwResize;
    if (total <= 157.5f) return CursorShape::NwseResize;
    if (total <= 202.5f) return CursorShape::NsResize;
    if (total <= 247.5f) return CursorShape::NeswResize;
    if (total <= 292.5f) return CursorShape::EwResize;
    return CursorShape::NwseResize;
}

} // namespace board::geometry
