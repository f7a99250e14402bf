#include "board/interaction/transform_engine.h"

#include "board/geometry/geometry.h"

#include <cmath>

namespace board {

using geometry::ResizeHandle;

namespace {

constexpr float kMinExtent = 1e-6f;

// Box in a local frame; width/height may be negative before normalization.
struct LocalBox {
    float x;
    float y;
    float w;
    float h;
};

// Point of `box` that stays fixed while `handle` is dragged. Expressed against
// the unnormalized box so it names the same point after a flip.
Point2 fixedAnchor(ResizeHandle handle, const LocalBox& box) noexcept {
    float ax = box.x + box.w * 0.5f;
    float ay = box.y + box.h * 0.5f;
    if (geometry::handleMovesLeft(handle)) ax = box.x + box.w;
    if (geometry::handleMovesRight(handle)) ax = box.x;
    if (geometry::handleMovesTop(handle)) ay = box.y + box.h;
    if (geometry::handleMovesBottom(handle)) ay = box.y;
    return {ax, ay};
}

void lockAspect(ResizeHandle handle, const BoundingBox& start, LocalBox& box) noexcept {
    if (start.width <= kMinExtent || start.height <= kMinExtent) return;
    const float ratio = start.width / start.height;

    if (handle == ResizeHandle::LeftMiddle || handle == ResizeHandle::RightMiddle) {
        box.h = std::abs(box.w) / ratio;
        box.y = start.centerY() - box.h * 0.5f;
        return;
    }
    if (handle == ResizeHandle::TopMiddle || handle == ResizeHandle::BottomMiddle) {
        box.w = std::abs(box.h) * ratio;
        box.x = start.centerX() - box.w * 0.5f;
        return;
    }

    const bool widthDrives = std::abs(box.w) / start.width >= std::abs(box.h) / start.height;
    if (widthDrives) {
        const float sign = (box.h < 0.0f) != (box.w < 0.0f) ? -1.0f : 1.0f;
        box.h = sign * box.w / ratio;
        box.y = geometry::handleMovesTop(handle) ? start.maxY - box.h : start.minY;
    } else {
        const float sign = (box.h < 0.0f) != (box.w < 0.0f) ? -1.0f : 1.0f;
        box.w = sign * box.h * ratio;
        box.x = geometry::handleMovesLeft(handle) ? start.maxX - box.w : start.minX;
    }
}

} // namespace

std::optional<MoveAction> TransformEngine::beginMove(const Element& element, Point2 pointer) {
    const std::optional<BoundingBox> bounds = geometry::elementBounds(element);
    if (!bounds) return std::nullopt;
    return MoveAction{{pointer.x - bounds->minX, pointer.y - bounds->minY}};
}

std::optional<ResizeAction> TransformEngine::beginResize(const Element& element, ResizeHandle handle, Point2 pointer) {
    if (handle == ResizeHandle::None || handle == ResizeHandle::Rotate) return std::nullopt;
    const std::optional<BoundingBox> bounds = geometry::elementBounds(element);
    if (!bounds) return std::nullopt;
    return ResizeAction{handle, pointer, *bounds, element};
}

std::optional<RotateAction> TransformEngine::beginRotate(const Element& element, Point2 pointer) {
    const std::optional<BoundingBox> bounds = geometry::elementBounds(element);
    if (!bounds) return std::nullopt;
    const Point2 center = bounds->center();
    return RotateAction{geometry::angleDegrees(center, pointer), element.rotation, center};
}

Element TransformEngine::applyMove(const Element& current, const MoveAction& action, Point2 pointer) {
    const std::optional<BoundingBox> bounds = geometry::elementBounds(current);
    if (!bounds) return current;

    const float dx = (pointer.x - action.offset.x) - bounds->minX;
    const float dy = (pointer.y - action.offset.y) - bounds->minY;

    Element out = current;
    if (usesPathPoints(out.kind)) {
        for (Point2& p : out.points) {
            p.x += dx;
            p.y += dy;
        }
    } else {
        out.x += dx;
        out.y += dy;
    }
    return out;
}

Element TransformEngine::applyRotate(const Element& current, const RotateAction& action, Point2 pointer, bool snap) {
    const float angle = geometry::angleDegrees(action.center, pointer);
    float rotation = action.startRotation + (angle - action.startAngle);
    if (snap) {
        rotation = std::round(rotation / kRotationSnapDegrees) * kRotationSnapDegrees;
    }

    Element out = current;
    out.rotation = rotation;
    return out;
}

Element TransformEngine::applyResize(const Element& current, const ResizeAction& action, Point2 pointer, bool keepAspect) {
    const BoundingBox& start = action.startBox;
    const float rotation = action.snapshot.rotation;
    const Point2 startCenter = start.center();

    // (1) Gesture into the unrotated frame of the original box
    const Point2 localStart = geometry::rotatePoint(action.startPoint, startCenter, -rotation);
    const Point2 localNow = geometry::rotatePoint(pointer, startCenter, -rotation);
    const float dx = localNow.x - localStart.x;
    const float dy = localNow.y - localStart.y;

    // (2) Apply the delta to the edges the handle owns
    LocalBox box{start.minX, start.minY, start.width, start.height};
    if (geometry::handleMovesLeft(action.handle)) {
        box.x += dx;
        box.w -= dx;
    }
    if (geometry::handleMovesRight(action.handle)) {
        box.w += dx;
    }
    if (geometry::handleMovesTop(action.handle)) {
        box.y += dy;
        box.h -= dy;
    }
    if (geometry::handleMovesBottom(action.handle)) {
        box.h += dy;
    }

    // (3)
    if (keepAspect) {
        lockAspect(action.handle, start, box);
    }

    // (4) Normalize flipped extents
    const float nx = box.w < 0.0f ? box.x + box.w : box.x;
    const float ny = box.h < 0.0f ? box.y + box.h : box.y;
    const float nw = std::abs(box.w);
    const float nh = std::abs(box.h);

    // (5) Fixed anchor of the original box, in canvas space
    const LocalBox original{start.minX, start.minY, start.width, start.height};
    const Point2 anchorWorld = geometry::rotatePoint(fixedAnchor(action.handle, original), startCenter, rotation);

    // (6) Same anchor in the new box, relative to the new center, rotated by the original rotation
    const Point2 anchorLocal = fixedAnchor(action.handle, box);
    const Point2 offset{anchorLocal.x - (nx + nw * 0.5f), anchorLocal.y - (ny + nh * 0.5f)};
    const Point2 offsetWorld = geometry::rotatePoint(offset, {0.0f, 0.0f}, rotation);
    const Point2 center{anchorWorld.x - offsetWorld.x, anchorWorld.y - offsetWorld.y};

    // (7)
    const float fx = center.x - nw * 0.5f;
    const float fy = center.y - nh * 0.5f;

    Element out = current;
    out.rotation = rotation;

    if (usesPathPoints(out.kind)) {
        const float sx = start.width > kMinExtent ? box.w / start.width : 1.0f;
        const float sy = start.height > kMinExtent ? box.h / start.height : 1.0f;
        const float shiftX = fx - nx;
        const float shiftY = fy - ny;
        out.points = action.snapshot.points;
        for (Point2& p : out.points) {
            p.x = box.x + (p.x - start.minX) * sx + shiftX;
            p.y = box.y + (p.y - start.minY) * sy + shiftY;
        }
        return out;
    }

    out.x = fx;
    out.y = fy;
    out.width = nw;
    out.height = nh;

    // Lines and arrows store a direction vector; keep it pointing the same
    // way, mirrored when the drag flipped an axis.
    if (out.kind == ElementKind::Line || out.kind == ElementKind::Arrow) {
        const bool negW = (action.snapshot.width.value_or(0.0f) < 0.0f) != (box.w < 0.0f);
        const bool negH = (action.snapshot.height.value_or(0.0f) < 0.0f) != (box.h < 0.0f);
        if (negW) {
            out.x = fx + nw;
            out.width = -nw;
        }
        if (negH) {
            out.y = fy + nh;
            out.height = -nh;
        }
    }
    return out;
}

} // namespace board
