#include "board/geometry/geometry.h"

#include "board/core/util.h"

#include <algorithm>
#include <cmath>
#include <limits>

namespace board::geometry {

namespace {

inline float normalizeZoom(float z) noexcept {
    return (z > 1e-6f && std::isfinite(z)) ? z : 1.0f;
}

} // namespace

Point2 screenToCanvas(Point2 screen, const Camera& camera) noexcept {
    const float z = normalizeZoom(camera.z);
    return {(screen.x - camera.x) / z, (screen.y - camera.y) / z};
}

Point2 canvasToScreen(Point2 canvas, const Camera& camera) noexcept {
    const float z = normalizeZoom(camera.z);
    return {canvas.x * z + camera.x, canvas.y * z + camera.y};
}

Point2 rotatePoint(Point2 point, Point2 center, float degrees) noexcept {
    const float rad = degrees * kDegToRad;
    const float cosA = std::cos(rad);
    const float sinA = std::sin(rad);
    const float dx = point.x - center.x;
    const float dy = point.y - center.y;
    return {
        center.x + (dx * cosA - dy * sinA),
        center.y + (dx * sinA + dy * cosA),
    };
}

float angleDegrees(Point2 center, Point2 point) noexcept {
    return std::atan2(point.y - center.y, point.x - center.x) * kRadToDeg;
}

BoundingBox boxFromRect(float x, float y, float w, float h) noexcept {
    const float minX = w < 0.0f ? x + w : x;
    const float minY = h < 0.0f ? y + h : y;
    const float aw = std::abs(w);
    const float ah = std::abs(h);
    return {minX, minY, minX + aw, minY + ah, aw, ah};
}

std::optional<BoundingBox> elementBounds(const Element& element) noexcept {
    if (usesPathPoints(element.kind)) {
        if (element.points.empty()) return std::nullopt;
        float minX = std::numeric_limits<float>::infinity();
        float minY = std::numeric_limits<float>::infinity();
        float maxX = -std::numeric_limits<float>::infinity();
        float maxY = -std::numeric_limits<float>::infinity();
        for (const Point2& p : element.points) {
            if (!std::isfinite(p.x) || !std::isfinite(p.y)) return std::nullopt;
            minX = std::min(minX, p.x);
            minY = std::min(minY, p.y);
            maxX = std::max(maxX, p.x);
            maxY = std::max(maxY, p.y);
        }
        return BoundingBox{minX, minY, maxX, maxY, maxX - minX, maxY - minY};
    }

    if (!element.width || !element.height) return std::nullopt;
    const float w = *element.width;
    const float h = *element.height;
    if (!std::isfinite(element.x) || !std::isfinite(element.y) || !std::isfinite(w) || !std::isfinite(h)) {
        return std::nullopt;
    }
    return boxFromRect(element.x, element.y, w, h);
}

bool isHit(Point2 point, const Element& element, float padding) noexcept {
    if (element.deleted) return false;

    const std::optional<BoundingBox> bounds = elementBounds(element);
    if (!bounds) return false;

    const float rotation = std::isfinite(element.rotation) ? element.rotation : 0.0f;
    const Point2 local = rotatePoint(point, bounds->center(), -rotation);

    return local.x >= bounds->minX - padding &&
           local.x <= bounds->maxX + padding &&
           local.y >= bounds->minY - padding &&
           local.y <= bounds->maxY + padding;
}

} // namespace board::geometry
