#pragma once

#include "board/core/element.h"
#include "board/core/types.h"

#include <optional>

namespace board::geometry {

// Canvas = (screen - pan) / zoom.
Point2 screenToCanvas(Point2 screen, const Camera& camera) noexcept;
Point2 canvasToScreen(Point2 canvas, const Camera& camera) noexcept;

// Rotates `point` about `center` by `degrees` (standard rotation matrix).
Point2 rotatePoint(Point2 point, Point2 center, float degrees) noexcept;

// Angle in degrees of the vector from `center` to `point`, via atan2.
float angleDegrees(Point2 center, Point2 point) noexcept;

/**
 * Axis-aligned bounds of an element in its own (unrotated) frame.
 * Pencil: extrema of the path points. Other kinds: (x, y, width, height) with
 * negative extents normalized. Returns nullopt for malformed geometry
 * (no points, missing width/height, non-finite values).
 */
std::optional<BoundingBox> elementBounds(const Element& element) noexcept;

BoundingBox boxFromRect(float x, float y, float w, float h) noexcept;

/**
 * True when `point`, rotated into the element's local frame about the box
 * center, lies inside the box grown by `padding` (canvas units).
 * Soft-deleted and malformed elements never hit.
 */
bool isHit(Point2 point, const Element& element, float padding) noexcept;

} // namespace board::geometry
