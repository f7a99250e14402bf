#pragma once

#include "board/core/element.h"
#include "board/core/types.h"
#include "board/geometry/handles.h"

#include <variant>

namespace board {

// Pointer offset from the element's box origin at pointer-down.
struct MoveAction {
    Point2 offset;
};

struct ResizeAction {
    geometry::ResizeHandle handle;
    Point2 startPoint;
    BoundingBox startBox;
    Element snapshot;
};

struct RotateAction {
    float startAngle;
    float startRotation;
    Point2 center;
};

// In-progress gesture; lives only between pointer-down and pointer-up.
using TransformAction = std::variant<std::monostate, MoveAction, ResizeAction, RotateAction>;

} // namespace board
