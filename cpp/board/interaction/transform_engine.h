#pragma once

#include "board/core/element.h"
#include "board/interaction/transform_types.h"

#include <optional>

namespace board {

/**
 * TransformEngine: turns a gesture and a pointer position into replacement
 * geometry for the selected element. Stateless; every apply* call returns a
 * full Element that the caller writes back into the ElementStore.
 *
 * All points are canvas space.
 */
class TransformEngine {
public:
    static constexpr float kRotationSnapDegrees = 15.0f;

    // nullopt when the element has no usable bounds.
    static std::optional<MoveAction> beginMove(const Element& element, Point2 pointer);
    static std::optional<ResizeAction> beginResize(const Element& element, geometry::ResizeHandle handle, Point2 pointer);
    static std::optional<RotateAction> beginRotate(const Element& element, Point2 pointer);

    // New anchor = pointer - offset; pencil paths are translated by the box shift.
    static Element applyMove(const Element& current, const MoveAction& action, Point2 pointer);

    // rotation = start rotation + (current angle - start angle), unclamped.
    static Element applyRotate(const Element& current, const RotateAction& action, Point2 pointer, bool snap);

    /**
     * Anchor-preserving resize. The point opposite the dragged handle keeps
     * its canvas position for any rotation. `keepAspect` locks the starting
     * width/height ratio. Geometry comes from the gesture snapshot, every
     * other attribute from `current`.
     */
    static Element applyResize(const Element& current, const ResizeAction& action, Point2 pointer, bool keepAspect);
};

} // namespace board
