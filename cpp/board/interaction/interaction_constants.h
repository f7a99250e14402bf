#pragma once

/**
 * @file interaction_constants.h
 * @brief Default values for interaction tolerances and limits.
 *
 * BoardConfig is seeded from these; the shell may override any of them at
 * mount time. Pixel values are screen pixels and are divided by the camera
 * zoom before being compared against canvas-space distances.
 *
 * Handle codes (canvas y grows downward):
 *   tl tr bl br  = corners
 *   tm bm lm rm  = edge midpoints (top/bottom/left/right)
 *   rot          = rotation handle above the top edge
 */

namespace interaction_constants {

// =============================================================================
// Hit-test Tolerances
// =============================================================================

/// Padding added around an element's box for body hits
constexpr float HIT_PADDING_PX = 5.0f;

/// Padding used by the eraser
constexpr float ERASER_PADDING_PX = 5.0f;

/// Distance within which a resize/rotate handle is considered hit
constexpr float HANDLE_THRESHOLD_PX = 12.0f;

/// Offset of the rotation handle above the top edge
constexpr float ROTATE_HANDLE_OFFSET_PX = 30.0f;

// =============================================================================
// Camera
// =============================================================================

constexpr float ZOOM_MIN = 0.1f;
constexpr float ZOOM_MAX = 5.0f;

/// Zoom change per wheel delta unit
constexpr float WHEEL_ZOOM_SENSITIVITY = 0.001f;

// =============================================================================
// Drawing
// =============================================================================

/// Shapes smaller than this on both axes are discarded on pointer-up
constexpr float MIN_SHAPE_SIZE = 5.0f;

/// Text boxes narrower than this are widened to it
constexpr float MIN_TEXT_WIDTH = 100.0f;

constexpr float DEFAULT_FONT_SIZE = 24.0f;
constexpr float TEXT_LINE_HEIGHT_FACTOR = 1.25f;

/// Angle increment for shift-snapped lines and arrows (degrees)
constexpr float LINE_SNAP_DEGREES = 45.0f;

constexpr float DEFAULT_STROKE_WIDTH = 3.0f;

// =============================================================================
// Synchronization
// =============================================================================

/// Minimum spacing between two presence broadcasts
constexpr double CURSOR_BROADCAST_INTERVAL_MS = 30.0;

/// Quiet period after the last edit before a thumbnail is uploaded
constexpr double THUMBNAIL_DEBOUNCE_MS = 2000.0;

// =============================================================================
// Cursor Base Angles (degrees, 0 = north, clockwise)
// =============================================================================

namespace CursorBaseAngle {
    constexpr float TOP_MIDDLE = 0.0f;
    constexpr float TOP_RIGHT = 45.0f;
    constexpr float RIGHT_MIDDLE = 90.0f;
    constexpr float BOTTOM_RIGHT = 135.0f;
    constexpr float BOTTOM_MIDDLE = 180.0f;
    constexpr float BOTTOM_LEFT = 225.0f;
    constexpr float LEFT_MIDDLE = 270.0f;
    constexpr float TOP_LEFT = 315.0f;
}

} // namespace interaction_constants
