#pragma once

#include "board/interaction/interaction_constants.h"

#include <string>

namespace board {

struct BoardConfig {
    // Hit testing
    float hitPaddingPx = interaction_constants::HIT_PADDING_PX;
    float eraserPaddingPx = interaction_constants::ERASER_PADDING_PX;
    bool scaleHitPaddingWithZoom = true;
    float handleThresholdPx = interaction_constants::HANDLE_THRESHOLD_PX;
    float rotateHandleOffsetPx = interaction_constants::ROTATE_HANDLE_OFFSET_PX;

    // Camera
    float zoomMin = interaction_constants::ZOOM_MIN;
    float zoomMax = interaction_constants::ZOOM_MAX;
    float wheelZoomSensitivity = interaction_constants::WHEEL_ZOOM_SENSITIVITY;

    // Drawing
    float minShapeSize = interaction_constants::MIN_SHAPE_SIZE;
    float minTextWidth = interaction_constants::MIN_TEXT_WIDTH;
    float lineSnapDegrees = interaction_constants::LINE_SNAP_DEGREES;
    std::string defaultFontFamily = "sans-serif";
    float defaultFontSize = interaction_constants::DEFAULT_FONT_SIZE;
    float textLineHeightFactor = interaction_constants::TEXT_LINE_HEIGHT_FACTOR;
    std::string defaultStrokeColor = "#000000";
    std::string defaultFillColor;
    float defaultStrokeWidth = interaction_constants::DEFAULT_STROKE_WIDTH;

    // Synchronization
    double cursorBroadcastIntervalMs = interaction_constants::CURSOR_BROADCAST_INTERVAL_MS;
    double thumbnailDebounceMs = interaction_constants::THUMBNAIL_DEBOUNCE_MS;

    // Canvas-space padding for a pixel value at the given zoom.
    float paddingForZoom(float paddingPx, float zoom) const noexcept {
        if (!scaleHitPaddingWithZoom || !(zoom > 1e-6f)) return paddingPx;
        return paddingPx / zoom;
    }
};

} // namespace board
