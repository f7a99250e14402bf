#pragma once

#include <cstdint>

namespace board {

struct Point2 {
    float x;
    float y;
};

// Pan offset in screen pixels plus zoom factor (z > 0).
struct Camera {
    float x = 0.0f;
    float y = 0.0f;
    float z = 1.0f;
};

struct BoundingBox {
    float minX;
    float minY;
    float maxX;
    float maxY;
    float width;
    float height;

    float centerX() const noexcept { return minX + width * 0.5f; }
    float centerY() const noexcept { return minY + height * 0.5f; }
    Point2 center() const noexcept { return {centerX(), centerY()}; }
};

enum class ElementKind : std::uint8_t {
    Pencil = 0,
    Rect = 1,
    Diamond = 2,
    Ellipse = 3,
    Line = 4,
    Arrow = 5,
    Text = 6,
    Image = 7,
};

enum class TextAlign : std::uint8_t {
    Left = 0,
    Center = 1,
    Right = 2,
};

enum class BoardError : std::uint32_t {
    Ok = 0,
    ReadOnly = 1,
    NoSelection = 2,
    UnknownElement = 3,
    InvalidInput = 4,
    PersistFailed = 5,
};

} // namespace board
