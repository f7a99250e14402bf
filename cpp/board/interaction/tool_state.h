#pragma once

#include "board/core/element.h"
#include "board/core/types.h"
#include "board/interaction/transform_types.h"

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <variant>

namespace board {

enum class Tool : std::uint8_t {
    Hand = 0,
    Selection,
    Rect,
    Diamond,
    Ellipse,
    Arrow,
    Line,
    Pencil,
    Text,
    Image,
    Eraser,
};

const char* toolName(Tool tool) noexcept;
std::optional<Tool> parseTool(std::string_view name) noexcept;
// Single-key shortcuts ("v", "1", "r", ...).
std::optional<Tool> toolForShortcut(std::string_view key) noexcept;
// Element kind drawn by a pointer drag with this tool, if any.
std::optional<ElementKind> drawnKind(Tool tool) noexcept;
// Tools available without edit permission.
bool isReadOnlyTool(Tool tool) noexcept;

enum class PointerButton : std::uint8_t {
    Primary = 0,
    Middle = 1,
    Secondary = 2,
};

namespace Modifier {
    constexpr std::uint32_t Shift = 1u << 0;
    constexpr std::uint32_t Ctrl = 1u << 1;
    constexpr std::uint32_t Alt = 1u << 2;
    constexpr std::uint32_t Meta = 1u << 3;
    constexpr std::uint32_t Space = 1u << 4; // pan modifier held
}

// Screen-space pointer sample.
struct PointerEvent {
    float x = 0.0f;
    float y = 0.0f;
    PointerButton button = PointerButton::Primary;
    std::uint32_t modifiers = 0;
    double timeMs = 0.0;

    bool has(std::uint32_t modifier) const noexcept { return (modifiers & modifier) != 0; }
};

struct WheelEvent {
    float x = 0.0f;
    float y = 0.0f;
    float deltaX = 0.0f;
    float deltaY = 0.0f;
    std::uint32_t modifiers = 0;

    bool has(std::uint32_t modifier) const noexcept { return (modifiers & modifier) != 0; }
};

// Uncommitted text box; either edits `elementId` or becomes a new element.
struct WritingNode {
    std::optional<std::string> elementId;
    Point2 position{0.0f, 0.0f};
    float width = 0.0f;
    std::string text;
    std::string strokeColor;
    std::string fontFamily;
    float fontSize = 0.0f;
    TextAlign textAlign = TextAlign::Left;
    float opacity = 1.0f;
    float rotation = 0.0f;
};

struct IdleState {};

struct DrawingState {
    Element draft;
    Point2 start;
};

struct MovingState {
    ElementPtr before;
    MoveAction action;
};

struct ResizingState {
    ElementPtr before;
    ResizeAction action;
};

struct RotatingState {
    ElementPtr before;
    RotateAction action;
};

struct ErasingState {};

struct PanningState {
    Point2 lastScreen;
};

struct EditingTextState {
    WritingNode node;
};

using ToolState = std::variant<
    IdleState,
    DrawingState,
    MovingState,
    ResizingState,
    RotatingState,
    ErasingState,
    PanningState,
    EditingTextState>;

enum class InteractionMode : std::uint8_t {
    Idle = 0,
    Drawing,
    Moving,
    Resizing,
    Rotating,
    Erasing,
    Panning,
    EditingText,
};

inline InteractionMode modeOf(const ToolState& state) noexcept {
    return static_cast<InteractionMode>(state.index());
}

const char* modeName(InteractionMode mode) noexcept;

} // namespace board
