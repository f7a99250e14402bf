#include "board/interaction/tool_state.h"

namespace board {

const char* toolName(Tool tool) noexcept {
    switch (tool) {
        case Tool::Hand: return "hand";
        case Tool::Selection: return "selection";
        case Tool::Rect: return "rect";
        case Tool::Diamond: return "diamond";
        case Tool::Ellipse: return "ellipse";
        case Tool::Arrow: return "arrow";
        case Tool::Line: return "line";
        case Tool::Pencil: return "pencil";
        case Tool::Text: return "text";
        case Tool::Image: return "image";
        case Tool::Eraser: return "eraser";
    }
    return "selection";
}

std::optional<Tool> parseTool(std::string_view name) noexcept {
    for (int i = static_cast<int>(Tool::Hand); i <= static_cast<int>(Tool::Eraser); ++i) {
        const Tool tool = static_cast<Tool>(i);
        if (name == toolName(tool)) return tool;
    }
    return std::nullopt;
}

std::optional<Tool> toolForShortcut(std::string_view key) noexcept {
    if (key.size() != 1) return std::nullopt;
    switch (key[0]) {
        case 'h': case 'H': return Tool::Hand;
        case 'v': case 'V': case '1': return Tool::Selection;
        case 'r': case 'R': case '2': return Tool::Rect;
        case 'd': case 'D': case '3': return Tool::Diamond;
        case 'o': case 'O': case '4': return Tool::Ellipse;
        case 'a': case 'A': case '5': return Tool::Arrow;
        case 'l': case 'L': case '6': return Tool::Line;
        case 'p': case 'P': case '7': return Tool::Pencil;
        case 't': case 'T': case '8': return Tool::Text;
        case '9': return Tool::Image;
        case 'e': case 'E': case '0': return Tool::Eraser;
        default: return std::nullopt;
    }
}

std::optional<ElementKind> drawnKind(Tool tool) noexcept {
    switch (tool) {
        case Tool::Rect: return ElementKind::Rect;
        case Tool::Diamond: return ElementKind::Diamond;
        case Tool::Ellipse: return ElementKind::Ellipse;
        case Tool::Arrow: return ElementKind::Arrow;
        case Tool::Line: return ElementKind::Line;
        case Tool::Pencil: return ElementKind::Pencil;
        case Tool::Text: return ElementKind::Text;
        default: return std::nullopt;
    }
}

bool isReadOnlyTool(Tool tool) noexcept {
    return tool == Tool::Hand || tool == Tool::Selection;
}

const char* modeName(InteractionMode mode) noexcept {
    switch (mode) {
        case InteractionMode::Idle: return "idle";
        case InteractionMode::Drawing: return "drawing";
        case InteractionMode::Moving: return "moving";
        case InteractionMode::Resizing: return "resizing";
        case InteractionMode::Rotating: return "rotating";
        case InteractionMode::Erasing: return "erasing";
        case InteractionMode::Panning: return "panning";
        case InteractionMode::EditingText: return "editing-text";
    }
    return "idle";
}

} // namespace board
