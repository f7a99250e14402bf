#pragma once

#include "board/core/config.h"
#include "board/core/element.h"
#include "board/core/types.h"
#include "board/geometry/handles.h"
#include "board/interaction/tool_state.h"
#include "board/interaction/transform_types.h"

#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace board {

class ElementStore;
class HistoryManager;
class IdGenerator;
class SyncSession;

namespace text {
class TextMeasurer;
}

// Style applied to newly drawn elements; style edits on the selection update it.
struct DrawStyle {
    std::string strokeColor;
    std::string fillColor;
    float strokeWidth = 0.0f;
    std::vector<float> strokeDash;
    float opacity = 1.0f;
    std::string fontFamily;
    float fontSize = 0.0f;
    TextAlign textAlign = TextAlign::Left;
};

/**
 * InteractionSession: the local tool state machine.
 *
 * Owns the camera, the selection, the active tool and the current ToolState.
 * Pointer events are routed to one handler per state; committed creations,
 * updates and deletions are written to the ElementStore, recorded in history
 * and handed to the SyncSession for persistence.
 */
class InteractionSession {
public:
    InteractionSession(
        ElementStore& store,
        HistoryManager& history,
        SyncSession& sync,
        const BoardConfig& config,
        const text::TextMeasurer& measurer,
        IdGenerator& ids);

    // ==============================================================================
    // Mode / permissions
    // ==============================================================================
    void setCanEdit(bool canEdit);
    bool canEdit() const noexcept { return canEdit_; }

    bool setTool(Tool tool);
    Tool tool() const noexcept { return tool_; }

    InteractionMode mode() const noexcept { return modeOf(state_); }
    const ToolState& state() const noexcept { return state_; }
    // The in-progress gesture, if the state is moving/resizing/rotating.
    TransformAction transformAction() const;

    BoardError lastError() const noexcept { return lastError_; }
    void reportError(BoardError error) noexcept { lastError_ = error; }
    void clearError() noexcept { lastError_ = BoardError::Ok; }

    // ==============================================================================
    // Camera
    // ==============================================================================
    const Camera& camera() const noexcept { return camera_; }
    void setCamera(const Camera& camera);
    Point2 toCanvas(Point2 screen) const noexcept;

    // ==============================================================================
    // Input
    // ==============================================================================
    void pointerDown(const PointerEvent& ev);
    void pointerMove(const PointerEvent& ev);
    void pointerUp(const PointerEvent& ev);
    // Lost pointer capture; ends the gesture like a pointer-up.
    void pointerCancel(const PointerEvent& ev);
    void doubleClick(const PointerEvent& ev);
    void wheel(const WheelEvent& ev);
    // Tool shortcuts, Delete/Backspace and Escape. Returns true when consumed.
    bool keyDown(std::string_view key, std::uint32_t modifiers);

    geometry::CursorShape cursorAt(Point2 screen) const;

    // ==============================================================================
    // Selection
    // ==============================================================================
    const std::string& selectedId() const noexcept { return selectedId_; }
    ElementPtr selectedElement() const;
    bool select(const std::string& id);
    void clearSelection() noexcept;

    bool deleteSelection();
    bool setSelectionStyle(const ElementPatch& style);
    bool bringToFront();
    bool sendToBack();

    // Creates an image element centered on `center`; returns its id, or empty.
    std::string placeImage(const std::string& url, Point2 center, float width, float height);

    const DrawStyle& drawStyle() const noexcept { return style_; }

    // Called after an element disappeared without a local gesture (remote
    // delete, undo/redo).
    void handleElementRemoved(const std::string& id);
    // Drops selection and gesture state that point at elements no longer live.
    void reconcile();

    // ==============================================================================
    // Drawing / text
    // ==============================================================================
    // Element being drawn, for preview rendering.
    const Element* draft() const noexcept;

    const WritingNode* writingNode() const noexcept;
    bool setWritingText(std::string text);
    bool commitWriting();
    void cancelWriting();

    // Wrapped display lines of a text element at its box width.
    std::vector<std::string> textLines(const Element& element) const;

    void setMutationListener(std::function<void()> listener) { onMutation_ = std::move(listener); }

private:
    friend class InteractionSessionTestAccess;

    // Per-state handlers
    void beginSelection(Point2 p);
    void beginDrawing(ElementKind kind, Point2 p);
    void updateDrawing(DrawingState& st, Point2 p, bool snap);
    void finishDrawing(DrawingState& st);
    void updateTransform(Point2 p, bool shift);
    void finishTransform();
    void eraseAt(Point2 p);
    void finishGesture();

    // Text
    void openWriting(WritingNode node);
    float textHeight(const std::string& content, float width, const std::string& family, float fontSize) const;

    // Commit helpers
    Element newElement(ElementKind kind, Point2 p);
    void commitCreate(Element element);
    void commitUpdate(const Element& before, const Element& after);
    bool commitDelete(const std::string& id);
    bool requireEdit();
    void notifyMutation();

    float hitPadding() const noexcept;

    ElementStore& store_;
    HistoryManager& history_;
    SyncSession& sync_;
    const BoardConfig& config_;
    const text::TextMeasurer& measurer_;
    IdGenerator& ids_;

    bool canEdit_ = true;
    Tool tool_ = Tool::Selection;
    ToolState state_;
    Camera camera_;
    std::string selectedId_;
    DrawStyle style_;
    BoardError lastError_ = BoardError::Ok;

    std::function<void()> onMutation_;
};

} // namespace board
