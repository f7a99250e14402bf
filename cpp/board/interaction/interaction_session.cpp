#include "board/interaction/interaction_session.h"

#include "board/core/logging.h"
#include "board/core/util.h"
#include "board/entity/element_store.h"
#include "board/geometry/geometry.h"
#include "board/history/history_manager.h"
#include "board/interaction/transform_engine.h"
#include "board/sync/sync_session.h"

#include <algorithm>

namespace board {

namespace {

// Element snapshot at gesture start for the three transform states.
ElementPtr gestureTarget(const ToolState& state) {
    if (const auto* s = std::get_if<MovingState>(&state)) return s->before;
    if (const auto* s = std::get_if<ResizingState>(&state)) return s->before;
    if (const auto* s = std::get_if<RotatingState>(&state)) return s->before;
    return nullptr;
}

bool isPositiveSize(const std::optional<float>& v) noexcept {
    return !v || (isFinite(*v) && *v > 0.0f);
}

// Sizes must be finite and positive, opacity finite, dash lengths finite and non-negative.
bool isValidStyle(const ElementPatch& style) noexcept {
    if (!isPositiveSize(style.strokeWidth) || !isPositiveSize(style.fontSize)) return false;
    if (style.opacity && !isFinite(*style.opacity)) return false;
    if (style.strokeDash) {
        for (const float dash : *style.strokeDash) {
            if (!isFinite(dash) || dash < 0.0f) return false;
        }
    }
    return true;
}

} // namespace

InteractionSession::InteractionSession(
    ElementStore& store,
    HistoryManager& history,
    SyncSession& sync,
    const BoardConfig& config,
    const text::TextMeasurer& measurer,
    IdGenerator& ids)
    : store_(store),
      history_(history),
      sync_(sync),
      config_(config),
      measurer_(measurer),
      ids_(ids) {
    style_.strokeColor = config_.defaultStrokeColor;
    style_.fillColor = config_.defaultFillColor;
    style_.strokeWidth = config_.defaultStrokeWidth;
    style_.fontFamily = config_.defaultFontFamily;
    style_.fontSize = config_.defaultFontSize;
}

// ==============================================================================
// Mode / permissions
// ==============================================================================

void InteractionSession::setCanEdit(bool canEdit) {
    canEdit_ = canEdit;
    if (canEdit_) return;

    cancelWriting();
    state_ = IdleState{};
    if (!isReadOnlyTool(tool_)) tool_ = Tool::Selection;
}

bool InteractionSession::setTool(Tool tool) {
    if (!canEdit_ && !isReadOnlyTool(tool)) {
        reportError(BoardError::ReadOnly);
        return false;
    }
    if (std::holds_alternative<EditingTextState>(state_)) {
        commitWriting();
    } else if (!std::holds_alternative<IdleState>(state_)) {
        finishGesture();
    }
    tool_ = tool;
    return true;
}

TransformAction InteractionSession::transformAction() const {
    if (const auto* s = std::get_if<MovingState>(&state_)) return s->action;
    if (const auto* s = std::get_if<ResizingState>(&state_)) return s->action;
    if (const auto* s = std::get_if<RotatingState>(&state_)) return s->action;
    return std::monostate{};
}

// ==============================================================================
// Camera
// ==============================================================================

void InteractionSession::setCamera(const Camera& camera) {
    if (!isFinite(camera.x) || !isFinite(camera.y) || !isFinite(camera.z)) {
        reportError(BoardError::InvalidInput);
        return;
    }
    camera_.x = camera.x;
    camera_.y = camera.y;
    camera_.z = std::clamp(camera.z, config_.zoomMin, config_.zoomMax);
}

Point2 InteractionSession::toCanvas(Point2 screen) const noexcept {
    return geometry::screenToCanvas(screen, camera_);
}

float InteractionSession::hitPadding() const noexcept {
    return config_.paddingForZoom(config_.hitPaddingPx, camera_.z);
}

// ==============================================================================
// Pointer routing
// ==============================================================================

void InteractionSession::pointerDown(const PointerEvent& ev) {
    // A press outside the open text box only blurs it.
    if (std::holds_alternative<EditingTextState>(state_)) {
        commitWriting();
        return;
    }
    if (!std::holds_alternative<IdleState>(state_)) finishGesture();

    const Point2 screen{ev.x, ev.y};
    if (tool_ == Tool::Hand || ev.button == PointerButton::Middle || ev.has(Modifier::Space)) {
        state_ = PanningState{screen};
        return;
    }
    if (ev.button != PointerButton::Primary) return;

    const Point2 p = toCanvas(screen);
    if (tool_ == Tool::Selection) {
        beginSelection(p);
        return;
    }
    if (!canEdit_) return;

    if (tool_ == Tool::Eraser) {
        state_ = ErasingState{};
        eraseAt(p);
        return;
    }
    if (const std::optional<ElementKind> kind = drawnKind(tool_)) {
        beginDrawing(*kind, p);
    }
}

void InteractionSession::pointerMove(const PointerEvent& ev) {
    const Point2 screen{ev.x, ev.y};
    const Point2 p = toCanvas(screen);
    sync_.publishCursor(p, ev.timeMs);

    if (auto* pan = std::get_if<PanningState>(&state_)) {
        camera_.x += screen.x - pan->lastScreen.x;
        camera_.y += screen.y - pan->lastScreen.y;
        pan->lastScreen = screen;
        return;
    }
    if (std::holds_alternative<ErasingState>(state_)) {
        eraseAt(p);
        return;
    }
    if (auto* draw = std::get_if<DrawingState>(&state_)) {
        updateDrawing(*draw, p, ev.has(Modifier::Shift));
        return;
    }
    updateTransform(p, ev.has(Modifier::Shift));
}

void InteractionSession::pointerUp(const PointerEvent&) {
    finishGesture();
}

void InteractionSession::pointerCancel(const PointerEvent&) {
    finishGesture();
}

void InteractionSession::finishGesture() {
    if (auto* draw = std::get_if<DrawingState>(&state_)) {
        DrawingState st = std::move(*draw);
        state_ = IdleState{};
        finishDrawing(st);
        return;
    }
    if (gestureTarget(state_)) {
        finishTransform();
        return;
    }
    if (std::holds_alternative<EditingTextState>(state_)) return;
    state_ = IdleState{};
}

void InteractionSession::doubleClick(const PointerEvent& ev) {
    if (!canEdit_) return;
    if (std::holds_alternative<EditingTextState>(state_)) commitWriting();

    const Point2 p = toCanvas({ev.x, ev.y});
    ElementPtr hit = store_.topmostHit(p, hitPadding());
    if (!hit || hit->kind != ElementKind::Text) return;

    state_ = IdleState{};
    selectedId_ = hit->id;

    WritingNode node;
    node.elementId = hit->id;
    node.position = {hit->x, hit->y};
    node.width = hit->width.value_or(config_.minTextWidth);
    node.text = hit->text;
    node.strokeColor = hit->strokeColor;
    node.fontFamily = hit->fontFamily.empty() ? config_.defaultFontFamily : hit->fontFamily;
    node.fontSize = hit->fontSize > 0.0f ? hit->fontSize : config_.defaultFontSize;
    node.textAlign = hit->textAlign;
    node.opacity = hit->opacity;
    node.rotation = hit->rotation;
    openWriting(std::move(node));
}

void InteractionSession::wheel(const WheelEvent& ev) {
    if (!isFinite(ev.deltaX) || !isFinite(ev.deltaY)) return;
    if (ev.has(Modifier::Ctrl) || ev.has(Modifier::Meta)) {
        const float z = camera_.z - ev.deltaY * config_.wheelZoomSensitivity;
        camera_.z = std::clamp(z, config_.zoomMin, config_.zoomMax);
        return;
    }
    camera_.x -= ev.deltaX;
    camera_.y -= ev.deltaY;
}

bool InteractionSession::keyDown(std::string_view key, std::uint32_t modifiers) {
    if (std::holds_alternative<EditingTextState>(state_)) {
        if (key == "Escape") {
            cancelWriting();
            return true;
        }
        return false;
    }
    if (key == "Delete" || key == "Backspace") {
        if (selectedId_.empty()) return false;
        return deleteSelection();
    }
    if (key == "Escape") {
        clearSelection();
        return true;
    }
    if (modifiers & (Modifier::Ctrl | Modifier::Meta | Modifier::Alt)) return false;
    if (const std::optional<Tool> tool = toolForShortcut(key)) {
        return setTool(*tool);
    }
    return false;
}

geometry::CursorShape InteractionSession::cursorAt(Point2 screen) const {
    using geometry::CursorShape;

    if (std::holds_alternative<PanningState>(state_)) return CursorShape::Grabbing;
    if (std::holds_alternative<MovingState>(state_)) return CursorShape::Move;
    if (std::holds_alternative<RotatingState>(state_)) return CursorShape::Rotate;
    if (const auto* s = std::get_if<ResizingState>(&state_)) {
        ElementPtr current = store_.find(s->before->id);
        return geometry::cursorForHandle(s->action.handle, current ? current->rotation : s->before->rotation);
    }
    if (tool_ == Tool::Hand) return CursorShape::Grab;
    if (tool_ == Tool::Image) return CursorShape::Default;
    if (tool_ != Tool::Selection) return CursorShape::Crosshair;

    const Point2 p = toCanvas(screen);
    ElementPtr selected = selectedElement();
    if (canEdit_ && selected) {
        if (const std::optional<BoundingBox> bounds = geometry::elementBounds(*selected)) {
            const geometry::ResizeHandle handle = geometry::findResizeHandle(
                p, *bounds, camera_.z, selected->rotation, config_.handleThresholdPx, config_.rotateHandleOffsetPx);
            if (handle != geometry::ResizeHandle::None) return geometry::cursorForHandle(handle, selected->rotation);
        }
    }
    if (canEdit_ && store_.topmostHit(p, hitPadding())) return CursorShape::Move;
    return CursorShape::Default;
}

// ==============================================================================
// Selection tool
// ==============================================================================

void InteractionSession::beginSelection(Point2 p) {
    ElementPtr selected = selectedElement();
    if (selected && canEdit_) {
        if (const std::optional<BoundingBox> bounds = geometry::elementBounds(*selected)) {
            const geometry::ResizeHandle handle = geometry::findResizeHandle(
                p, *bounds, camera_.z, selected->rotation, config_.handleThresholdPx, config_.rotateHandleOffsetPx);
            if (handle == geometry::ResizeHandle::Rotate) {
                if (std::optional<RotateAction> action = TransformEngine::beginRotate(*selected, p)) {
                    state_ = RotatingState{selected, *action};
                    return;
                }
            } else if (handle != geometry::ResizeHandle::None) {
                if (std::optional<ResizeAction> action = TransformEngine::beginResize(*selected, handle, p)) {
                    state_ = ResizingState{selected, std::move(*action)};
                    return;
                }
            }
        }
    }

    ElementPtr hit = store_.topmostHit(p, hitPadding());
    if (!hit) {
        clearSelection();
        state_ = IdleState{};
        return;
    }
    selectedId_ = hit->id;
    if (!canEdit_) return;
    if (std::optional<MoveAction> action = TransformEngine::beginMove(*hit, p)) {
        state_ = MovingState{hit, *action};
    }
}

void InteractionSession::updateTransform(Point2 p, bool shift) {
    ElementPtr target = gestureTarget(state_);
    if (!target) return;

    ElementPtr current = store_.find(target->id);
    if (!current) {
        // Removed under the pointer (remote delete).
        state_ = IdleState{};
        return;
    }

    if (const auto* s = std::get_if<MovingState>(&state_)) {
        store_.replace(makeElement(TransformEngine::applyMove(*current, s->action, p)));
    } else if (const auto* s = std::get_if<ResizingState>(&state_)) {
        store_.replace(makeElement(TransformEngine::applyResize(*current, s->action, p, shift)));
    } else if (const auto* s = std::get_if<RotatingState>(&state_)) {
        store_.replace(makeElement(TransformEngine::applyRotate(*current, s->action, p, shift)));
    }
}

void InteractionSession::finishTransform() {
    ElementPtr before = gestureTarget(state_);
    state_ = IdleState{};
    if (!before) return;

    ElementPtr after = store_.find(before->id);
    if (!after) return;
    commitUpdate(*before, *after);
}

ElementPtr InteractionSession::selectedElement() const {
    if (selectedId_.empty()) return nullptr;
    return store_.find(selectedId_);
}

bool InteractionSession::select(const std::string& id) {
    if (!store_.contains(id)) {
        reportError(BoardError::UnknownElement);
        return false;
    }
    selectedId_ = id;
    return true;
}

void InteractionSession::clearSelection() noexcept {
    selectedId_.clear();
}

bool InteractionSession::deleteSelection() {
    if (!requireEdit()) return false;
    if (selectedId_.empty()) {
        reportError(BoardError::NoSelection);
        return false;
    }
    const std::string id = selectedId_;
    clearSelection();
    if (!commitDelete(id)) {
        reportError(BoardError::UnknownElement);
        return false;
    }
    return true;
}

bool InteractionSession::setSelectionStyle(const ElementPatch& patch) {
    if (!requireEdit()) return false;

    ElementPatch style = styleOnly(patch);
    if (!isValidStyle(style)) {
        reportError(BoardError::InvalidInput);
        return false;
    }
    if (style.opacity) style.opacity = std::clamp(*style.opacity, 0.0f, 1.0f);

    if (style.strokeColor) style_.strokeColor = *style.strokeColor;
    if (style.fillColor) style_.fillColor = *style.fillColor;
    if (style.strokeWidth) style_.strokeWidth = *style.strokeWidth;
    if (style.strokeDash) style_.strokeDash = *style.strokeDash;
    if (style.opacity) style_.opacity = *style.opacity;
    if (style.fontFamily) style_.fontFamily = *style.fontFamily;
    if (style.fontSize) style_.fontSize = *style.fontSize;
    if (style.textAlign) style_.textAlign = *style.textAlign;

    ElementPtr before = selectedElement();
    if (!before) return true;

    const Element after = applyPatch(*before, style);
    store_.replace(makeElement(after));
    commitUpdate(*before, after);
    return true;
}

bool InteractionSession::bringToFront() {
    if (!requireEdit()) return false;
    ElementPtr before = selectedElement();
    if (!before) {
        reportError(BoardError::NoSelection);
        return false;
    }
    Element after = *before;
    after.layer = store_.maxLayer() + 1;
    store_.replace(makeElement(after));
    commitUpdate(*before, after);
    return true;
}

bool InteractionSession::sendToBack() {
    if (!requireEdit()) return false;
    ElementPtr before = selectedElement();
    if (!before) {
        reportError(BoardError::NoSelection);
        return false;
    }
    Element after = *before;
    after.layer = store_.minLayer() - 1;
    store_.replace(makeElement(after));
    commitUpdate(*before, after);
    return true;
}

void InteractionSession::handleElementRemoved(const std::string& id) {
    if (selectedId_ == id) clearSelection();

    ElementPtr target = gestureTarget(state_);
    if (target && target->id == id) state_ = IdleState{};

    if (const auto* st = std::get_if<EditingTextState>(&state_)) {
        if (st->node.elementId && *st->node.elementId == id) state_ = IdleState{};
    }
}

void InteractionSession::reconcile() {
    if (!selectedId_.empty() && !store_.contains(selectedId_)) clearSelection();

    ElementPtr target = gestureTarget(state_);
    if (target && !store_.contains(target->id)) state_ = IdleState{};

    if (const auto* st = std::get_if<EditingTextState>(&state_)) {
        if (st->node.elementId && !store_.contains(*st->node.elementId)) state_ = IdleState{};
    }
}

// ==============================================================================
// Commit helpers
// ==============================================================================

void InteractionSession::commitCreate(Element element) {
    const std::string id = element.id;
    store_.upsert(makeElement(element));
    history_.record(HistoryItem::create(id));
    sync_.persistInsert(element);
    notifyMutation();
}

void InteractionSession::commitUpdate(const Element& before, const Element& after) {
    auto [previous, next] = diffElements(before, after);
    if (next.empty()) return;
    sync_.persistUpdate(after.id, next);
    history_.record(HistoryItem::update(after.id, std::move(previous), std::move(next)));
    notifyMutation();
}

bool InteractionSession::commitDelete(const std::string& id) {
    if (!store_.softDelete(id)) return false;
    if (selectedId_ == id) clearSelection();
    history_.record(HistoryItem::remove(id));
    sync_.persistDelete(id);
    notifyMutation();
    return true;
}

bool InteractionSession::requireEdit() {
    if (canEdit_) return true;
    reportError(BoardError::ReadOnly);
    return false;
}

void InteractionSession::notifyMutation() {
    if (onMutation_) onMutation_();
}

} // namespace board
