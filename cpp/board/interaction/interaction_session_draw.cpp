#include "board/interaction/interaction_session.h"

#include "board/core/id_generator.h"
#include "board/core/logging.h"
#include "board/core/util.h"
#include "board/entity/element_store.h"
#include "board/sync/sync_session.h"

#include <algorithm>
#include <cmath>

namespace board {

Element InteractionSession::newElement(ElementKind kind, Point2 p) {
    Element el;
    el.id = ids_.next();
    el.spaceId = sync_.spaceId();
    el.authorId = sync_.identity().userId;
    el.kind = kind;
    el.strokeColor = style_.strokeColor;
    el.fillColor = style_.fillColor;
    el.strokeWidth = style_.strokeWidth;
    el.strokeDash = style_.strokeDash;
    el.opacity = style_.opacity;
    el.layer = store_.size() > 0 ? store_.maxLayer() + 1 : 0;
    el.createdAt = nowMs();
    el.updatedAt = el.createdAt;

    if (usesPathPoints(kind)) {
        el.points.push_back(p);
    } else {
        el.x = p.x;
        el.y = p.y;
        el.width = 0.0f;
        el.height = 0.0f;
    }
    if (kind == ElementKind::Text) {
        el.fontFamily = style_.fontFamily;
        el.fontSize = style_.fontSize;
        el.textAlign = style_.textAlign;
    }
    return el;
}

void InteractionSession::beginDrawing(ElementKind kind, Point2 p) {
    state_ = DrawingState{newElement(kind, p), p};
}

void InteractionSession::updateDrawing(DrawingState& st, Point2 p, bool snap) {
    Element& draft = st.draft;
    if (usesPathPoints(draft.kind)) {
        const Point2& last = draft.points.back();
        if (last.x != p.x || last.y != p.y) draft.points.push_back(p);
        return;
    }

    float w = p.x - st.start.x;
    float h = p.y - st.start.y;
    if (snap) {
        if (draft.kind == ElementKind::Line || draft.kind == ElementKind::Arrow) {
            const float length = std::hypot(w, h);
            const float step = config_.lineSnapDegrees * kDegToRad;
            if (length > 0.0f && step > 0.0f) {
                const float angle = std::round(std::atan2(h, w) / step) * step;
                w = length * std::cos(angle);
                h = length * std::sin(angle);
            }
        } else {
            const float side = std::max(std::abs(w), std::abs(h));
            w = std::copysign(side, w);
            h = std::copysign(side, h);
        }
    }
    draft.width = w;
    draft.height = h;
}

void InteractionSession::finishDrawing(DrawingState& st) {
    Element el = std::move(st.draft);
    if (usesPathPoints(el.kind)) {
        commitCreate(std::move(el));
        return;
    }

    float w = el.width.value_or(0.0f);
    float h = el.height.value_or(0.0f);
    // Lines and arrows keep their direction vector.
    if (el.kind != ElementKind::Line && el.kind != ElementKind::Arrow) {
        if (w < 0.0f) {
            el.x += w;
            w = -w;
        }
        if (h < 0.0f) {
            el.y += h;
            h = -h;
        }
        el.width = w;
        el.height = h;
    }

    if (el.kind == ElementKind::Text) {
        WritingNode node;
        node.position = {el.x, el.y};
        node.width = std::max(w, config_.minTextWidth);
        node.strokeColor = el.strokeColor;
        node.fontFamily = el.fontFamily;
        node.fontSize = el.fontSize;
        node.textAlign = el.textAlign;
        node.opacity = el.opacity;
        openWriting(std::move(node));
        return;
    }

    if (std::abs(w) < config_.minShapeSize && std::abs(h) < config_.minShapeSize) {
        BOARD_LOG_DEBUG("draw: discarded %s below minimum size", kindName(el.kind));
        return;
    }
    commitCreate(std::move(el));
}

void InteractionSession::eraseAt(Point2 p) {
    const float padding = config_.paddingForZoom(config_.eraserPaddingPx, camera_.z);
    if (ElementPtr hit = store_.topmostHit(p, padding)) {
        commitDelete(hit->id);
    }
}

const Element* InteractionSession::draft() const noexcept {
    if (const auto* st = std::get_if<DrawingState>(&state_)) return &st->draft;
    return nullptr;
}

std::string InteractionSession::placeImage(const std::string& url, Point2 center, float width, float height) {
    if (!requireEdit()) return {};
    if (url.empty() || !isFinite(center.x) || !isFinite(center.y) ||
        !isFinite(width) || !isFinite(height) || width <= 0.0f || height <= 0.0f) {
        reportError(BoardError::InvalidInput);
        return {};
    }

    Element el = newElement(ElementKind::Image, {center.x - width * 0.5f, center.y - height * 0.5f});
    el.width = width;
    el.height = height;
    el.imageUrl = url;
    const std::string id = el.id;
    commitCreate(std::move(el));
    return id;
}

} // namespace board
