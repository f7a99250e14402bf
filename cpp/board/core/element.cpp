#include "board/core/element.h"

#include <algorithm>

namespace board {

namespace {

bool samePoints(const std::vector<Point2>& a, const std::vector<Point2>& b) {
    if (a.size() != b.size()) return false;
    for (std::size_t i = 0; i < a.size(); ++i) {
        if (a[i].x != b[i].x || a[i].y != b[i].y) return false;
    }
    return true;
}

template <typename T>
void diffField(const T& before, const T& after, std::optional<T>& prev, std::optional<T>& next) {
    if (before == after) return;
    prev = before;
    next = after;
}

template <typename T>
void applyField(T& target, const std::optional<T>& value) {
    if (value) target = *value;
}

} // namespace

bool ElementPatch::empty() const noexcept {
    return !x && !y && !width && !height && !points && !strokeColor && !fillColor &&
           !strokeWidth && !strokeDash && !opacity && !rotation && !text && !fontFamily &&
           !fontSize && !textAlign && !imageUrl && !layer && !deleted;
}

bool ElementPatch::touchesStyle() const noexcept {
    return strokeColor || fillColor || strokeWidth || strokeDash || opacity || fontFamily ||
           fontSize || textAlign;
}

const char* kindName(ElementKind kind) noexcept {
    switch (kind) {
        case ElementKind::Pencil: return "pencil";
        case ElementKind::Rect: return "rect";
        case ElementKind::Diamond: return "diamond";
        case ElementKind::Ellipse: return "ellipse";
        case ElementKind::Line: return "line";
        case ElementKind::Arrow: return "arrow";
        case ElementKind::Text: return "text";
        case ElementKind::Image: return "image";
    }
    return "rect";
}

std::optional<ElementKind> parseKind(std::string_view name) noexcept {
    static constexpr ElementKind kAll[] = {
        ElementKind::Pencil, ElementKind::Rect, ElementKind::Diamond, ElementKind::Ellipse,
        ElementKind::Line, ElementKind::Arrow, ElementKind::Text, ElementKind::Image,
    };
    for (const ElementKind k : kAll) {
        if (name == kindName(k)) return k;
    }
    return std::nullopt;
}

const char* textAlignName(TextAlign align) noexcept {
    switch (align) {
        case TextAlign::Left: return "left";
        case TextAlign::Center: return "center";
        case TextAlign::Right: return "right";
    }
    return "left";
}

std::optional<TextAlign> parseTextAlign(std::string_view name) noexcept {
    if (name == "left") return TextAlign::Left;
    if (name == "center") return TextAlign::Center;
    if (name == "right") return TextAlign::Right;
    return std::nullopt;
}

bool usesPathPoints(ElementKind kind) noexcept {
    return kind == ElementKind::Pencil;
}

ElementPtr makeElement(Element element) {
    return std::make_shared<const Element>(std::move(element));
}

Element applyPatch(const Element& base, const ElementPatch& patch) {
    Element out = base;
    applyField(out.x, patch.x);
    applyField(out.y, patch.y);
    if (patch.width) out.width = *patch.width;
    if (patch.height) out.height = *patch.height;
    applyField(out.points, patch.points);
    applyField(out.strokeColor, patch.strokeColor);
    applyField(out.fillColor, patch.fillColor);
    applyField(out.strokeWidth, patch.strokeWidth);
    applyField(out.strokeDash, patch.strokeDash);
    applyField(out.opacity, patch.opacity);
    applyField(out.rotation, patch.rotation);
    applyField(out.text, patch.text);
    applyField(out.fontFamily, patch.fontFamily);
    applyField(out.fontSize, patch.fontSize);
    applyField(out.textAlign, patch.textAlign);
    applyField(out.imageUrl, patch.imageUrl);
    applyField(out.layer, patch.layer);
    applyField(out.deleted, patch.deleted);
    out.opacity = std::clamp(out.opacity, 0.0f, 1.0f);
    return out;
}

std::pair<ElementPatch, ElementPatch> diffElements(const Element& before, const Element& after) {
    ElementPatch prev;
    ElementPatch next;
    diffField(before.x, after.x, prev.x, next.x);
    diffField(before.y, after.y, prev.y, next.y);
    if (before.width != after.width) {
        prev.width = before.width.value_or(0.0f);
        next.width = after.width.value_or(0.0f);
    }
    if (before.height != after.height) {
        prev.height = before.height.value_or(0.0f);
        next.height = after.height.value_or(0.0f);
    }
    if (!samePoints(before.points, after.points)) {
        prev.points = before.points;
        next.points = after.points;
    }
    diffField(before.strokeColor, after.strokeColor, prev.strokeColor, next.strokeColor);
    diffField(before.fillColor, after.fillColor, prev.fillColor, next.fillColor);
    diffField(before.strokeWidth, after.strokeWidth, prev.strokeWidth, next.strokeWidth);
    diffField(before.strokeDash, after.strokeDash, prev.strokeDash, next.strokeDash);
    diffField(before.opacity, after.opacity, prev.opacity, next.opacity);
    diffField(before.rotation, after.rotation, prev.rotation, next.rotation);
    diffField(before.text, after.text, prev.text, next.text);
    diffField(before.fontFamily, after.fontFamily, prev.fontFamily, next.fontFamily);
    diffField(before.fontSize, after.fontSize, prev.fontSize, next.fontSize);
    diffField(before.textAlign, after.textAlign, prev.textAlign, next.textAlign);
    diffField(before.imageUrl, after.imageUrl, prev.imageUrl, next.imageUrl);
    diffField(before.layer, after.layer, prev.layer, next.layer);
    diffField(before.deleted, after.deleted, prev.deleted, next.deleted);
    return {std::move(prev), std::move(next)};
}

ElementPatch styleOnly(const ElementPatch& patch) {
    ElementPatch out;
    out.strokeColor = patch.strokeColor;
    out.fillColor = patch.fillColor;
    out.strokeWidth = patch.strokeWidth;
    out.strokeDash = patch.strokeDash;
    out.opacity = patch.opacity;
    out.fontFamily = patch.fontFamily;
    out.fontSize = patch.fontSize;
    out.textAlign = patch.textAlign;
    return out;
}

} // namespace board
