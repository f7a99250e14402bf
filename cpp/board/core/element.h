#pragma once

#include "board/core/types.h"

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace board {

// A drawable record. Instances held by the ElementStore are immutable; every
// mutation produces a new Element that replaces the old one wholesale.
struct Element {
    std::string id;
    std::string spaceId;
    std::string authorId;
    ElementKind kind = ElementKind::Rect;

    // Anchor; authoritative geometry for every kind except Pencil.
    float x = 0.0f;
    float y = 0.0f;
    std::optional<float> width;
    std::optional<float> height;

    // Authoritative geometry for Pencil only.
    std::vector<Point2> points;

    std::string strokeColor = "#000000";
    std::string fillColor;  // empty = transparent
    float strokeWidth = 3.0f;
    std::vector<float> strokeDash;
    float opacity = 1.0f;
    float rotation = 0.0f;  // degrees, unbounded

    std::string text;
    std::string fontFamily;
    float fontSize = 0.0f;
    TextAlign textAlign = TextAlign::Left;

    std::string imageUrl;

    std::int64_t layer = 0;
    bool deleted = false;
    double createdAt = 0.0;
    double updatedAt = 0.0;
};

using ElementPtr = std::shared_ptr<const Element>;

// Partial attribute set used for remote updates, history and style edits.
struct ElementPatch {
    std::optional<float> x;
    std::optional<float> y;
    std::optional<float> width;
    std::optional<float> height;
    std::optional<std::vector<Point2>> points;
    std::optional<std::string> strokeColor;
    std::optional<std::string> fillColor;
    std::optional<float> strokeWidth;
    std::optional<std::vector<float>> strokeDash;
    std::optional<float> opacity;
    std::optional<float> rotation;
    std::optional<std::string> text;
    std::optional<std::string> fontFamily;
    std::optional<float> fontSize;
    std::optional<TextAlign> textAlign;
    std::optional<std::string> imageUrl;
    std::optional<std::int64_t> layer;
    std::optional<bool> deleted;

    bool empty() const noexcept;
    bool touchesStyle() const noexcept;
};

const char* kindName(ElementKind kind) noexcept;
std::optional<ElementKind> parseKind(std::string_view name) noexcept;
const char* textAlignName(TextAlign align) noexcept;
std::optional<TextAlign> parseTextAlign(std::string_view name) noexcept;

bool usesPathPoints(ElementKind kind) noexcept;

ElementPtr makeElement(Element element);

// Returns a copy of `base` with every field present in `patch` overwritten.
Element applyPatch(const Element& base, const ElementPatch& patch);

// Returns {previous, next} patches holding only the fields that differ.
std::pair<ElementPatch, ElementPatch> diffElements(const Element& before, const Element& after);

// Style-only subset (colors, stroke, opacity, font) of `patch`.
ElementPatch styleOnly(const ElementPatch& patch);

} // namespace board
