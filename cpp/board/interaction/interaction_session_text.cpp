#include "board/interaction/interaction_session.h"

#include "board/core/logging.h"
#include "board/core/string_utils.h"
#include "board/entity/element_store.h"
#include "board/text/text_wrap.h"

#include <algorithm>

namespace board {

void InteractionSession::openWriting(WritingNode node) {
    state_ = EditingTextState{std::move(node)};
}

const WritingNode* InteractionSession::writingNode() const noexcept {
    if (const auto* st = std::get_if<EditingTextState>(&state_)) return &st->node;
    return nullptr;
}

bool InteractionSession::setWritingText(std::string text) {
    auto* st = std::get_if<EditingTextState>(&state_);
    if (!st) return false;
    st->node.text = std::move(text);
    return true;
}

void InteractionSession::cancelWriting() {
    if (std::holds_alternative<EditingTextState>(state_)) state_ = IdleState{};
}

bool InteractionSession::commitWriting() {
    auto* st = std::get_if<EditingTextState>(&state_);
    if (!st) return false;
    WritingNode node = std::move(st->node);
    state_ = IdleState{};

    if (isBlank(node.text)) {
        BOARD_LOG_DEBUG("text: discarded blank text box");
        return false;
    }

    const float height = textHeight(node.text, node.width, node.fontFamily, node.fontSize);

    if (node.elementId) {
        ElementPtr before = store_.find(*node.elementId);
        if (!before || before->text == node.text) return false;
        Element after = *before;
        after.text = node.text;
        after.height = height;
        store_.replace(makeElement(after));
        commitUpdate(*before, after);
        return true;
    }

    Element el = newElement(ElementKind::Text, node.position);
    el.width = node.width;
    el.height = height;
    el.text = std::move(node.text);
    el.strokeColor = node.strokeColor;
    el.fontFamily = node.fontFamily;
    el.fontSize = node.fontSize;
    el.textAlign = node.textAlign;
    el.opacity = node.opacity;
    commitCreate(std::move(el));
    return true;
}

float InteractionSession::textHeight(const std::string& content, float width, const std::string& family, float fontSize) const {
    const std::size_t lines = text::wrapText(measurer_, content, width, family, fontSize).size();
    return static_cast<float>(std::max<std::size_t>(lines, 1)) * fontSize * config_.textLineHeightFactor;
}

std::vector<std::string> InteractionSession::textLines(const Element& element) const {
    const std::string& family = element.fontFamily.empty() ? config_.defaultFontFamily : element.fontFamily;
    const float fontSize = element.fontSize > 0.0f ? element.fontSize : config_.defaultFontSize;
    return text::wrapText(measurer_, element.text, element.width.value_or(config_.minTextWidth), family, fontSize);
}

} // namespace board
