#include "board/text/font_text_measurer.h"

#include "board/text/font_manager.h"

#include <hb.h>

namespace board::text {

FontTextMeasurer::FontTextMeasurer(FontManager& fonts)
    : fonts_(fonts), buffer_(hb_buffer_create()) {}

FontTextMeasurer::~FontTextMeasurer() {
    if (buffer_) {
        hb_buffer_destroy(buffer_);
        buffer_ = nullptr;
    }
}

float FontTextMeasurer::measure(std::string_view text, const std::string& fontFamily, float fontSize) const {
    if (text.empty()) return 0.0f;

    const FontHandle* handle = fonts_.findFont(fontFamily);
    if (!handle || !handle->hbFont || !buffer_ || !fonts_.setFontSize(handle->id, fontSize)) {
        return fallback_.measure(text, fontFamily, fontSize);
    }

    hb_buffer_reset(buffer_);
    hb_buffer_add_utf8(buffer_, text.data(), static_cast<int>(text.size()), 0, -1);
    hb_buffer_guess_segment_properties(buffer_);
    hb_shape(handle->hbFont, buffer_, nullptr, 0);

    unsigned int glyphCount = 0;
    const hb_glyph_position_t* positions = hb_buffer_get_glyph_positions(buffer_, &glyphCount);
    if (!positions) {
        return fallback_.measure(text, fontFamily, fontSize);
    }

    // HarfBuzz positions are 26.6 fixed point
    float width = 0.0f;
    for (unsigned int i = 0; i < glyphCount; ++i) {
        width += static_cast<float>(positions[i].x_advance) / 64.0f;
    }
    return width;
}

} // namespace board::text
