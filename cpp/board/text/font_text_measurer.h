#pragma once

#include "board/text/text_measurer.h"

typedef struct hb_buffer_t hb_buffer_t;

namespace board::text {

class FontManager;

/**
 * Measures line widths by shaping with HarfBuzz against faces held by a
 * FontManager. Falls back to ApproxTextMeasurer when no face is loaded.
 */
class FontTextMeasurer : public TextMeasurer {
public:
    explicit FontTextMeasurer(FontManager& fonts);
    ~FontTextMeasurer() override;

    FontTextMeasurer(const FontTextMeasurer&) = delete;
    FontTextMeasurer& operator=(const FontTextMeasurer&) = delete;

    float measure(std::string_view text, const std::string& fontFamily, float fontSize) const override;

private:
    FontManager& fonts_;
    hb_buffer_t* buffer_ = nullptr;
    ApproxTextMeasurer fallback_;
};

} // namespace board::text
