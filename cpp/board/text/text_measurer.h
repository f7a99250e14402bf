#pragma once

#include <string>
#include <string_view>

namespace board::text {

// Width of a single line of text in canvas units.
class TextMeasurer {
public:
    virtual ~TextMeasurer() = default;
    virtual float measure(std::string_view text, const std::string& fontFamily, float fontSize) const = 0;
};

// Average-advance estimate used when no font face is available.
class ApproxTextMeasurer : public TextMeasurer {
public:
    static constexpr float kAdvanceFactor = 0.6f;

    float measure(std::string_view text, const std::string& fontFamily, float fontSize) const override;
};

} // namespace board::text
