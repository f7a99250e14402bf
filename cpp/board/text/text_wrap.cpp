#include "board/text/text_wrap.h"

#include "board/core/string_utils.h"

namespace board::text {

namespace {

void hardBreak(const MeasureFn& measure, std::string_view line, float maxWidth, std::vector<std::string>& out) {
    const std::vector<std::string_view> chars = splitCodepoints(line);
    if (chars.empty()) {
        out.emplace_back();
        return;
    }

    std::string temp(chars[0]);
    for (std::size_t k = 1; k < chars.size(); ++k) {
        std::string candidate = temp;
        candidate.append(chars[k]);
        if (measure(candidate) < maxWidth) {
            temp = std::move(candidate);
        } else {
            out.push_back(std::move(temp));
            temp.assign(chars[k]);
        }
    }
    out.push_back(std::move(temp));
}

} // namespace

float ApproxTextMeasurer::measure(std::string_view text, const std::string& fontFamily, float fontSize) const {
    (void)fontFamily;
    return static_cast<float>(codepointCount(text)) * fontSize * kAdvanceFactor;
}

std::vector<std::string> wrapText(const MeasureFn& measure, std::string_view text, float maxWidth) {
    std::vector<std::string> result;

    for (const std::string_view paragraph : splitOn(text, '\n')) {
        const std::vector<std::string_view> words = splitOn(paragraph, ' ');

        std::vector<std::string> lines;
        std::string current(words.empty() ? std::string_view() : words[0]);
        for (std::size_t i = 1; i < words.size(); ++i) {
            std::string candidate = current;
            candidate.push_back(' ');
            candidate.append(words[i]);
            if (measure(candidate) < maxWidth) {
                current = std::move(candidate);
            } else {
                lines.push_back(std::move(current));
                current.assign(words[i]);
            }
        }
        lines.push_back(std::move(current));

        for (std::string& line : lines) {
            if (measure(line) <= maxWidth) {
                result.push_back(std::move(line));
            } else {
                hardBreak(measure, line, maxWidth, result);
            }
        }
    }

    return result;
}

std::vector<std::string> wrapText(
    const TextMeasurer& measurer,
    std::string_view text,
    float maxWidth,
    const std::string& fontFamily,
    float fontSize) {
    const MeasureFn fn = [&](std::string_view s) { return measurer.measure(s, fontFamily, fontSize); };
    return wrapText(fn, text, maxWidth);
}

} // namespace board::text
