#pragma once

#include "board/text/text_measurer.h"

#include <functional>
#include <string>
#include <string_view>
#include <vector>

namespace board::text {

using MeasureFn = std::function<float(std::string_view)>;

/**
 * Breaks `text` into display lines no wider than `maxWidth`.
 *
 * Each '\n'-separated paragraph is first wrapped on spaces; a line that is
 * still too wide (a single long word) is then hard-broken between code
 * points. The result is finite for any input, including non-positive widths,
 * where every code point ends up on its own line.
 */
std::vector<std::string> wrapText(const MeasureFn& measure, std::string_view text, float maxWidth);

std::vector<std::string> wrapText(
    const TextMeasurer& measurer,
    std::string_view text,
    float maxWidth,
    const std::string& fontFamily,
    float fontSize);

} // namespace board::text
