#include <gtest/gtest.h>

#include "board/core/string_utils.h"
#include "board/text/text_measurer.h"
#include "board/text/text_wrap.h"

#include <string>
#include <vector>

using namespace board::text;

namespace {
// 10 units per code point.
const MeasureFn kMonospace = [](std::string_view s) {
    return static_cast<float>(board::codepointCount(s)) * 10.0f;
};
}

TEST(TextWrapTest, WrapsOnWordBoundaries) {
    const std::vector<std::string> lines = wrapText(kMonospace, "hello world foo", 100.0f);
    ASSERT_EQ(lines.size(), 2u);
    EXPECT_EQ(lines[0], "hello");
    EXPECT_EQ(lines[1], "world foo");
}

TEST(TextWrapTest, HardBreaksLongWords) {
    const std::vector<std::string> lines = wrapText(kMonospace, "abcdefghijklmnop", 50.0f);
    const std::vector<std::string> expected = {"abcd", "efgh", "ijkl", "mnop"};
    EXPECT_EQ(lines, expected);
}

TEST(TextWrapTest, KeepsExplicitLineBreaks) {
    const std::vector<std::string> lines = wrapText(kMonospace, "a\n\nb", 100.0f);
    const std::vector<std::string> expected = {"a", "", "b"};
    EXPECT_EQ(lines, expected);
}

TEST(TextWrapTest, EmptyTextIsOneEmptyLine) {
    const std::vector<std::string> lines = wrapText(kMonospace, "", 100.0f);
    ASSERT_EQ(lines.size(), 1u);
    EXPECT_TRUE(lines[0].empty());
}

TEST(TextWrapTest, NonPositiveWidthStillTerminates) {
    const std::vector<std::string> lines = wrapText(kMonospace, "abc", 0.0f);
    const std::vector<std::string> expected = {"a", "b", "c"};
    EXPECT_EQ(lines, expected);
}

TEST(TextWrapTest, BreaksBetweenCodePointsNotBytes) {
    const std::vector<std::string> lines = wrapText(kMonospace, "h\xC3\xA9llo", 30.0f);
    const std::vector<std::string> expected = {"h\xC3\xA9", "ll", "o"};
    EXPECT_EQ(lines, expected);
}

TEST(TextWrapTest, RestartableWithSameResult) {
    const std::string text = "the quick brown fox jumps over the lazy dog";
    EXPECT_EQ(wrapText(kMonospace, text, 120.0f), wrapText(kMonospace, text, 120.0f));
}

TEST(TextWrapTest, ApproxMeasurerUsesAverageAdvance) {
    ApproxTextMeasurer measurer;
    EXPECT_FLOAT_EQ(measurer.measure("abcd", "sans-serif", 10.0f), 24.0f);

    // 14.4 per glyph at 24px: "hello" = 72, "hello world" = 158.4
    const std::vector<std::string> lines = wrapText(measurer, "hello world", 100.0f, "sans-serif", 24.0f);
    ASSERT_EQ(lines.size(), 2u);
    EXPECT_EQ(lines[0], "hello");
    EXPECT_EQ(lines[1], "world");
}
