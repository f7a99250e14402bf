#include <gtest/gtest.h>

#include "board/text/font_manager.h"
#include "board/text/font_text_measurer.h"
#include "board/text/text_wrap.h"

#include <cstdint>
#include <string>
#include <vector>

using namespace board::text;

namespace {

const char* const kFontCandidates[] = {
    "/usr/share/fonts/truetype/dejavu/DejaVuSans.ttf",
    "/usr/share/fonts/dejavu/DejaVuSans.ttf",
    "/usr/share/fonts/TTF/DejaVuSans.ttf",
    "/usr/share/fonts/truetype/liberation/LiberationSans-Regular.ttf",
};

} // namespace

class FontTextMeasurerTest : public ::testing::Test {
protected:
    void SetUp() override {
        ASSERT_TRUE(fonts.initialize());
        for (const char* path : kFontCandidates) {
            fontId = fonts.loadFontFromFile(path, "Body");
            if (fontId != 0) break;
        }
        if (fontId == 0) GTEST_SKIP() << "no system TrueType font available";
    }

    FontManager fonts;
    std::uint32_t fontId = 0;
};

TEST_F(FontTextMeasurerTest, ShapedWidthGrowsWithText) {
    FontTextMeasurer measurer(fonts);
    const float one = measurer.measure("a", "Body", 24.0f);
    const float two = measurer.measure("ab", "Body", 24.0f);
    const float three = measurer.measure("abc", "Body", 24.0f);

    EXPECT_GT(one, 0.0f);
    EXPECT_GT(two, one);
    EXPECT_GT(three, two);
    EXPECT_FLOAT_EQ(measurer.measure("", "Body", 24.0f), 0.0f);
}

TEST_F(FontTextMeasurerTest, WidthScalesWithFontSize) {
    FontTextMeasurer measurer(fonts);
    const float small = measurer.measure("Whiteboard", "Body", 12.0f);
    const float large = measurer.measure("Whiteboard", "Body", 48.0f);
    EXPECT_GT(small, 0.0f);
    // Hinted advances round per glyph, so only roughly 4x.
    EXPECT_GT(large, small * 3.0f);
    EXPECT_LT(large, small * 5.0f);
}

TEST_F(FontTextMeasurerTest, ProportionalAdvancesDifferFromApproximation) {
    FontTextMeasurer measurer(fonts);
    EXPECT_LT(measurer.measure("iiii", "Body", 24.0f), measurer.measure("WWWW", "Body", 24.0f));
}

TEST_F(FontTextMeasurerTest, UnknownFamilyUsesDefaultFont) {
    FontTextMeasurer measurer(fonts);
    EXPECT_FLOAT_EQ(measurer.measure("abc", "Missing", 24.0f), measurer.measure("abc", "Body", 24.0f));
    ASSERT_NE(fonts.findFont("Missing"), nullptr);
    EXPECT_EQ(fonts.findFont("Missing")->id, fontId);
}

TEST_F(FontTextMeasurerTest, WrapsWithShapedMeasure) {
    FontTextMeasurer measurer(fonts);
    const float word = measurer.measure("hello", "Body", 24.0f);
    const std::vector<std::string> lines = wrapText(measurer, "hello hello hello", word * 1.5f, "Body", 24.0f);
    EXPECT_EQ(lines, (std::vector<std::string>{"hello", "hello", "hello"}));
}

TEST(FontManagerTest, MissingFileIsRejected) {
    FontManager fonts;
    ASSERT_TRUE(fonts.initialize());
    EXPECT_EQ(fonts.loadFontFromFile("/nonexistent/font.ttf"), 0u);
    EXPECT_EQ(fonts.getFont(0), nullptr);
}

TEST(FontManagerTest, LoadingRequiresInitialize) {
    FontManager fonts;
    const std::uint8_t bytes[] = {0, 1, 0, 0};
    EXPECT_EQ(fonts.loadFontFromMemory(bytes, sizeof(bytes)), 0u);
}

TEST(FontTextMeasurerFallbackTest, NoFontUsesApproximateAdvance) {
    FontManager fonts;
    ASSERT_TRUE(fonts.initialize());
    FontTextMeasurer measurer(fonts);
    EXPECT_FLOAT_EQ(measurer.measure("abcd", "Body", 10.0f), 4.0f * 10.0f * 0.6f);
}
