#include <gtest/gtest.h>

#include "board/core/element.h"
#include "board/core/id_generator.h"
#include "tests/board_test_common.h"

#include <set>

using namespace board;
using board_test::makeRect;

TEST(ElementTest, KindWireNames) {
    EXPECT_STREQ(kindName(ElementKind::Pencil), "pencil");
    EXPECT_STREQ(kindName(ElementKind::Diamond), "diamond");
    EXPECT_EQ(parseKind("arrow"), ElementKind::Arrow);
    EXPECT_EQ(parseKind("image"), ElementKind::Image);
    EXPECT_FALSE(parseKind("circle").has_value());
    EXPECT_EQ(parseTextAlign("center"), TextAlign::Center);
}

TEST(ElementTest, ApplyPatchOverwritesOnlyPresentFields) {
    const Element base = makeRect("a", 1.0f, 2.0f, 30.0f, 40.0f);
    ElementPatch patch;
    patch.x = 10.0f;
    patch.strokeColor = "#ff0000";
    patch.opacity = 3.0f;

    const Element out = applyPatch(base, patch);
    EXPECT_FLOAT_EQ(out.x, 10.0f);
    EXPECT_FLOAT_EQ(out.y, 2.0f);
    EXPECT_EQ(out.strokeColor, "#ff0000");
    EXPECT_FLOAT_EQ(out.opacity, 1.0f);
    EXPECT_EQ(out.width, base.width);
    EXPECT_EQ(out.id, "a");
}

TEST(ElementTest, DiffHoldsOnlyChangedFields) {
    const Element before = makeRect("a", 0.0f, 0.0f, 10.0f, 10.0f);
    Element after = before;
    after.x = 5.0f;
    after.rotation = 45.0f;

    const auto [prev, next] = diffElements(before, after);
    ASSERT_TRUE(next.x.has_value());
    EXPECT_FLOAT_EQ(*next.x, 5.0f);
    EXPECT_FLOAT_EQ(*prev.x, 0.0f);
    EXPECT_FLOAT_EQ(*next.rotation, 45.0f);
    EXPECT_FALSE(next.y.has_value());
    EXPECT_FALSE(next.width.has_value());
    EXPECT_FALSE(next.touchesStyle());

    const Element restored = applyPatch(after, prev);
    EXPECT_FLOAT_EQ(restored.x, before.x);
    EXPECT_FLOAT_EQ(restored.rotation, before.rotation);
}

TEST(ElementTest, DiffOfIdenticalElementsIsEmpty) {
    const Element el = makeRect("a", 0.0f, 0.0f, 10.0f, 10.0f);
    const auto [prev, next] = diffElements(el, el);
    EXPECT_TRUE(prev.empty());
    EXPECT_TRUE(next.empty());
}

TEST(ElementTest, StyleOnlyDropsGeometry) {
    ElementPatch patch;
    patch.x = 1.0f;
    patch.fillColor = "#00ff00";
    patch.strokeWidth = 8.0f;
    const ElementPatch style = styleOnly(patch);
    EXPECT_FALSE(style.x.has_value());
    EXPECT_EQ(style.fillColor, "#00ff00");
    EXPECT_TRUE(style.touchesStyle());
}

TEST(ElementTest, GeneratesVersion4Uuids) {
    IdGenerator ids(42);
    std::set<std::string> seen;
    for (int i = 0; i < 100; ++i) {
        const std::string id = ids.next();
        ASSERT_EQ(id.size(), 36u);
        EXPECT_EQ(id[8], '-');
        EXPECT_EQ(id[13], '-');
        EXPECT_EQ(id[14], '4');
        EXPECT_EQ(id[18], '-');
        EXPECT_NE(std::string("89ab").find(id[19]), std::string::npos);
        EXPECT_EQ(id[23], '-');
        seen.insert(id);
    }
    EXPECT_EQ(seen.size(), 100u);
}
