#include <gtest/gtest.h>

#include "board/geometry/geometry.h"
#include "board/geometry/handles.h"

using namespace board;
using namespace board::geometry;

namespace {
constexpr float kThreshold = 12.0f;
constexpr float kRotateOffset = 30.0f;
const BoundingBox kBox = boxFromRect(0.0f, 0.0f, 100.0f, 50.0f);
}

TEST(HandlesTest, CodesRoundTrip) {
    const ResizeHandle all[] = {
        ResizeHandle::TopLeft, ResizeHandle::TopRight, ResizeHandle::BottomLeft, ResizeHandle::BottomRight,
        ResizeHandle::TopMiddle, ResizeHandle::BottomMiddle, ResizeHandle::LeftMiddle, ResizeHandle::RightMiddle,
        ResizeHandle::Rotate};
    for (const ResizeHandle h : all) {
        const auto parsed = parseHandleCode(handleCode(h));
        ASSERT_TRUE(parsed.has_value());
        EXPECT_EQ(*parsed, h);
    }
    EXPECT_FALSE(parseHandleCode("xx").has_value());
    EXPECT_STREQ(handleCode(ResizeHandle::RightMiddle), "rm");
    EXPECT_STREQ(handleCode(ResizeHandle::Rotate), "rot");
}

TEST(HandlesTest, FindsCornerAndEdgeHandles) {
    EXPECT_EQ(findResizeHandle({1.0f, 1.0f}, kBox, 1.0f, 0.0f, kThreshold, kRotateOffset), ResizeHandle::TopLeft);
    EXPECT_EQ(findResizeHandle({99.0f, 49.0f}, kBox, 1.0f, 0.0f, kThreshold, kRotateOffset), ResizeHandle::BottomRight);
    EXPECT_EQ(findResizeHandle({100.0f, 25.0f}, kBox, 1.0f, 0.0f, kThreshold, kRotateOffset), ResizeHandle::RightMiddle);
    EXPECT_EQ(findResizeHandle({50.0f, 51.0f}, kBox, 1.0f, 0.0f, kThreshold, kRotateOffset), ResizeHandle::BottomMiddle);
    EXPECT_EQ(findResizeHandle({50.0f, 25.0f}, kBox, 1.0f, 0.0f, kThreshold, kRotateOffset), ResizeHandle::None);
}

TEST(HandlesTest, RotateHandleSitsAboveTopEdge) {
    EXPECT_EQ(findResizeHandle({50.0f, -30.0f}, kBox, 1.0f, 0.0f, kThreshold, kRotateOffset), ResizeHandle::Rotate);
    // At zoom 2 the handle is 15 canvas units above the edge.
    EXPECT_EQ(findResizeHandle({50.0f, -15.0f}, kBox, 2.0f, 0.0f, kThreshold, kRotateOffset), ResizeHandle::Rotate);
}

TEST(HandlesTest, ThresholdScalesWithZoom) {
    const Point2 p{100.0f, 25.0f + 8.0f};
    EXPECT_EQ(findResizeHandle(p, kBox, 1.0f, 0.0f, kThreshold, kRotateOffset), ResizeHandle::RightMiddle);
    EXPECT_EQ(findResizeHandle(p, kBox, 2.0f, 0.0f, kThreshold, kRotateOffset), ResizeHandle::None);
}

TEST(HandlesTest, DetectionFollowsRotation) {
    const float rotation = 90.0f;
    const Point2 rm = handleWorldPosition(ResizeHandle::RightMiddle, kBox, 1.0f, rotation, kRotateOffset);
    EXPECT_NEAR(rm.x, 50.0f, 1e-3f);
    EXPECT_NEAR(rm.y, 75.0f, 1e-3f);
    EXPECT_EQ(findResizeHandle(rm, kBox, 1.0f, rotation, kThreshold, kRotateOffset), ResizeHandle::RightMiddle);
}

TEST(HandlesTest, CursorQuantizesEffectiveAngle) {
    EXPECT_EQ(cursorForHandle(ResizeHandle::TopMiddle, 0.0f), CursorShape::NsResize);
    EXPECT_EQ(cursorForHandle(ResizeHandle::RightMiddle, 0.0f), CursorShape::EwResize);
    EXPECT_EQ(cursorForHandle(ResizeHandle::TopRight, 0.0f), CursorShape::NeswResize);
    EXPECT_EQ(cursorForHandle(ResizeHandle::BottomRight, 0.0f), CursorShape::NwseResize);
    EXPECT_EQ(cursorForHandle(ResizeHandle::RightMiddle, 90.0f), CursorShape::NsResize);
    EXPECT_EQ(cursorForHandle(ResizeHandle::TopMiddle, 450.0f), CursorShape::EwResize);
    EXPECT_EQ(cursorForHandle(ResizeHandle::TopMiddle, -45.0f), CursorShape::NwseResize);
    EXPECT_EQ(cursorForHandle(ResizeHandle::Rotate, 30.0f), CursorShape::Rotate);
    EXPECT_EQ(cursorForHandle(ResizeHandle::None, 0.0f), CursorShape::Default);
}
