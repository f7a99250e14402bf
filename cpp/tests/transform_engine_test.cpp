#include <gtest/gtest.h>

#include "board/geometry/geometry.h"
#include "board/geometry/handles.h"
#include "board/interaction/transform_engine.h"
#include "tests/board_test_common.h"

#include <cmath>

using namespace board;
using geometry::ResizeHandle;
using board_test::kTol;
using board_test::makePencil;
using board_test::makeRect;

namespace {

Element resizeBy(const Element& el, ResizeHandle handle, Point2 start, Point2 delta, bool keepAspect = false) {
    const auto action = TransformEngine::beginResize(el, handle, start);
    EXPECT_TRUE(action.has_value());
    return TransformEngine::applyResize(el, *action, {start.x + delta.x, start.y + delta.y}, keepAspect);
}

void expectSameBox(const Element& a, const Element& b) {
    const auto ba = geometry::elementBounds(a);
    const auto bb = geometry::elementBounds(b);
    ASSERT_TRUE(ba && bb);
    EXPECT_NEAR(ba->minX, bb->minX, 1e-2f);
    EXPECT_NEAR(ba->minY, bb->minY, 1e-2f);
    EXPECT_NEAR(ba->width, bb->width, 1e-2f);
    EXPECT_NEAR(ba->height, bb->height, 1e-2f);
}

Point2 worldPoint(const Element& el, Point2 local) {
    const auto box = geometry::elementBounds(el);
    return geometry::rotatePoint(local, box->center(), el.rotation);
}

const ResizeHandle kResizeHandles[] = {
    ResizeHandle::TopLeft, ResizeHandle::TopRight, ResizeHandle::BottomLeft, ResizeHandle::BottomRight,
    ResizeHandle::TopMiddle, ResizeHandle::BottomMiddle, ResizeHandle::LeftMiddle, ResizeHandle::RightMiddle};

} // namespace

TEST(TransformEngineTest, RotatedRightMiddleResizeKeepsLeftMiddleFixed) {
    const Element rect = makeRect("a", 0.0f, 0.0f, 100.0f, 50.0f, 0, 90.0f);
    const Point2 leftMiddleBefore = worldPoint(rect, {0.0f, 25.0f});

    // +20 along the local x axis is +20 along canvas y after a 90 degree turn.
    const Point2 rm = geometry::handleWorldPosition(
        ResizeHandle::RightMiddle, *geometry::elementBounds(rect), 1.0f, rect.rotation, 30.0f);
    const Element out = resizeBy(rect, ResizeHandle::RightMiddle, rm, {0.0f, 20.0f});

    EXPECT_NEAR(*out.width, 120.0f, kTol);
    EXPECT_NEAR(*out.height, 50.0f, kTol);
    EXPECT_NEAR(out.rotation, 90.0f, kTol);
    EXPECT_NEAR(out.x, -10.0f, kTol);
    EXPECT_NEAR(out.y, 10.0f, kTol);

    const Point2 leftMiddleAfter = worldPoint(out, {out.x, out.y + *out.height * 0.5f});
    EXPECT_NEAR(leftMiddleAfter.x, leftMiddleBefore.x, kTol);
    EXPECT_NEAR(leftMiddleAfter.y, leftMiddleBefore.y, kTol);
}

TEST(TransformEngineTest, ResizeRoundTripRestoresBoxForAllHandlesAndRotations) {
    const Point2 deltas[] = {{7.0f, -4.0f}, {-12.5f, 9.0f}, {3.0f, 3.0f}};
    for (float rotation = -180.0f; rotation <= 360.0f; rotation += 30.0f) {
        const Element original = makeRect("a", 20.0f, -10.0f, 100.0f, 60.0f, 0, rotation);
        for (const ResizeHandle handle : kResizeHandles) {
            for (const Point2& d : deltas) {
                const Point2 start{40.0f, 15.0f};
                const Element grown = resizeBy(original, handle, start, d);
                const Element back = resizeBy(grown, handle, {start.x + d.x, start.y + d.y}, {-d.x, -d.y});
                SCOPED_TRACE(std::string(geometry::handleCode(handle)) + " rotation=" + std::to_string(rotation));
                expectSameBox(back, original);
                EXPECT_NEAR(back.x, original.x, 1e-2f);
                EXPECT_NEAR(back.y, original.y, 1e-2f);
            }
        }
    }
}

TEST(TransformEngineTest, OppositeAnchorStaysFixedUnderRotation) {
    const Element rect = makeRect("a", 0.0f, 0.0f, 80.0f, 40.0f, 0, 33.0f);
    // Top-left handle keeps the bottom-right corner.
    const Point2 brBefore = worldPoint(rect, {80.0f, 40.0f});
    const Element out = resizeBy(rect, ResizeHandle::TopLeft, {0.0f, 0.0f}, {-15.0f, -6.0f});
    const Point2 brAfter = worldPoint(out, {out.x + *out.width, out.y + *out.height});
    EXPECT_NEAR(brAfter.x, brBefore.x, kTol);
    EXPECT_NEAR(brAfter.y, brBefore.y, kTol);
}

TEST(TransformEngineTest, FlipNormalizesNegativeSize) {
    const Element rect = makeRect("a", 0.0f, 0.0f, 100.0f, 50.0f);
    const Element out = resizeBy(rect, ResizeHandle::RightMiddle, {100.0f, 25.0f}, {-150.0f, 0.0f});
    EXPECT_NEAR(out.x, -50.0f, kTol);
    EXPECT_NEAR(*out.width, 50.0f, kTol);
    EXPECT_GE(*out.height, 0.0f);
}

TEST(TransformEngineTest, AspectLockOnCorner) {
    const Element rect = makeRect("a", 0.0f, 0.0f, 100.0f, 50.0f);
    const Element out = resizeBy(rect, ResizeHandle::BottomRight, {100.0f, 50.0f}, {50.0f, 0.0f}, true);
    EXPECT_NEAR(out.x, 0.0f, kTol);
    EXPECT_NEAR(out.y, 0.0f, kTol);
    EXPECT_NEAR(*out.width, 150.0f, kTol);
    EXPECT_NEAR(*out.height, 75.0f, kTol);
}

TEST(TransformEngineTest, AspectLockOnEdgeStaysCentered) {
    const Element rect = makeRect("a", 0.0f, 0.0f, 100.0f, 50.0f);
    const Element out = resizeBy(rect, ResizeHandle::LeftMiddle, {0.0f, 25.0f}, {-20.0f, 0.0f}, true);
    EXPECT_NEAR(out.x, -20.0f, kTol);
    EXPECT_NEAR(*out.width, 120.0f, kTol);
    EXPECT_NEAR(*out.height, 60.0f, kTol);
    EXPECT_NEAR(out.y, -5.0f, kTol);
}

TEST(TransformEngineTest, FreehandScalesPointsFromOriginalBox) {
    const Element pencil = makePencil("p", {{0.0f, 0.0f}, {100.0f, 50.0f}, {50.0f, 25.0f}});
    const Element out = resizeBy(pencil, ResizeHandle::BottomRight, {100.0f, 50.0f}, {100.0f, 50.0f});
    ASSERT_EQ(out.points.size(), 3u);
    EXPECT_NEAR(out.points[1].x, 200.0f, kTol);
    EXPECT_NEAR(out.points[1].y, 100.0f, kTol);
    EXPECT_NEAR(out.points[2].x, 100.0f, kTol);
    EXPECT_NEAR(out.points[2].y, 50.0f, kTol);
    EXPECT_FALSE(out.width.has_value());
}

TEST(TransformEngineTest, FreehandMirrorsWhenFlipped) {
    const Element pencil = makePencil("p", {{0.0f, 0.0f}, {100.0f, 50.0f}});
    const Element out = resizeBy(pencil, ResizeHandle::RightMiddle, {100.0f, 25.0f}, {-200.0f, 0.0f});
    EXPECT_NEAR(out.points[0].x, 0.0f, kTol);
    EXPECT_NEAR(out.points[1].x, -100.0f, kTol);
    EXPECT_NEAR(out.points[1].y, 50.0f, kTol);
}

TEST(TransformEngineTest, LineKeepsDirectionThroughResize) {
    Element line = makeRect("l", 100.0f, 0.0f, -100.0f, 50.0f);
    line.kind = ElementKind::Line;
    const Element out = resizeBy(line, ResizeHandle::BottomRight, {100.0f, 50.0f}, {50.0f, 0.0f});
    EXPECT_NEAR(out.x, 150.0f, kTol);
    EXPECT_NEAR(*out.width, -150.0f, kTol);
    EXPECT_NEAR(*out.height, 50.0f, kTol);
}

TEST(TransformEngineTest, ResizeKeepsNonGeometryFromCurrent) {
    const Element rect = makeRect("a", 0.0f, 0.0f, 100.0f, 50.0f);
    const auto action = TransformEngine::beginResize(rect, ResizeHandle::RightMiddle, {100.0f, 25.0f});
    ASSERT_TRUE(action);
    Element recolored = rect;
    recolored.strokeColor = "#abcdef";
    const Element out = TransformEngine::applyResize(recolored, *action, {110.0f, 25.0f}, false);
    EXPECT_EQ(out.strokeColor, "#abcdef");
    EXPECT_NEAR(*out.width, 110.0f, kTol);
}

TEST(TransformEngineTest, BeginRejectsMalformedAndRotateHandle) {
    Element broken = makeRect("a", 0.0f, 0.0f, 10.0f, 10.0f);
    broken.height.reset();
    EXPECT_FALSE(TransformEngine::beginMove(broken, {0.0f, 0.0f}));
    EXPECT_FALSE(TransformEngine::beginRotate(broken, {0.0f, 0.0f}));
    const Element rect = makeRect("b", 0.0f, 0.0f, 10.0f, 10.0f);
    EXPECT_FALSE(TransformEngine::beginResize(rect, ResizeHandle::Rotate, {0.0f, 0.0f}));
    EXPECT_FALSE(TransformEngine::beginResize(rect, ResizeHandle::None, {0.0f, 0.0f}));
}

TEST(TransformEngineTest, MoveUsesOffsetFromBoxOrigin) {
    const Element rect = makeRect("a", 10.0f, 20.0f, 30.0f, 40.0f);
    const auto action = TransformEngine::beginMove(rect, {15.0f, 25.0f});
    ASSERT_TRUE(action);
    const Element out = TransformEngine::applyMove(rect, *action, {115.0f, 5.0f});
    EXPECT_FLOAT_EQ(out.x, 110.0f);
    EXPECT_FLOAT_EQ(out.y, 0.0f);
}

TEST(TransformEngineTest, MoveTranslatesFreehandPoints) {
    const Element pencil = makePencil("p", {{0.0f, 0.0f}, {20.0f, 10.0f}});
    const auto action = TransformEngine::beginMove(pencil, {10.0f, 10.0f});
    ASSERT_TRUE(action);
    const Element step1 = TransformEngine::applyMove(pencil, *action, {30.0f, 15.0f});
    EXPECT_FLOAT_EQ(step1.points[0].x, 20.0f);
    EXPECT_FLOAT_EQ(step1.points[0].y, 5.0f);
    // Re-applying against the moved element lands on the same spot.
    const Element step2 = TransformEngine::applyMove(step1, *action, {30.0f, 15.0f});
    EXPECT_FLOAT_EQ(step2.points[1].x, 40.0f);
    EXPECT_FLOAT_EQ(step2.points[1].y, 15.0f);
}

TEST(TransformEngineTest, RotateAddsAngleDeltaWithoutWrapping) {
    Element rect = makeRect("a", 0.0f, 0.0f, 100.0f, 50.0f, 0, 350.0f);
    const auto action = TransformEngine::beginRotate(rect, {150.0f, 25.0f});
    ASSERT_TRUE(action);
    EXPECT_NEAR(action->center.x, 50.0f, kTol);

    const Element out = TransformEngine::applyRotate(rect, *action, {50.0f, 125.0f}, false);
    EXPECT_NEAR(out.rotation, 440.0f, kTol);
}

TEST(TransformEngineTest, RotateSnapsToIncrement) {
    const Element rect = makeRect("a", 0.0f, 0.0f, 100.0f, 50.0f);
    const auto action = TransformEngine::beginRotate(rect, {150.0f, 25.0f});
    ASSERT_TRUE(action);
    const float rad = 37.0f * 3.14159265f / 180.0f;
    const Element out = TransformEngine::applyRotate(
        rect, *action, {50.0f + 100.0f * std::cos(rad), 25.0f + 100.0f * std::sin(rad)}, true);
    EXPECT_NEAR(out.rotation, 30.0f, kTol);
}
