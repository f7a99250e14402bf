#include <gtest/gtest.h>

#include "board/geometry/geometry.h"
#include "tests/board_test_common.h"

#include <limits>

using namespace board;
using namespace board::geometry;
using board_test::kTol;
using board_test::makePencil;
using board_test::makeRect;

TEST(GeometryTest, ScreenCanvasRoundTrip) {
    const Camera cameras[] = {{0.0f, 0.0f, 1.0f}, {120.0f, -40.0f, 2.5f}, {-300.0f, 75.0f, 0.1f}, {10.0f, 10.0f, 5.0f}};
    const Point2 points[] = {{0.0f, 0.0f}, {13.5f, -250.0f}, {1024.0f, 768.0f}, {-7.25f, 3.0f}};
    for (const Camera& c : cameras) {
        for (const Point2& p : points) {
            const Point2 back = canvasToScreen(screenToCanvas(p, c), c);
            EXPECT_NEAR(back.x, p.x, kTol);
            EXPECT_NEAR(back.y, p.y, kTol);
        }
    }
}

TEST(GeometryTest, ScreenToCanvasAppliesPanThenZoom) {
    const Point2 p = screenToCanvas({120.0f, 60.0f}, Camera{20.0f, 10.0f, 2.0f});
    EXPECT_FLOAT_EQ(p.x, 50.0f);
    EXPECT_FLOAT_EQ(p.y, 25.0f);
}

TEST(GeometryTest, DegenerateZoomIsTreatedAsOne) {
    const Point2 p = screenToCanvas({30.0f, 40.0f}, Camera{0.0f, 0.0f, 0.0f});
    EXPECT_FLOAT_EQ(p.x, 30.0f);
    EXPECT_FLOAT_EQ(p.y, 40.0f);
}

TEST(GeometryTest, RotatePointQuarterTurn) {
    const Point2 r = rotatePoint({10.0f, 0.0f}, {0.0f, 0.0f}, 90.0f);
    EXPECT_NEAR(r.x, 0.0f, kTol);
    EXPECT_NEAR(r.y, 10.0f, kTol);

    const Point2 back = rotatePoint(r, {0.0f, 0.0f}, -90.0f);
    EXPECT_NEAR(back.x, 10.0f, kTol);
    EXPECT_NEAR(back.y, 0.0f, kTol);
}

TEST(GeometryTest, BoundsNormalizeNegativeExtents) {
    Element el = makeRect("a", 100.0f, 50.0f, -40.0f, -20.0f);
    const auto box = elementBounds(el);
    ASSERT_TRUE(box.has_value());
    EXPECT_FLOAT_EQ(box->minX, 60.0f);
    EXPECT_FLOAT_EQ(box->minY, 30.0f);
    EXPECT_FLOAT_EQ(box->width, 40.0f);
    EXPECT_FLOAT_EQ(box->height, 20.0f);
}

TEST(GeometryTest, PencilBoundsUsePointExtrema) {
    Element el = makePencil("p", {{5.0f, 9.0f}, {-3.0f, 2.0f}, {12.0f, 4.0f}});
    const auto box = elementBounds(el);
    ASSERT_TRUE(box.has_value());
    EXPECT_FLOAT_EQ(box->minX, -3.0f);
    EXPECT_FLOAT_EQ(box->maxX, 12.0f);
    EXPECT_FLOAT_EQ(box->minY, 2.0f);
    EXPECT_FLOAT_EQ(box->maxY, 9.0f);
}

TEST(GeometryTest, MalformedGeometryHasNoBoundsAndNeverHits) {
    Element empty = makePencil("p", {});
    EXPECT_FALSE(elementBounds(empty).has_value());
    EXPECT_FALSE(isHit({0.0f, 0.0f}, empty, 10.0f));

    Element noWidth = makeRect("r", 0.0f, 0.0f, 10.0f, 10.0f);
    noWidth.width.reset();
    EXPECT_FALSE(elementBounds(noWidth).has_value());
    EXPECT_FALSE(isHit({1.0f, 1.0f}, noWidth, 0.0f));

    Element nan = makeRect("n", 0.0f, 0.0f, std::numeric_limits<float>::quiet_NaN(), 10.0f);
    EXPECT_FALSE(elementBounds(nan).has_value());
}

TEST(GeometryTest, HitRespectsPadding) {
    Element el = makeRect("a", 0.0f, 0.0f, 100.0f, 50.0f);
    EXPECT_TRUE(isHit({50.0f, 25.0f}, el, 0.0f));
    EXPECT_FALSE(isHit({104.0f, 25.0f}, el, 0.0f));
    EXPECT_TRUE(isHit({104.0f, 25.0f}, el, 5.0f));
}

TEST(GeometryTest, HitUsesLocalFrameOfRotatedElement) {
    // 100x20 bar rotated 90 degrees about (50,10) stands vertically.
    Element el = makeRect("a", 0.0f, 0.0f, 100.0f, 20.0f, 0, 90.0f);
    EXPECT_TRUE(isHit({50.0f, -30.0f}, el, 0.0f));
    EXPECT_FALSE(isHit({5.0f, 10.0f}, el, 0.0f));
}

TEST(GeometryTest, SoftDeletedNeverHits) {
    Element el = makeRect("a", 0.0f, 0.0f, 100.0f, 50.0f);
    el.deleted = true;
    EXPECT_FALSE(isHit({50.0f, 25.0f}, el, 10.0f));
}

TEST(GeometryTest, HitInvariantUnderFullTurn) {
    const Point2 probes[] = {{50.0f, 25.0f}, {95.0f, 5.0f}, {-10.0f, 30.0f}, {60.0f, 70.0f}, {20.0f, -15.0f}};
    for (float theta = -720.0f; theta <= 720.0f; theta += 37.0f) {
        Element a = makeRect("a", 0.0f, 0.0f, 100.0f, 50.0f, 0, theta);
        Element b = makeRect("b", 0.0f, 0.0f, 100.0f, 50.0f, 0, theta + 360.0f);
        for (const Point2& p : probes) {
            EXPECT_EQ(isHit(p, a, 2.0f), isHit(p, b, 2.0f)) << "theta=" << theta;
        }
    }
}
