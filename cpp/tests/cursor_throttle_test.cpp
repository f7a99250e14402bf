#include <gtest/gtest.h>

#include "board/sync/cursor_throttle.h"
#include "board/sync/thumbnail_scheduler.h"

using namespace board;

TEST(CursorThrottleTest, FirstOfferGoesOutImmediately) {
    CursorThrottle throttle(30.0);
    const std::optional<Point2> out = throttle.offer({1.0f, 2.0f}, 0.0);
    ASSERT_TRUE(out.has_value());
    EXPECT_FLOAT_EQ(out->y, 2.0f);
    EXPECT_FALSE(throttle.hasPending());
}

TEST(CursorThrottleTest, TrailingEdgeCarriesLatestPoint) {
    CursorThrottle throttle(30.0);
    ASSERT_TRUE(throttle.offer({0.0f, 0.0f}, 0.0));
    EXPECT_FALSE(throttle.offer({1.0f, 0.0f}, 5.0));
    EXPECT_FALSE(throttle.offer({2.0f, 0.0f}, 10.0));
    EXPECT_TRUE(throttle.hasPending());

    EXPECT_FALSE(throttle.flush(29.0));
    const std::optional<Point2> out = throttle.flush(30.0);
    ASSERT_TRUE(out.has_value());
    EXPECT_FLOAT_EQ(out->x, 2.0f);
    EXPECT_FALSE(throttle.hasPending());
    EXPECT_FALSE(throttle.flush(100.0));
}

TEST(CursorThrottleTest, FlushRestartsTheWindow) {
    CursorThrottle throttle(30.0);
    throttle.offer({0.0f, 0.0f}, 0.0);
    throttle.offer({1.0f, 0.0f}, 10.0);
    ASSERT_TRUE(throttle.flush(40.0));
    EXPECT_FALSE(throttle.offer({2.0f, 0.0f}, 50.0));
    EXPECT_TRUE(throttle.offer({3.0f, 0.0f}, 70.0));
}

TEST(CursorThrottleTest, OfferAfterIntervalDropsPending) {
    CursorThrottle throttle(30.0);
    throttle.offer({0.0f, 0.0f}, 0.0);
    throttle.offer({1.0f, 0.0f}, 10.0);
    const std::optional<Point2> out = throttle.offer({5.0f, 0.0f}, 45.0);
    ASSERT_TRUE(out.has_value());
    EXPECT_FLOAT_EQ(out->x, 5.0f);
    EXPECT_FALSE(throttle.hasPending());
}

TEST(CursorThrottleTest, ClockGoingBackwardsReopensWindow) {
    CursorThrottle throttle(30.0);
    throttle.offer({0.0f, 0.0f}, 1000.0);
    EXPECT_TRUE(throttle.offer({1.0f, 0.0f}, 10.0));
}

TEST(CursorThrottleTest, ResetForgetsHistory) {
    CursorThrottle throttle(30.0);
    throttle.offer({0.0f, 0.0f}, 0.0);
    throttle.offer({1.0f, 0.0f}, 1.0);
    throttle.reset();
    EXPECT_FALSE(throttle.hasPending());
    EXPECT_TRUE(throttle.offer({2.0f, 0.0f}, 2.0));
}

TEST(ThumbnailSchedulerTest, FiresOnceAfterQuietPeriod) {
    ThumbnailScheduler scheduler(2000.0);
    EXPECT_FALSE(scheduler.armed());
    EXPECT_FALSE(scheduler.due(10000.0));

    scheduler.touch(0.0);
    EXPECT_TRUE(scheduler.armed());
    EXPECT_FALSE(scheduler.due(1999.0));
    EXPECT_TRUE(scheduler.due(2000.0));
    EXPECT_FALSE(scheduler.due(3000.0));
    EXPECT_FALSE(scheduler.armed());
}

TEST(ThumbnailSchedulerTest, TouchPostponesDeadline) {
    ThumbnailScheduler scheduler(2000.0);
    scheduler.touch(0.0);
    scheduler.touch(1500.0);
    EXPECT_FALSE(scheduler.due(2500.0));
    EXPECT_TRUE(scheduler.due(3500.0));
}

TEST(ThumbnailSchedulerTest, CancelDisarms) {
    ThumbnailScheduler scheduler(2000.0);
    scheduler.touch(0.0);
    scheduler.cancel();
    EXPECT_FALSE(scheduler.due(5000.0));
}
