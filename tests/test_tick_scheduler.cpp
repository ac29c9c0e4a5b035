#include <gtest/gtest.h>
#include "errors.hpp"
#include "tick_scheduler.hpp"

// ============================================================================
// TickScheduler Tests
// ============================================================================

TEST(TickSchedulerTest, DefaultIntervalIsSixtyPerSecond) {
    TickScheduler s;
    EXPECT_EQ(s.ticksPerSecond(), 60);
    EXPECT_DOUBLE_EQ(s.interval(), 1000.0 / 60.0);
}

TEST(TickSchedulerTest, TicksOnceThresholdReached) {
    TickScheduler s(60);
    EXPECT_FALSE(s.advance(10.0));
    EXPECT_TRUE(s.advance(10.0));
    EXPECT_NEAR(s.pending(), 20.0 - 1000.0 / 60.0, 1e-9);
    EXPECT_FALSE(s.advance(1.0));
}

TEST(TickSchedulerTest, AtMostOneTickPerFrame) {
    TickScheduler s(60);
    EXPECT_TRUE(s.advance(40.0));
    EXPECT_TRUE(s.advance(0.0));
    EXPECT_FALSE(s.advance(0.0));
}

TEST(TickSchedulerTest, FastFramesTickAtTargetRate) {
    TickScheduler s(50);   // 20 ms
    int ticks = 0;
    for (int frame = 0; frame < 1000; ++frame)
        if (s.advance(5.0)) ++ticks;
    EXPECT_EQ(ticks, 250);
}

TEST(TickSchedulerTest, NegativeElapsedIsIgnored) {
    TickScheduler s(10);
    EXPECT_FALSE(s.advance(-500.0));
    EXPECT_DOUBLE_EQ(s.pending(), 0.0);
    EXPECT_TRUE(s.advance(100.0));
}

TEST(TickSchedulerTest, NonPositiveRateIsInvalid) {
    EXPECT_THROW(TickScheduler(0), InvalidConfiguration);
    EXPECT_THROW(TickScheduler(-30), InvalidConfiguration);
}

TEST(TickSchedulerTest, StallIsNotPaidBackAtFrameRate) {
    TickScheduler s(60);
    EXPECT_TRUE(s.advance(5000.0));
    EXPECT_LE(s.pending(), 250.0);

    // Five seconds of 120 fps frames: the dropped stall must not push the
    // simulation above 60 tps beyond the capped backlog.
    int ticks = 0;
    for (int frame = 0; frame < 600; ++frame)
        if (s.advance(1000.0 / 120.0)) ++ticks;
    EXPECT_LE(ticks, 300 + 15);
    EXPECT_GE(ticks, 300);
}

TEST(TickSchedulerTest, CapAlwaysAllowsOneInterval) {
    TickScheduler s(2, 100.0);   // 500 ms interval
    EXPECT_DOUBLE_EQ(s.maxPending(), 500.0);
    EXPECT_FALSE(s.advance(400.0));
    EXPECT_TRUE(s.advance(100.0));
    EXPECT_THROW(TickScheduler(60, 0.0), InvalidConfiguration);
}
