// Copyright (c) 2025 <Your Name>
/**
 * @test StopwatchClock basic operations
 * @brief Test start/stop, seek, rate and reset behaviour against a manual
 *        time source.
 */
#include "frameclock/stopwatch_clock.hpp"

#include <gtest/gtest.h>

#include "support/fake_clocks.hpp"

using frameclock::StopwatchClock;
using frameclock::fakes::ManualTimeSource;

TEST(StopwatchClockTest, StartsStoppedAtZero) {
  ManualTimeSource time(5000.0);
  StopwatchClock clock(&time);
  EXPECT_DOUBLE_EQ(clock.CurrentTime(), 0.0);
  EXPECT_FALSE(clock.IsRunning());
  EXPECT_DOUBLE_EQ(clock.Rate(), 1.0);
  EXPECT_EQ(clock.GetTimeSource(), &time);
}

TEST(StopwatchClockTest, AdvancesOnlyWhileRunning) {
  ManualTimeSource time;
  StopwatchClock clock(&time);

  clock.Start();
  time.AdvanceMs(100.0);
  EXPECT_DOUBLE_EQ(clock.CurrentTime(), 100.0);

  clock.Stop();
  time.AdvanceMs(50.0);
  EXPECT_DOUBLE_EQ(clock.CurrentTime(), 100.0);

  clock.Start();
  time.AdvanceMs(25.0);
  EXPECT_DOUBLE_EQ(clock.CurrentTime(), 125.0);
}

TEST(StopwatchClockTest, RepeatedStartDoesNotReanchor) {
  ManualTimeSource time;
  StopwatchClock clock(&time);

  clock.Start();
  time.AdvanceMs(40.0);
  clock.Start();
  time.AdvanceMs(10.0);
  EXPECT_DOUBLE_EQ(clock.CurrentTime(), 50.0);
}

TEST(StopwatchClockTest, RateChangeKeepsTimeContinuous) {
  ManualTimeSource time;
  StopwatchClock clock(&time);

  clock.Start();
  time.AdvanceMs(100.0);
  clock.SetRate(2.0);
  EXPECT_DOUBLE_EQ(clock.CurrentTime(), 100.0);

  time.AdvanceMs(50.0);
  EXPECT_DOUBLE_EQ(clock.CurrentTime(), 200.0);

  clock.ResetSpeedAdjustments();
  EXPECT_DOUBLE_EQ(clock.Rate(), 1.0);
  time.AdvanceMs(10.0);
  EXPECT_DOUBLE_EQ(clock.CurrentTime(), 210.0);
}

TEST(StopwatchClockTest, SeekAcceptsNegativePositions) {
  ManualTimeSource time;
  StopwatchClock clock(&time);

  EXPECT_TRUE(clock.Seek(-500.0));
  EXPECT_DOUBLE_EQ(clock.CurrentTime(), -500.0);

  clock.Start();
  time.AdvanceMs(100.0);
  EXPECT_DOUBLE_EQ(clock.CurrentTime(), -400.0);

  // Seeking while running continues from the new position.
  EXPECT_TRUE(clock.Seek(1000.0));
  time.AdvanceMs(20.0);
  EXPECT_DOUBLE_EQ(clock.CurrentTime(), 1020.0);
}

TEST(StopwatchClockTest, ResetStopsAtZero) {
  ManualTimeSource time;
  StopwatchClock clock(&time);

  clock.Start();
  time.AdvanceMs(300.0);
  clock.Reset();
  EXPECT_FALSE(clock.IsRunning());
  EXPECT_DOUBLE_EQ(clock.CurrentTime(), 0.0);

  time.AdvanceMs(300.0);
  EXPECT_DOUBLE_EQ(clock.CurrentTime(), 0.0);
}
