// Copyright (c) 2025 <Your Name>
#include "gameplayclock/gameplay_clock.hpp"

#include <gtest/gtest.h>

#include <stdexcept>

#include "frameclock/decoupled_clock.hpp"
#include "frameclock/stopwatch_clock.hpp"
#include "support/fake_clocks.hpp"

using frameclock::DecoupledClock;
using frameclock::StopwatchClock;
using frameclock::fakes::ManualTimeSource;
using gameplayclock::GameplayClock;

TEST(GameplayClockTest, NullUnderlyingClockThrows) {
  EXPECT_THROW({ GameplayClock clock(nullptr); }, std::invalid_argument);
}

TEST(GameplayClockTest, MirrorsUnderlyingClock) {
  ManualTimeSource time;
  StopwatchClock track(&time);
  track.SetRate(1.5);
  DecoupledClock underlying(&track, &time);
  GameplayClock clock(&underlying);

  EXPECT_TRUE(clock.IsPaused());
  EXPECT_EQ(&clock.UnderlyingClock(), &underlying);

  ASSERT_TRUE(underlying.Seek(750.0));
  EXPECT_DOUBLE_EQ(clock.CurrentTime(), 750.0);
  EXPECT_FALSE(clock.IsRunning());
  EXPECT_DOUBLE_EQ(clock.Rate(), 1.5);
}

TEST(GameplayClockTest, ProcessFrameDoesNotAdvanceUnderlyingClock) {
  ManualTimeSource time;
  StopwatchClock track(&time);
  DecoupledClock underlying(&track, &time);
  GameplayClock clock(&underlying);

  underlying.Start();
  time.AdvanceMs(50.0);
  clock.ProcessFrame();
  EXPECT_DOUBLE_EQ(clock.CurrentTime(), 0.0);

  underlying.ProcessFrame();
  EXPECT_DOUBLE_EQ(clock.CurrentTime(), 50.0);
  EXPECT_DOUBLE_EQ(clock.ElapsedFrameTime(), 50.0);
  EXPECT_TRUE(clock.IsRunning());
}
