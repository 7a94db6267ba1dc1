// Copyright (c) 2025 <Your Name>
/**
 * @file
 * @test MonotonicTimeSourceTest.NonDecreasing
 * @brief Platform time source never goes backward and tracks real time.
 *
 * @steps
 * 1. Read NowMs() repeatedly and compare with the previous reading.
 * 2. Sleep 20ms and compare the difference.
 *
 * @expected Readings are non-decreasing; the sleep is visible.
 */
#include "frameclock/monotonic_time_source.hpp"

#include <gtest/gtest.h>

#include <chrono>
#include <thread>

using frameclock::MonotonicTimeSource;

TEST(MonotonicTimeSourceTest, NonDecreasing) {
  MonotonicTimeSource source;
  double prev = source.NowMs();
  for (int i = 0; i < 1000; ++i) {
    double cur = source.NowMs();
    EXPECT_GE(cur, prev) << "time decreased";
    prev = cur;
  }

  double before = source.NowMs();
  std::this_thread::sleep_for(std::chrono::milliseconds(20));
  EXPECT_GE(source.NowMs() - before, 15.0);
}

TEST(MonotonicTimeSourceTest, InstanceIsShared) {
  EXPECT_EQ(&MonotonicTimeSource::Instance(), &MonotonicTimeSource::Instance());
}
