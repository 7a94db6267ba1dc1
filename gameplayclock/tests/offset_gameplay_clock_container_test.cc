// Copyright (c) 2025 <Your Name>
/**
 * @file
 * @brief OffsetGameplayClockContainer tests: platform (rate-scaled) and user
 *        offsets layered between the adjustable clock and gameplay.
 */
#include "gameplayclock/offset_gameplay_clock_container.hpp"

#include <gtest/gtest.h>

#include <memory>
#include <string>
#include <vector>

#include "frameclock/stopwatch_clock.hpp"
#include "support/fake_clocks.hpp"

using frameclock::StopwatchClock;
using frameclock::fakes::ManualTimeSource;
using gameplayclock::OffsetGameplayClockContainer;
using gameplayclock::Options;

namespace {
class OffsetGameplayClockContainerTest : public ::testing::Test {
 protected:
  void SetUp() override {
    Rebuild(Options::Builder()
                .StartOffsetMs(-2000.0)
                .PlatformOffsetMs(10.0)
                .UserOffsetMs(5.0)
                .Build());
  }

  void Rebuild(const Options& base) {
    auto opts = Options::Builder(base)
                    .LogSink([this](const std::string& msg) {
                      log_.push_back(msg);
                    })
                    .Build();
    container_ =
        std::make_unique<OffsetGameplayClockContainer>(&track_, opts, &time_);
  }

  void Frame(double wall_ms) {
    time_.AdvanceMs(wall_ms);
    container_->Update();
  }

  double Now() const {
    return container_->GetGameplayClock().CurrentTime();
  }

  ManualTimeSource time_;
  StopwatchClock track_{&time_};
  std::vector<std::string> log_;
  std::unique_ptr<OffsetGameplayClockContainer> container_;
};
}  // namespace

TEST_F(OffsetGameplayClockContainerTest, OffsetsApplyAfterInitialize) {
  EXPECT_DOUBLE_EQ(container_->TotalAppliedOffset(), 0.0);
  ASSERT_TRUE(container_->Initialize());

  EXPECT_DOUBLE_EQ(container_->PlatformOffset(), 10.0);
  EXPECT_DOUBLE_EQ(container_->UserOffset(), 5.0);
  EXPECT_DOUBLE_EQ(container_->TotalAppliedOffset(), 15.0);
  EXPECT_DOUBLE_EQ(Now(), 15.0);
}

TEST_F(OffsetGameplayClockContainerTest, SeekIsInGameplayTime) {
  ASSERT_TRUE(container_->Initialize());

  container_->Seek(1000.0);
  EXPECT_DOUBLE_EQ(Now(), 1000.0);
  EXPECT_DOUBLE_EQ(track_.CurrentTime(), 985.0);
}

TEST_F(OffsetGameplayClockContainerTest, ResetLandsOnStartOffset) {
  ASSERT_TRUE(container_->Initialize());
  container_->Seek(3000.0);

  container_->Reset();
  EXPECT_DOUBLE_EQ(Now(), -2000.0);
  EXPECT_TRUE(container_->IsPaused());
}

TEST_F(OffsetGameplayClockContainerTest, PauseCyclesDoNotAccumulateOffset) {
  ASSERT_TRUE(container_->Initialize());
  container_->Start();
  Frame(100.0);
  EXPECT_DOUBLE_EQ(Now(), 115.0);

  for (int i = 0; i < 5; ++i) {
    container_->Stop();
    container_->Start();
    EXPECT_DOUBLE_EQ(Now(), 115.0);
  }

  Frame(100.0);
  EXPECT_DOUBLE_EQ(Now(), 215.0);
}

TEST_F(OffsetGameplayClockContainerTest, PlatformOffsetScalesWithRate) {
  ASSERT_TRUE(container_->Initialize());
  track_.SetRate(2.0);
  EXPECT_DOUBLE_EQ(container_->TotalAppliedOffset(), 15.0);

  container_->Start();
  Frame(0.0);
  EXPECT_DOUBLE_EQ(container_->TotalAppliedOffset(), 25.0);
  container_->Seek(1000.0);
  EXPECT_DOUBLE_EQ(Now(), 1000.0);
  EXPECT_DOUBLE_EQ(track_.CurrentTime(), 975.0);
}

TEST_F(OffsetGameplayClockContainerTest, UserOffsetChangeShiftsGameplayTime) {
  ASSERT_TRUE(container_->Initialize());
  container_->Seek(1000.0);

  container_->SetUserOffset(-20.0);
  EXPECT_DOUBLE_EQ(container_->UserOffset(), -20.0);
  EXPECT_DOUBLE_EQ(container_->TotalAppliedOffset(), -10.0);
  EXPECT_DOUBLE_EQ(Now(), 975.0);
  ASSERT_FALSE(log_.empty());
  EXPECT_NE(log_.back().find("[OffsetGameplayClockContainer]"),
            std::string::npos);

  container_->Seek(1000.0);
  EXPECT_DOUBLE_EQ(Now(), 1000.0);
}

TEST_F(OffsetGameplayClockContainerTest, UserOffsetBeforeInitializeIsKept) {
  container_->SetUserOffset(40.0);
  ASSERT_TRUE(container_->Initialize());
  EXPECT_DOUBLE_EQ(container_->TotalAppliedOffset(), 50.0);
  EXPECT_DOUBLE_EQ(Now(), 50.0);
}

TEST_F(OffsetGameplayClockContainerTest, RateChangeWhilePausedHoldsTime) {
  Rebuild(Options::Builder().PlatformOffsetMs(100.0).Build());
  ASSERT_TRUE(container_->Initialize());
  container_->Start();
  for (int i = 0; i < 10; ++i) Frame(100.0);
  container_->Stop();
  ASSERT_DOUBLE_EQ(Now(), 1100.0);

  track_.SetRate(0.5);
  for (int i = 0; i < 3; ++i) {
    Frame(16.0);
    EXPECT_DOUBLE_EQ(Now(), 1100.0);
  }
  EXPECT_DOUBLE_EQ(container_->GetGameplayClock().Rate(), 1.0);

  container_->Start();
  EXPECT_DOUBLE_EQ(Now(), 1100.0);
  Frame(100.0);
  EXPECT_DOUBLE_EQ(Now(), 1100.0);
  Frame(100.0);
  EXPECT_DOUBLE_EQ(Now(), 1150.0);
  EXPECT_DOUBLE_EQ(container_->TotalAppliedOffset(), 50.0);
}

/**
 * @test OffsetGameplayClockContainerTest.RateDropWhileRunningNeverGoesBack
 * @brief Lowering the rate shrinks the rate-scaled platform offset, which
 *        must not move gameplay time backwards.
 *
 * @steps
 * 1. Platform offset 100ms, track at rate 2, run ten 16ms frames (520ms).
 * 2. Set the track rate to 1 and keep running.
 *
 * @expected Gameplay time is non-decreasing and the applied offset settles
 *           on 100ms.
 */
TEST_F(OffsetGameplayClockContainerTest, RateDropWhileRunningNeverGoesBack) {
  track_.SetRate(2.0);
  Rebuild(Options::Builder().PlatformOffsetMs(100.0).Build());
  ASSERT_TRUE(container_->Initialize());
  container_->Start();
  for (int i = 0; i < 10; ++i) Frame(16.0);
  ASSERT_DOUBLE_EQ(Now(), 520.0);

  track_.SetRate(1.0);
  double prev = Now();
  for (int i = 0; i < 20; ++i) {
    Frame(16.0);
    EXPECT_GE(Now(), prev) << "time decreased at frame " << i;
    EXPECT_GE(container_->GetGameplayClock().ElapsedFrameTime(), 0.0);
    prev = Now();
  }
  EXPECT_DOUBLE_EQ(container_->TotalAppliedOffset(), 100.0);
}
