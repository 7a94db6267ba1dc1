// Copyright (c) 2025 <Your Name>
/**
 * @file
 * @brief Gameplay clock container with platform and user offsets.
 */
#pragma once

#include <memory>

#include "frameclock/offset_clock.hpp"
#include "gameplayclock/export.hpp"
#include "gameplayclock/gameplay_clock_container.hpp"

namespace gameplayclock {

/**
 * @brief Container that layers latency offsets under the GameplayClock.
 *
 * Clock chain: source -> DecoupledClock -> platform OffsetClock (scaled by
 * rate) -> user OffsetClock -> GameplayClock.
 *
 * Seek() works in gameplay time: the applied offsets are removed before the
 * adjustable clock is seeked, so Seek(t) yields a GameplayClock time of t.
 */
class GAMEPLAYCLOCK_API OffsetGameplayClockContainer
    : public GameplayClockContainer {
 public:
  explicit OffsetGameplayClockContainer(
      frameclock::AdjustableClock* source_clock,
      const Options& options = Options(),
      frameclock::TimeSource* time_source = nullptr);
  ~OffsetGameplayClockContainer() override;

  void Seek(double time) override;

  double PlatformOffset() const { return GetOptions().PlatformOffsetMs(); }

  double UserOffset() const { return user_offset_ms_; }
  /**
   * @brief Changes the user offset.
   *
   * Takes effect immediately, like Seek(): gameplay time shifts by the
   * difference, backwards when the offset decreases. Unlike a change in
   * playback rate, it is not smoothed.
   */
  void SetUserOffset(double offset_ms);

  /** Sum of the offsets currently applied on top of the adjustable clock. */
  double TotalAppliedOffset() const;

 protected:
  std::unique_ptr<GameplayClock> CreateGameplayClock(
      frameclock::FrameBasedClock* source) override;

 private:
  double user_offset_ms_;
  std::unique_ptr<frameclock::OffsetClock> platform_offset_clock_;
  std::unique_ptr<frameclock::OffsetClock> user_offset_clock_;
};

}  // namespace gameplayclock
