// Copyright (c) 2025 <Your Name>
/**
 * @file gameplay_clock.hpp
 * @brief The final clock exposed to gameplay components.
 */
#pragma once

#include "frameclock/clock.hpp"
#include "gameplayclock/export.hpp"

namespace gameplayclock {

class GameplayClockContainer;

/**
 * @brief Read-only view over the frame clock that drives gameplay.
 *
 * All time values are read from UnderlyingClock(). The pause flag is set by
 * the owning GameplayClockContainer and lets consumers tell whether gameplay
 * is advancing without querying the container.
 */
class GAMEPLAYCLOCK_API GameplayClock : public frameclock::FrameBasedClock {
 public:
  /**
   * @param underlying_clock Clock providing gameplay time (non-null, must
   *        outlive this object).
   * @throws std::invalid_argument if underlying_clock is null.
   */
  explicit GameplayClock(frameclock::FrameBasedClock* underlying_clock);

  /** Clock advanced by the container once per update tick. */
  frameclock::FrameBasedClock& UnderlyingClock() const {
    return *underlying_clock_;
  }

  /** Whether gameplay is paused. */
  bool IsPaused() const { return is_paused_; }

  double CurrentTime() const override;
  double Rate() const override;
  bool IsRunning() const override;
  double ElapsedFrameTime() const override;
  double FramesPerSecond() const override;

  /** Intentionally empty: frames are processed on UnderlyingClock(). */
  void ProcessFrame() override {}

 private:
  friend class GameplayClockContainer;

  void SetPaused(bool paused) { is_paused_ = paused; }

  frameclock::FrameBasedClock* underlying_clock_;
  bool is_paused_ = true;
};

}  // namespace gameplayclock
