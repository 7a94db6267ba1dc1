// Copyright (c) 2025 <Your Name>
/**
 * Adjustable clock with rate and seek control, driven by a TimeSource.
 *
 * Time is tracked as an anchor pair (clock time, wall time). Every start,
 * stop, seek and rate change moves the anchor, so the reported time stays
 * continuous when the rate changes.
 */
#pragma once

#include "frameclock/clock.hpp"
#include "frameclock/export.hpp"
#include "frameclock/time_source.hpp"

namespace frameclock {

/** StopwatchClock implementation backed by a TimeSource. */
class FRAMECLOCK_API StopwatchClock : public AdjustableClock {
 public:
  /**
   * @param time_source Wall-time source (must outlive the clock). Defaults to
   *        MonotonicTimeSource::Instance() when null.
   */
  explicit StopwatchClock(TimeSource* time_source = nullptr);
  ~StopwatchClock() override = default;

  // Non-copyable, non-movable
  StopwatchClock(const StopwatchClock&) = delete;
  StopwatchClock& operator=(const StopwatchClock&) = delete;
  StopwatchClock(StopwatchClock&&) = delete;
  StopwatchClock& operator=(StopwatchClock&&) = delete;

  double CurrentTime() const override;
  double Rate() const override { return rate_; }
  bool IsRunning() const override { return running_; }

  void Reset() override;
  void Start() override;
  void Stop() override;
  /** Always succeeds: a stopwatch accepts any position, negative included. */
  bool Seek(double position) override;
  void SetRate(double rate) override;
  void ResetSpeedAdjustments() override { SetRate(1.0); }

  TimeSource* GetTimeSource() const { return time_source_; }

 private:
  /** Wall milliseconds since the anchor, scaled by rate. */
  double Elapsed() const;

  TimeSource* time_source_;
  /** Clock time at the anchor point. */
  double anchor_time_ = 0.0;
  /** Wall time at the anchor point. */
  double anchor_wall_ms_ = 0.0;
  double rate_ = 1.0;
  bool running_ = false;
};

}  // namespace frameclock
