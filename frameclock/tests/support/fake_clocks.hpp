// Copyright (c) 2025 <Your Name>
/**
 * @file fake_clocks.hpp
 * @brief Deterministic clocks shared by the frameclock and gameplayclock
 *        tests.
 */
#pragma once

#include <cmath>

#include "frameclock/clock.hpp"
#include "frameclock/stopwatch_clock.hpp"
#include "frameclock/time_source.hpp"

namespace frameclock {
namespace fakes {

/** Wall time that only moves when the test says so. */
class ManualTimeSource : public TimeSource {
 public:
  explicit ManualTimeSource(double start_ms = 0.0) : now_ms_(start_ms) {}

  double NowMs() override { return now_ms_; }

  void AdvanceMs(double delta_ms) { now_ms_ += delta_ms; }

 private:
  double now_ms_;
};

/**
 * Track-like source: only positions within [0, length] are reachable and
 * playback stops at the end, like an audio track.
 */
class BoundedTrackClock : public AdjustableClock {
 public:
  BoundedTrackClock(TimeSource* time_source, double length_ms)
      : stopwatch_(time_source), length_ms_(length_ms) {}

  double CurrentTime() const override {
    return std::fmin(stopwatch_.CurrentTime(), length_ms_);
  }
  double Rate() const override { return stopwatch_.Rate(); }
  bool IsRunning() const override {
    return stopwatch_.IsRunning() && stopwatch_.CurrentTime() < length_ms_;
  }

  void Reset() override { stopwatch_.Reset(); }
  void Start() override { stopwatch_.Start(); }
  void Stop() override { stopwatch_.Stop(); }
  bool Seek(double position) override {
    if (position < 0.0 || position > length_ms_) return false;
    return stopwatch_.Seek(position);
  }
  void SetRate(double rate) override { stopwatch_.SetRate(rate); }
  void ResetSpeedAdjustments() override { stopwatch_.ResetSpeedAdjustments(); }

 private:
  StopwatchClock stopwatch_;
  double length_ms_;
};

/**
 * Source whose reported time only updates in fixed steps, like an audio
 * device position refreshed once per buffer.
 */
class CoarseTrackClock : public AdjustableClock {
 public:
  CoarseTrackClock(TimeSource* time_source, double granularity_ms)
      : stopwatch_(time_source), granularity_ms_(granularity_ms) {}

  double CurrentTime() const override {
    return std::floor(stopwatch_.CurrentTime() / granularity_ms_) *
           granularity_ms_;
  }
  double Rate() const override { return stopwatch_.Rate(); }
  bool IsRunning() const override { return stopwatch_.IsRunning(); }

  void Reset() override { stopwatch_.Reset(); }
  void Start() override { stopwatch_.Start(); }
  void Stop() override { stopwatch_.Stop(); }
  bool Seek(double position) override { return stopwatch_.Seek(position); }
  void SetRate(double rate) override { stopwatch_.SetRate(rate); }
  void ResetSpeedAdjustments() override { stopwatch_.ResetSpeedAdjustments(); }

  /** Exact position, for checking how closely the interpolation follows. */
  double ExactTime() const { return stopwatch_.CurrentTime(); }

 private:
  StopwatchClock stopwatch_;
  double granularity_ms_;
};

}  // namespace fakes
}  // namespace frameclock
