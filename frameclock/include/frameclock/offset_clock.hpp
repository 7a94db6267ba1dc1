// Copyright (c) 2025 <Your Name>
/**
 * @file offset_clock.hpp
 * @brief Frame clock that shifts another frame clock by a fixed offset.
 *
 * Used to compensate output latency (audio hardware, display) between the
 * adjustable clock and what gameplay components should see.
 *
 * A rate-scaled offset is re-evaluated in ProcessFrame() only, and only while
 * the source runs. A lower offset is folded in no faster than the source
 * advances, so a rate change never moves the reported time backwards.
 */
#pragma once

#include "frameclock/clock.hpp"
#include "frameclock/export.hpp"

namespace frameclock {

class FRAMECLOCK_API OffsetClock : public FrameBasedClock {
 public:
  /**
   * @param source Wrapped frame clock (non-null, must outlive this clock).
   * @param offset_ms Offset added to the source time.
   * @param scale_with_rate If true the applied offset is multiplied by the
   *        source rate. Hardware latency is measured in real time, so at
   *        rate 1.5 it covers 1.5x as much track time.
   * @throws std::invalid_argument if source is null.
   */
  explicit OffsetClock(FrameBasedClock* source, double offset_ms = 0.0,
                       bool scale_with_rate = false);

  /** Source time plus AppliedOffset(); seeks on the source show up at once. */
  double CurrentTime() const override;
  double Rate() const override { return source_->Rate(); }
  bool IsRunning() const override { return source_->IsRunning(); }

  double ElapsedFrameTime() const override {
    return source_->ElapsedFrameTime();
  }
  double FramesPerSecond() const override {
    return source_->FramesPerSecond();
  }
  /** Processes the wrapped clock, then updates a rate-scaled offset. */
  void ProcessFrame() override;

  double Offset() const { return offset_ms_; }
  /**
   * Takes effect immediately, like a seek: the reported time shifts by the
   * difference and may move backwards.
   */
  void SetOffset(double offset_ms);

  /** Offset currently added to the source time. */
  double AppliedOffset() const { return applied_offset_ms_; }

  FrameBasedClock* Source() const { return source_; }

 private:
  /** Offset the current rate calls for. */
  double TargetOffset() const;

  FrameBasedClock* source_;
  double offset_ms_;
  bool scale_with_rate_;
  double applied_offset_ms_;
};

}  // namespace frameclock
