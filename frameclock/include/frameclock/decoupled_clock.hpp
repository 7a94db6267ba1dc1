// Copyright (c) 2025 <Your Name>
/**
 * @file
 * @brief Interpolating frame clock that can run decoupled from its source.
 *
 * DecoupledClock wraps exactly one AdjustableClock (typically an audio track)
 * and produces a smooth per-frame time from it. When decoupled, its own
 * start/stop/seek state does not depend on the source being able to follow:
 * a seek to a position the source cannot reach (such as a negative lead-in)
 * is still honoured, and the clock runs on its own reference timeline until
 * the source can take over.
 *
 * Guarantees:
 * - While running and not seeking, CurrentTime() is monotonic non-decreasing.
 * - Seek() takes effect immediately, before the next frame is processed.
 * - Stop() halts advancement immediately.
 */
#pragma once

#include <memory>

#include "frameclock/clock.hpp"
#include "frameclock/export.hpp"
#include "frameclock/time_source.hpp"

namespace frameclock {

class FRAMECLOCK_API DecoupledClock : public FrameBasedClock {
 public:
  /** Drift (ms) above which the interpolated time snaps to the source. */
  static constexpr double kDefaultAllowableErrorMs = 1000.0 / 60.0 * 2.0;

  /**
   * @param source Source clock (non-null, must outlive this clock or be
   *        replaced via ChangeSource()).
   * @param time_source Wall-time source for the reference timeline. Defaults
   *        to MonotonicTimeSource::Instance() when null.
   * @throws std::invalid_argument if source is null.
   */
  explicit DecoupledClock(AdjustableClock* source,
                          TimeSource* time_source = nullptr);
  ~DecoupledClock() override;

  DecoupledClock(const DecoupledClock&) = delete;
  DecoupledClock& operator=(const DecoupledClock&) = delete;

  double CurrentTime() const override;
  /**
   * Rate of the wrapped source as of the last processed frame (or the last
   * Start()/ChangeSource()). Rate changes on the source are picked up by
   * ProcessFrame() while running.
   */
  double Rate() const override;
  /** Own running state, independent of the source when decoupled. */
  bool IsRunning() const override;

  double ElapsedFrameTime() const override;
  double FramesPerSecond() const override;
  void ProcessFrame() override;

  void Start();
  void Stop();

  /**
   * @brief Seek to a position; CurrentTime() reflects it immediately.
   * @return false only when coupled and the source rejects the position.
   */
  bool Seek(double position);

  /**
   * @brief Replace the wrapped source.
   *
   * Passing the current source is a no-op. Running state and current time
   * are preserved; the new source is moved to the current time. A coupled
   * clock adopts the new source's time and running state instead.
   *
   * @return false if source is null (nothing changes).
   */
  bool ChangeSource(AdjustableClock* source);

  AdjustableClock* Source() const;

  /** Coupled clocks mirror their source's running state (default true). */
  bool IsCoupled() const;
  void SetCoupled(bool coupled);

  double AllowableErrorMs() const;
  void SetAllowableErrorMs(double error_ms);

 private:
  struct Impl;
  std::unique_ptr<Impl> p_;
};

}  // namespace frameclock
