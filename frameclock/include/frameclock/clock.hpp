// Copyright (c) 2025 <Your Name>
/**
 * @file clock.hpp
 * @brief Clock capability interfaces (time in milliseconds).
 *
 * Clock reports time. AdjustableClock can additionally be started, stopped,
 * seeked and rate-adjusted; it is the capability required of a raw source
 * clock such as an audio track. FrameBasedClock snapshots time once per
 * update tick via ProcessFrame().
 */
#pragma once

namespace frameclock {

/** Read-only time provider. */
class Clock {
 public:
  virtual ~Clock() = default;

  /** Current time in milliseconds. */
  virtual double CurrentTime() const = 0;

  /** Progression rate multiplier (1.0 = real time). */
  virtual double Rate() const = 0;

  /** Whether time is currently progressing. */
  virtual bool IsRunning() const = 0;
};

/** Clock that can be controlled. */
class AdjustableClock : public Clock {
 public:
  /** Stops the clock and seeks to zero. */
  virtual void Reset() = 0;

  virtual void Start() = 0;
  virtual void Stop() = 0;

  /**
   * @brief Seeks to a position.
   * @param position Destination time in milliseconds.
   * @return false if the position is not reachable by this clock (for
   *         example outside the length of a track); the clock is unchanged.
   */
  virtual bool Seek(double position) = 0;

  /** Sets progression rate multiplier. */
  virtual void SetRate(double rate) = 0;

  /** Restores rate 1.0. */
  virtual void ResetSpeedAdjustments() = 0;
};

/** Clock whose reported values only change when a frame is processed. */
class FrameBasedClock : public Clock {
 public:
  /** Time elapsed between the last two processed frames (milliseconds). */
  virtual double ElapsedFrameTime() const = 0;

  /** Frames processed per second of wall time. */
  virtual double FramesPerSecond() const = 0;

  /** Incorporates newly elapsed time. Call once per update tick. */
  virtual void ProcessFrame() = 0;
};

}  // namespace frameclock
