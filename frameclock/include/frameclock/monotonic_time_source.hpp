// Copyright (c) 2025
/**
 * @file monotonic_time_source.hpp
 * @brief Platform monotonic TimeSource implementation.
 *
 * Uses clock_gettime(CLOCK_MONOTONIC) on POSIX and QueryPerformanceCounter on
 * Windows. Readings are not affected by system time adjustments.
 */
#pragma once

#include <memory>

#include "frameclock/export.hpp"
#include "frameclock/time_source.hpp"

namespace frameclock {

/**
 * @brief TimeSource backed by the platform's monotonic counter.
 *
 * NowMs() returns milliseconds elapsed since construction.
 */
class FRAMECLOCK_API MonotonicTimeSource : public TimeSource {
 public:
  MonotonicTimeSource();
  ~MonotonicTimeSource() override;

  // Non-copyable, non-movable
  MonotonicTimeSource(const MonotonicTimeSource&) = delete;
  MonotonicTimeSource& operator=(const MonotonicTimeSource&) = delete;
  MonotonicTimeSource(MonotonicTimeSource&&) = delete;
  MonotonicTimeSource& operator=(MonotonicTimeSource&&) = delete;

  double NowMs() override;

  /** Process-wide instance used when no TimeSource is supplied. */
  static MonotonicTimeSource& Instance();

 private:
  struct Impl;
  std::unique_ptr<Impl> impl_;
};

}  // namespace frameclock
