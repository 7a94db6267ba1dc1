// Copyright (c) 2025 <Your Name>
/**
 * @file time_source.hpp
 * @brief Minimal wall-time source interface (milliseconds).
 */
#pragma once

namespace frameclock {

/**
 * Interface for wall-time sources.
 * Provides elapsed milliseconds on a monotonic timeline. The epoch is
 * arbitrary; only differences between readings are meaningful.
 */
class TimeSource {
 public:
  virtual ~TimeSource() = default;

  /** Returns the current monotonic time in milliseconds. */
  virtual double NowMs() = 0;
};

}  // namespace frameclock
