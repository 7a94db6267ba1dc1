// Copyright (c) 2025 <Your Name>
/**
 * @file
 * @brief Monotonicity guard for interpolated clock time.
 *
 * Ensures that frame time readings are monotonic non-decreasing between
 * explicit seeks.
 */

#ifndef FRAMECLOCK_INTERNAL_MONOTONICITY_GUARD_HPP_
#define FRAMECLOCK_INTERNAL_MONOTONICITY_GUARD_HPP_

#include <algorithm>

namespace frameclock {
namespace internal {

/**
 * @brief Enforces monotonic non-decreasing time progression.
 *
 * Maintains the last returned time value and ensures that subsequent
 * readings never go backward. A seek rebases the guard, which is the only
 * way time is allowed to move backward.
 *
 * Single-threaded: used from the frame loop only.
 */
class MonotonicityGuard {
 public:
  MonotonicityGuard() = default;

  /**
   * @brief Enforce monotonic time progression.
   *
   * @param candidate_time The raw candidate time value (milliseconds).
   * @return max(candidate_time, last returned time).
   */
  double EnforceMonotonic(double candidate_time) {
    double clamped = std::max(candidate_time, last_returned_ms_);
    last_returned_ms_ = clamped;
    return clamped;
  }

  /**
   * @brief Restart monotonic tracking from an explicit position.
   *
   * Called on seeks so that the destination is accepted even when it lies
   * before the previous reading.
   */
  void Rebase(double time_ms) { last_returned_ms_ = time_ms; }

  double LastReturned() const { return last_returned_ms_; }

 private:
  double last_returned_ms_ = 0.0;
};

}  // namespace internal
}  // namespace frameclock

#endif  // FRAMECLOCK_INTERNAL_MONOTONICITY_GUARD_HPP_
