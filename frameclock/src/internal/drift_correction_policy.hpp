// Copyright (c) 2025 <Your Name>
/**
 * @file
 * @brief Drift correction policy for slew vs step decisions.
 *
 * Determines whether an interpolated timeline should be pulled gradually
 * toward its source clock or snapped onto it, based on the drift magnitude.
 */

#ifndef FRAMECLOCK_INTERNAL_DRIFT_CORRECTION_POLICY_HPP_
#define FRAMECLOCK_INTERNAL_DRIFT_CORRECTION_POLICY_HPP_

#include <cmath>

namespace frameclock {
namespace internal {

/**
 * @brief Decides how to reconcile interpolated time with source time.
 *
 * Stateless. Small drifts are absorbed over several frames (slew) so that
 * coarse source updates do not show up as jitter; drifts beyond the
 * allowable error mean the source moved on its own and are applied at once
 * (step).
 */
class DriftCorrectionPolicy {
 public:
  /**
   * @brief Type of correction to apply.
   */
  enum class Type {
    None,  ///< Timelines agree.
    Slew,  ///< Move a fraction of the drift this frame.
    Step   ///< Snap onto the source time.
  };

  /**
   * @brief Correction decision result.
   */
  struct Decision {
    Type type = Type::None;  ///< Type of correction.
    double amount_ms = 0.0;  ///< Amount to add to the interpolated time.
  };

  /** Fraction of the drift removed per frame while slewing. */
  static constexpr double kSlewFraction = 1.0 / 8.0;

  /**
   * @brief Decide correction type and amount.
   *
   * @param drift_ms Source time minus interpolated time (milliseconds).
   * @param allowable_error_ms Drift above which a step is applied.
   * @return Decision indicating correction type and amount.
   *
   * Decision logic:
   * - If |drift| > allowable_error: Step by full drift
   * - Otherwise: Slew by drift * kSlewFraction
   * - If drift is zero: No correction
   */
  static Decision Decide(double drift_ms, double allowable_error_ms) {
    Decision d;
    if (std::abs(drift_ms) > allowable_error_ms) {
      d.type = Type::Step;
      d.amount_ms = drift_ms;
    } else if (drift_ms != 0.0) {
      d.type = Type::Slew;
      d.amount_ms = drift_ms * kSlewFraction;
    }
    return d;
  }
};

}  // namespace internal
}  // namespace frameclock

#endif  // FRAMECLOCK_INTERNAL_DRIFT_CORRECTION_POLICY_HPP_
