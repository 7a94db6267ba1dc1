// Copyright (c) 2025 <Your Name>
/**
 * @file frame_rate_estimator.hpp
 * @brief Windowed frames-per-second computation.
 */
#pragma once

namespace frameclock {
namespace internal {

/**
 * @brief Counts processed frames over fixed windows of wall time.
 *
 * The reported rate is refreshed at the end of each window and holds its
 * value in between, which keeps it readable on screen.
 */
class FrameRateEstimator {
 public:
  static constexpr double kDefaultWindowMs = 250.0;

  explicit FrameRateEstimator(double window_ms = kDefaultWindowMs)
      : window_ms_(window_ms) {}

  /** Start a new window at now_ms and forget the current rate. */
  void Reset(double now_ms) {
    window_start_ms_ = now_ms;
    frames_ = 0;
    fps_ = 0.0;
  }

  /** Record one frame processed at now_ms. */
  void OnFrame(double now_ms) {
    ++frames_;
    double span = now_ms - window_start_ms_;
    if (span < window_ms_) return;
    fps_ = frames_ * 1000.0 / span;
    frames_ = 0;
    window_start_ms_ = now_ms;
  }

  double FramesPerSecond() const { return fps_; }

 private:
  double window_ms_;
  double window_start_ms_ = 0.0;
  int frames_ = 0;
  double fps_ = 0.0;
};

}  // namespace internal
}  // namespace frameclock
