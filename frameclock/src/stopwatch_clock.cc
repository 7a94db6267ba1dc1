// Copyright (c) 2025 <Your Name>
/**
 * @file stopwatch_clock.cc
 * @brief StopwatchClock implementation.
 */
#include "frameclock/stopwatch_clock.hpp"

#include "frameclock/monotonic_time_source.hpp"

namespace frameclock {

StopwatchClock::StopwatchClock(TimeSource* time_source)
    : time_source_(time_source != nullptr ? time_source
                                          : &MonotonicTimeSource::Instance()) {
  anchor_wall_ms_ = time_source_->NowMs();
}

double StopwatchClock::Elapsed() const {
  if (!running_) return 0.0;
  return (time_source_->NowMs() - anchor_wall_ms_) * rate_;
}

double StopwatchClock::CurrentTime() const { return anchor_time_ + Elapsed(); }

void StopwatchClock::Reset() {
  Stop();
  Seek(0.0);
}

void StopwatchClock::Start() {
  if (running_) return;
  anchor_wall_ms_ = time_source_->NowMs();
  running_ = true;
}

void StopwatchClock::Stop() {
  if (!running_) return;
  anchor_time_ = CurrentTime();
  anchor_wall_ms_ = time_source_->NowMs();
  running_ = false;
}

bool StopwatchClock::Seek(double position) {
  anchor_time_ = position;
  anchor_wall_ms_ = time_source_->NowMs();
  return true;
}

void StopwatchClock::SetRate(double rate) {
  // Read the current time once at the old rate, then re-anchor.
  double wall_now = time_source_->NowMs();
  if (running_) anchor_time_ += (wall_now - anchor_wall_ms_) * rate_;
  anchor_wall_ms_ = wall_now;
  rate_ = rate;
}

}  // namespace frameclock
