// Copyright (c) 2025 <Your Name>
#include "frameclock/offset_clock.hpp"

#include <algorithm>
#include <stdexcept>

namespace frameclock {

OffsetClock::OffsetClock(FrameBasedClock* source, double offset_ms,
                         bool scale_with_rate)
    : source_(source), offset_ms_(offset_ms), scale_with_rate_(scale_with_rate) {
  if (source_ == nullptr) {
    throw std::invalid_argument("OffsetClock requires a source clock");
  }
  applied_offset_ms_ = TargetOffset();
}

double OffsetClock::CurrentTime() const {
  return source_->CurrentTime() + applied_offset_ms_;
}

void OffsetClock::ProcessFrame() {
  double source_before = source_->CurrentTime();
  source_->ProcessFrame();
  if (!scale_with_rate_ || !source_->IsRunning()) return;

  double target = TargetOffset();
  if (target >= applied_offset_ms_) {
    applied_offset_ms_ = target;
    return;
  }
  // Give back at most what the source advanced this frame.
  double advanced = std::max(0.0, source_->CurrentTime() - source_before);
  applied_offset_ms_ = std::max(target, applied_offset_ms_ - advanced);
}

void OffsetClock::SetOffset(double offset_ms) {
  offset_ms_ = offset_ms;
  applied_offset_ms_ = TargetOffset();
}

double OffsetClock::TargetOffset() const {
  return scale_with_rate_ ? offset_ms_ * source_->Rate() : offset_ms_;
}

}  // namespace frameclock
