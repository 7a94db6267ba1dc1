// Copyright (c) 2025 <Your Name>
#include "gameplayclock/offset_gameplay_clock_container.hpp"

#include <sstream>

namespace gameplayclock {

OffsetGameplayClockContainer::OffsetGameplayClockContainer(
    frameclock::AdjustableClock* source_clock, const Options& options,
    frameclock::TimeSource* time_source)
    : GameplayClockContainer(source_clock, options, time_source),
      user_offset_ms_(options.UserOffsetMs()) {}

OffsetGameplayClockContainer::~OffsetGameplayClockContainer() = default;

void OffsetGameplayClockContainer::Seek(double time) {
  // Seeks are aligned to gameplay, not to the source.
  GameplayClockContainer::Seek(time - TotalAppliedOffset());
}

void OffsetGameplayClockContainer::SetUserOffset(double offset_ms) {
  user_offset_ms_ = offset_ms;
  if (user_offset_clock_) user_offset_clock_->SetOffset(offset_ms);

  if (LogEnabled()) {
    std::ostringstream oss;
    oss << "[OffsetGameplayClockContainer] User offset set to " << offset_ms
        << "ms";
    Log(oss.str());
  }
}

double OffsetGameplayClockContainer::TotalAppliedOffset() const {
  if (!platform_offset_clock_ || !user_offset_clock_) return 0.0;
  return platform_offset_clock_->AppliedOffset() +
         user_offset_clock_->AppliedOffset();
}

std::unique_ptr<GameplayClock>
OffsetGameplayClockContainer::CreateGameplayClock(
    frameclock::FrameBasedClock* source) {
  // Hardware latency is fixed in real time, so it scales with playback rate.
  platform_offset_clock_ = std::make_unique<frameclock::OffsetClock>(
      source, PlatformOffset(), true);
  user_offset_clock_ = std::make_unique<frameclock::OffsetClock>(
      platform_offset_clock_.get(), user_offset_ms_);
  return std::make_unique<GameplayClock>(user_offset_clock_.get());
}

}  // namespace gameplayclock
