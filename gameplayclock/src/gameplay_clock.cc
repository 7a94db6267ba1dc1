// Copyright (c) 2025 <Your Name>
#include "gameplayclock/gameplay_clock.hpp"

#include <stdexcept>

namespace gameplayclock {

GameplayClock::GameplayClock(frameclock::FrameBasedClock* underlying_clock)
    : underlying_clock_(underlying_clock) {
  if (underlying_clock_ == nullptr) {
    throw std::invalid_argument("GameplayClock requires an underlying clock");
  }
}

double GameplayClock::CurrentTime() const {
  return underlying_clock_->CurrentTime();
}

double GameplayClock::Rate() const { return underlying_clock_->Rate(); }

bool GameplayClock::IsRunning() const {
  return underlying_clock_->IsRunning();
}

double GameplayClock::ElapsedFrameTime() const {
  return underlying_clock_->ElapsedFrameTime();
}

double GameplayClock::FramesPerSecond() const {
  return underlying_clock_->FramesPerSecond();
}

}  // namespace gameplayclock
