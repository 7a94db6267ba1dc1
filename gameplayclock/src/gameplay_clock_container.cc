// Copyright (c) 2025 <Your Name>
/**
 * @file
 * @brief Implementation of the gameplay clock container state machine.
 *
 * States: Stopped/Reset (after construction or a paused Reset), Running and
 * Paused. IsPaused flips between Running and Paused; the pause reaction is
 * the only place that couples the flag to the adjustable clock.
 */

#include "gameplayclock/gameplay_clock_container.hpp"

#include <cassert>
#include <sstream>
#include <stdexcept>

namespace gameplayclock {

namespace {
frameclock::AdjustableClock* RequireSource(
    frameclock::AdjustableClock* source_clock) {
  if (source_clock == nullptr) {
    throw std::invalid_argument(
        "GameplayClockContainer requires a source clock");
  }
  return source_clock;
}
}  // namespace

GameplayClockContainer::GameplayClockContainer(
    frameclock::AdjustableClock* source_clock, const Options& options,
    frameclock::TimeSource* time_source)
    : options_(options),
      source_clock_(RequireSource(source_clock)),
      adjustable_source_(source_clock, time_source) {
  adjustable_source_.SetCoupled(false);
  adjustable_source_.SetAllowableErrorMs(options_.AllowableErrorMs());
}

GameplayClockContainer::~GameplayClockContainer() = default;

bool GameplayClockContainer::Initialize() {
  if (gameplay_clock_) return false;

  gameplay_clock_ = CreateGameplayClock(&adjustable_source_);
  if (!gameplay_clock_) {
    Log("[GameplayClockContainer] CreateGameplayClock returned no clock");
    return false;
  }
  gameplay_clock_->SetPaused(is_paused_);

  if (LogEnabled()) {
    std::ostringstream oss;
    oss << "[GameplayClockContainer] Initialized (" << options_
        << ", start at " << StartOffset() << "ms)";
    Log(oss.str());
  }
  return true;
}

void GameplayClockContainer::Start() {
  GameplayClock& gameplay_clock = RequireGameplayClock();

  // Ensure that the source clock is set.
  ChangeSource(source_clock_);

  if (!adjustable_source_.IsRunning()) {
    // Seeking the decoupled clock to its current time also seeks the source,
    // which may have kept moving while it was entering a stopped state.
    Seek(gameplay_clock.CurrentTime());
    adjustable_source_.Start();
  }

  SetPaused(false);

  if (LogEnabled()) {
    std::ostringstream oss;
    oss << "[GameplayClockContainer] Start at " << gameplay_clock.CurrentTime()
        << "ms";
    Log(oss.str());
  }
}

void GameplayClockContainer::Seek(double time) {
  if (!adjustable_source_.Seek(time) && LogEnabled()) {
    std::ostringstream oss;
    oss << "[GameplayClockContainer] Seek to " << time
        << "ms rejected by coupled source";
    Log(oss.str());
  }
}

void GameplayClockContainer::Stop() {
  SetPaused(true);

  if (LogEnabled()) {
    std::ostringstream oss;
    oss << "[GameplayClockContainer] Stop at "
        << adjustable_source_.CurrentTime() << "ms";
    Log(oss.str());
  }
}

void GameplayClockContainer::Reset() {
  GameplayClock& gameplay_clock = RequireGameplayClock();

  Seek(StartOffset());
  adjustable_source_.Stop();

  // Make sure the gameplay clock takes on the new time, otherwise Start()
  // would re-anchor the adjustable clock to the stale gameplay time.
  gameplay_clock.UnderlyingClock().ProcessFrame();

  if (LogEnabled()) {
    std::ostringstream oss;
    oss << "[GameplayClockContainer] Reset to " << gameplay_clock.CurrentTime()
        << "ms (" << (is_paused_ ? "stopped" : "resuming") << ")";
    Log(oss.str());
  }

  if (!is_paused_) Start();
}

void GameplayClockContainer::Update() {
  GameplayClock& gameplay_clock = RequireGameplayClock();
  if (!is_paused_) gameplay_clock.UnderlyingClock().ProcessFrame();
}

void GameplayClockContainer::SetPaused(bool paused) {
  if (paused == is_paused_) return;
  is_paused_ = paused;
  if (gameplay_clock_) gameplay_clock_->SetPaused(paused);
  OnIsPausedChanged(paused);
}

GameplayClock& GameplayClockContainer::GetGameplayClock() {
  return RequireGameplayClock();
}

const GameplayClock& GameplayClockContainer::GetGameplayClock() const {
  return RequireGameplayClock();
}

Status GameplayClockContainer::GetStatus() const {
  Status st;
  st.initialized = IsInitialized();
  st.paused = is_paused_;
  st.adjustable_running = adjustable_source_.IsRunning();
  st.source_running = source_clock_->IsRunning();
  st.source_time_ms = source_clock_->CurrentTime();
  st.rate = adjustable_source_.Rate();

  const frameclock::FrameBasedClock* clock = &adjustable_source_;
  if (gameplay_clock_) clock = gameplay_clock_.get();
  st.current_time_ms = clock->CurrentTime();
  st.elapsed_frame_time_ms = clock->ElapsedFrameTime();
  st.frames_per_second = clock->FramesPerSecond();
  return st;
}

double GameplayClockContainer::StartOffset() const {
  return options_.StartOffsetMs();
}

void GameplayClockContainer::ChangeSource(
    frameclock::AdjustableClock* source_clock) {
  if (source_clock == nullptr) {
    Log("[GameplayClockContainer] Ignoring null source clock");
    return;
  }
  if (source_clock != source_clock_ && LogEnabled()) {
    std::ostringstream oss;
    oss << "[GameplayClockContainer] Source changed at "
        << adjustable_source_.CurrentTime() << "ms";
    Log(oss.str());
  }
  source_clock_ = source_clock;
  adjustable_source_.ChangeSource(source_clock);
}

void GameplayClockContainer::OnIsPausedChanged(bool is_paused) {
  if (is_paused) {
    adjustable_source_.Stop();
  } else {
    adjustable_source_.Start();
  }
}

void GameplayClockContainer::Log(const std::string& msg) const {
  const Options::LogCallback& sink = options_.LogSink();
  if (sink) sink(msg);
}

GameplayClock& GameplayClockContainer::RequireGameplayClock() const {
  assert(gameplay_clock_ != nullptr &&
         "Initialize() must be called before using the gameplay clock");
  return *gameplay_clock_;
}

}  // namespace gameplayclock
