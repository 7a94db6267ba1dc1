// Copyright (c) 2025 <Your Name>
/**
 * @file
 * @brief Implementation of the decoupleable interpolating frame clock.
 *
 * A private StopwatchClock (the reference timeline) supplies smooth
 * per-frame time. While the source runs, the reference is slewed toward the
 * source, or stepped onto it when the drift exceeds the allowable error.
 * While a decoupled clock's source cannot run, the reference alone drives
 * time and the source is restarted once its position becomes reachable.
 */

#include "frameclock/decoupled_clock.hpp"

#include <algorithm>
#include <stdexcept>

#include "frameclock/monotonic_time_source.hpp"
#include "frameclock/stopwatch_clock.hpp"
#include "internal/drift_correction_policy.hpp"
#include "internal/frame_rate_estimator.hpp"
#include "internal/monotonicity_guard.hpp"

namespace frameclock {

// ---------------- Impl ----------------
struct DecoupledClock::Impl {
  Impl(AdjustableClock* src, TimeSource* ts)
      : source(src),
        time_source(ts != nullptr ? ts : &MonotonicTimeSource::Instance()),
        reference(time_source) {
    frame_rate.Reset(time_source->NowMs());
  }

  AdjustableClock* source;
  TimeSource* time_source;

  // Decoupled timeline; runs whenever this clock runs.
  StopwatchClock reference;

  internal::MonotonicityGuard guard;
  internal::FrameRateEstimator frame_rate;

  bool coupled = true;
  bool running = false;
  double allowable_error_ms = kDefaultAllowableErrorMs;
  double current_time = 0.0;
  double elapsed_frame_time = 0.0;

  /** Seek the source to position and start it if reachable. */
  bool TryStartSourceAt(double position) {
    if (!source->Seek(position)) return false;
    source->Start();
    return true;
  }

  void SyncReferenceRate() {
    if (reference.Rate() != source->Rate()) reference.SetRate(source->Rate());
  }

  /** Jump all timelines to position (explicit seek semantics). */
  void Rebase(double position) {
    current_time = position;
    reference.Seek(position);
    guard.Rebase(position);
  }

  /** Reference time after reconciling with a running source. */
  double InterpolateTowardSource() {
    double reference_time = reference.CurrentTime();
    auto decision = internal::DriftCorrectionPolicy::Decide(
        source->CurrentTime() - reference_time, allowable_error_ms);
    if (decision.type == internal::DriftCorrectionPolicy::Type::None) {
      return reference_time;
    }
    reference_time += decision.amount_ms;
    reference.Seek(reference_time);
    return reference_time;
  }
};

DecoupledClock::DecoupledClock(AdjustableClock* source,
                               TimeSource* time_source) {
  if (source == nullptr) {
    throw std::invalid_argument("DecoupledClock requires a source clock");
  }
  p_ = std::make_unique<Impl>(source, time_source);
  p_->SyncReferenceRate();
  p_->Rebase(source->CurrentTime());
}

DecoupledClock::~DecoupledClock() = default;

double DecoupledClock::CurrentTime() const { return p_->current_time; }

double DecoupledClock::Rate() const { return p_->reference.Rate(); }

bool DecoupledClock::IsRunning() const { return p_->running; }

double DecoupledClock::ElapsedFrameTime() const {
  return p_->elapsed_frame_time;
}

double DecoupledClock::FramesPerSecond() const {
  return p_->frame_rate.FramesPerSecond();
}

void DecoupledClock::ProcessFrame() {
  p_->frame_rate.OnFrame(p_->time_source->NowMs());

  double last = p_->current_time;
  if (!p_->running) {
    p_->elapsed_frame_time = 0.0;
    return;
  }

  p_->SyncReferenceRate();

  if (p_->source->IsRunning()) {
    p_->current_time = p_->guard.EnforceMonotonic(p_->InterpolateTowardSource());
  } else if (p_->coupled) {
    // A coupled clock stops together with its source and reports its time.
    p_->running = false;
    p_->reference.Stop();
    p_->Rebase(p_->source->CurrentTime());
  } else {
    p_->current_time = p_->guard.EnforceMonotonic(p_->reference.CurrentTime());
    // Hand over to the source as soon as it can follow (e.g. end of lead-in).
    p_->TryStartSourceAt(p_->current_time);
  }

  p_->elapsed_frame_time = p_->current_time - last;
}

void DecoupledClock::Start() {
  if (p_->running) return;

  if (!p_->source->IsRunning()) p_->TryStartSourceAt(p_->current_time);
  if (p_->coupled && !p_->source->IsRunning()) return;

  p_->SyncReferenceRate();
  p_->reference.Seek(p_->current_time);
  p_->reference.Start();
  p_->running = true;
}

void DecoupledClock::Stop() {
  p_->running = false;
  p_->reference.Stop();
  p_->source->Stop();
}

bool DecoupledClock::Seek(double position) {
  if (!p_->source->Seek(position)) {
    if (p_->coupled) return false;
    // The source waits until the timeline reaches a reachable position.
    p_->source->Stop();
  }
  p_->Rebase(position);
  return true;
}

bool DecoupledClock::ChangeSource(AdjustableClock* source) {
  if (source == nullptr) return false;
  if (source == p_->source) return true;

  p_->source = source;
  p_->SyncReferenceRate();

  if (p_->coupled) {
    p_->running = source->IsRunning();
    p_->Rebase(source->CurrentTime());
    if (p_->running) {
      p_->reference.Start();
    } else {
      p_->reference.Stop();
    }
    return true;
  }

  if (p_->running) {
    if (!p_->TryStartSourceAt(p_->current_time)) source->Stop();
  } else {
    source->Stop();
    // Unreachable positions are retried when the clock starts.
    (void)source->Seek(p_->current_time);
  }
  return true;
}

AdjustableClock* DecoupledClock::Source() const { return p_->source; }

bool DecoupledClock::IsCoupled() const { return p_->coupled; }

void DecoupledClock::SetCoupled(bool coupled) { p_->coupled = coupled; }

double DecoupledClock::AllowableErrorMs() const {
  return p_->allowable_error_ms;
}

void DecoupledClock::SetAllowableErrorMs(double error_ms) {
  p_->allowable_error_ms = std::max(0.0, error_ms);
}

}  // namespace frameclock
