// Copyright (c) 2025
/**
 * @file monotonic_time_source.cc
 * @brief POSIX-specific implementation using clock_gettime().
 */
#include "frameclock/monotonic_time_source.hpp"

#include <time.h>

#include <cstdint>

namespace frameclock {

struct MonotonicTimeSource::Impl {
  int64_t mono_t0_nsec_{0};  // Monotonic anchor (nanoseconds)

  // Get current CLOCK_MONOTONIC in nanoseconds
  static int64_t MonotonicNow() {
    timespec ts{};
    clock_gettime(CLOCK_MONOTONIC, &ts);
    return static_cast<int64_t>(ts.tv_sec) * 1'000'000'000LL +
           static_cast<int64_t>(ts.tv_nsec);
  }
};

MonotonicTimeSource::MonotonicTimeSource() : impl_(std::make_unique<Impl>()) {
  impl_->mono_t0_nsec_ = Impl::MonotonicNow();
}

MonotonicTimeSource::~MonotonicTimeSource() = default;

double MonotonicTimeSource::NowMs() {
  return static_cast<double>(Impl::MonotonicNow() - impl_->mono_t0_nsec_) /
         1e6;
}

MonotonicTimeSource& MonotonicTimeSource::Instance() {
  static MonotonicTimeSource source;
  return source;
}

}  // namespace frameclock
