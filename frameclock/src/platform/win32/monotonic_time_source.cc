// Copyright (c) 2025 <Your Name>
/**
 * @file monotonic_time_source.cc
 * @brief Windows-specific implementation using QPC.
 */
#include "frameclock/monotonic_time_source.hpp"

#include <windows.h>

#include <cstdint>

namespace frameclock {

struct MonotonicTimeSource::Impl {
  int64_t qpc_t0_{0};      // QPC value at construction
  double qpc_freq_{1.0};   // counts per second
};

MonotonicTimeSource::MonotonicTimeSource() : impl_(std::make_unique<Impl>()) {
  LARGE_INTEGER f{};
  QueryPerformanceFrequency(&f);
  impl_->qpc_freq_ = static_cast<double>(f.QuadPart);

  LARGE_INTEGER t0{};
  QueryPerformanceCounter(&t0);
  impl_->qpc_t0_ = static_cast<int64_t>(t0.QuadPart);
}

MonotonicTimeSource::~MonotonicTimeSource() = default;

double MonotonicTimeSource::NowMs() {
  LARGE_INTEGER t{};
  QueryPerformanceCounter(&t);
  return (static_cast<int64_t>(t.QuadPart) - impl_->qpc_t0_) * 1000.0 /
         impl_->qpc_freq_;
}

MonotonicTimeSource& MonotonicTimeSource::Instance() {
  static MonotonicTimeSource source;
  return source;
}

}  // namespace frameclock
