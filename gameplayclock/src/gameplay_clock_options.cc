// Copyright (c) 2025 <Your Name>
#include <algorithm>
#include <utility>

#include "gameplayclock/gameplay_clock_container.hpp"

namespace gameplayclock {

Options::Builder::Builder()
    : start_offset_ms_(Options::kDefaultStartOffsetMs),
      platform_offset_ms_(0.0),
      user_offset_ms_(0.0),
      allowable_error_ms_(Options::kDefaultAllowableErrorMs),
      log_sink_cb_(Options::LogCallback()) {}

Options::Builder::Builder(const Options& base)
    : start_offset_ms_(base.StartOffsetMs()),
      platform_offset_ms_(base.PlatformOffsetMs()),
      user_offset_ms_(base.UserOffsetMs()),
      allowable_error_ms_(base.AllowableErrorMs()),
      log_sink_cb_(base.LogSink()) {}

Options::Builder& Options::Builder::StartOffsetMs(double v) {
  start_offset_ms_ = v;
  return *this;
}

Options::Builder& Options::Builder::PlatformOffsetMs(double v) {
  platform_offset_ms_ = v;
  return *this;
}

Options::Builder& Options::Builder::UserOffsetMs(double v) {
  user_offset_ms_ = v;
  return *this;
}

Options::Builder& Options::Builder::AllowableErrorMs(double v) {
  allowable_error_ms_ = std::max(0.0, v);
  return *this;
}

Options::Builder& Options::Builder::LogSink(LogCallback cb) {
  log_sink_cb_ = std::move(cb);
  return *this;
}

Options Options::Builder::Build() const {
  return Options(start_offset_ms_, platform_offset_ms_, user_offset_ms_,
                 allowable_error_ms_, log_sink_cb_);
}

Options::Options()
    : start_offset_ms_(kDefaultStartOffsetMs),
      platform_offset_ms_(0.0),
      user_offset_ms_(0.0),
      allowable_error_ms_(kDefaultAllowableErrorMs) {}

Options::Options(double start_offset_ms, double platform_offset_ms,
                 double user_offset_ms, double allowable_error_ms,
                 LogCallback log_cb)
    : start_offset_ms_(start_offset_ms),
      platform_offset_ms_(platform_offset_ms),
      user_offset_ms_(user_offset_ms),
      allowable_error_ms_(allowable_error_ms),
      log_callback_(std::move(log_cb)) {}

std::ostream& operator<<(std::ostream& os, const Options& o) {
  os << "start_offset=" << o.StartOffsetMs()
     << "ms, platform_offset=" << o.PlatformOffsetMs()
     << "ms, user_offset=" << o.UserOffsetMs()
     << "ms, allowable_error=" << o.AllowableErrorMs() << "ms";
  return os;
}

std::ostream& operator<<(std::ostream& os, const Status& s) {
  os << "init=" << (s.initialized ? "true" : "false")
     << ", paused=" << (s.paused ? "true" : "false")
     << ", time=" << s.current_time_ms << "ms"
     << ", source=" << s.source_time_ms << "ms ("
     << (s.source_running ? "running" : "stopped") << ")"
     << ", adjustable=" << (s.adjustable_running ? "running" : "stopped")
     << ", elapsed=" << s.elapsed_frame_time_ms << "ms"
     << ", fps=" << s.frames_per_second << ", rate=" << s.rate;
  return os;
}

}  // namespace gameplayclock
