// Copyright (c) 2025 <Your Name>
/**
 * @file
 * @brief Example program driving an OffsetGameplayClockContainer from a
 *        ~60 Hz host loop.
 *
 * A StopwatchClock stands in for the audio track. The loop runs a fixed
 * script (reset, start, pause, resume, seek, stop) and prints a status line
 * every 250ms of wall time.
 *
 * Usage:
 *   gameplayclock_example --start-offset -2000 --platform-offset 15 \
 *     --user-offset -5 --rate 1.0 --duration 6000 --seek 30000
 */

#include <chrono>
#include <cstdio>
#include <cstdlib>
#include <sstream>
#include <string>
#include <thread>

#include "frameclock/monotonic_time_source.hpp"
#include "frameclock/stopwatch_clock.hpp"
#include "gameplayclock/offset_gameplay_clock_container.hpp"

namespace {
/**
 * @brief Debug logger writing to stderr. Called from the host loop only.
 */
class Logger {
 public:
  explicit Logger(bool enabled) : enabled_(enabled) {}

  void Log(const std::string& msg) const {
    if (!enabled_) return;
    std::fprintf(stderr, "%s\n", msg.c_str());
  }

 private:
  bool enabled_;
};

void PrintUsage() {
  std::fprintf(stderr,
               "Usage: gameplayclock_example [options]\n"
               "Options:\n"
               "  --start-offset ms    (default 0)\n"
               "  --platform-offset ms (default 0)\n"
               "  --user-offset ms     (default 0)\n"
               "  --rate r             (default 1.0)\n"
               "  --duration ms        (default 6000)\n"
               "  --seek ms            (default 30000)\n"
               "  --debug              Enable debug logging\n");
}

void PrintStatus(const char* label, double wall_ms,
                 const gameplayclock::GameplayClockContainer& container) {
  std::ostringstream oss;
  oss << container.GetStatus();
  std::printf("[%7.1f] %-8s %s\n", wall_ms, label, oss.str().c_str());
  std::fflush(stdout);
}
}  // namespace

int main(int argc, char** argv) {
  double rate = 1.0;
  double duration_ms = 6000.0;
  double seek_ms = 30000.0;
  bool debug = false;

  auto builder = gameplayclock::Options::Builder();

  for (int i = 1; i < argc; ++i) {
    std::string a(argv[i]);
    auto need = [&](int more) { return i + more < argc; };
    if (a == "--start-offset" && need(1)) {
      builder.StartOffsetMs(std::atof(argv[++i]));
    } else if (a == "--platform-offset" && need(1)) {
      builder.PlatformOffsetMs(std::atof(argv[++i]));
    } else if (a == "--user-offset" && need(1)) {
      builder.UserOffsetMs(std::atof(argv[++i]));
    } else if (a == "--rate" && need(1)) {
      rate = std::atof(argv[++i]);
    } else if (a == "--duration" && need(1)) {
      duration_ms = std::atof(argv[++i]);
    } else if (a == "--seek" && need(1)) {
      seek_ms = std::atof(argv[++i]);
    } else if (a == "--debug") {
      debug = true;
    } else if (a == "-h" || a == "--help") {
      PrintUsage();
      return 0;
    } else {
      std::fprintf(stderr, "Unknown or incomplete option: %s\n", a.c_str());
      PrintUsage();
      return 2;
    }
  }
  if (rate <= 0.0 || duration_ms <= 0.0) {
    std::fprintf(stderr, "--rate and --duration must be positive\n");
    return 2;
  }

  // Create logger
  Logger logger(debug);
  builder.LogSink([&logger](const std::string& msg) { logger.Log(msg); });

  auto& wall = frameclock::MonotonicTimeSource::Instance();
  frameclock::StopwatchClock track(&wall);
  track.SetRate(rate);

  gameplayclock::OffsetGameplayClockContainer container(&track, builder.Build(),
                                                        &wall);
  if (!container.Initialize()) {
    std::fprintf(stderr, "Failed to initialize GameplayClockContainer\n");
    return 1;
  }

  // Script points, as fractions of the run.
  const double pause_at = duration_ms * 0.4;
  const double resume_at = duration_ms * 0.5;
  const double seek_at = duration_ms * 0.7;

  const double begin = wall.NowMs();
  container.Reset();
  container.Start();
  PrintStatus("start", 0.0, container);

  bool paused_once = false;
  bool resumed = false;
  bool seeked = false;
  double next_print = 250.0;
  const auto frame = std::chrono::microseconds(16667);

  for (;;) {
    std::this_thread::sleep_for(frame);
    container.Update();

    double elapsed = wall.NowMs() - begin;
    if (!paused_once && elapsed >= pause_at) {
      container.Stop();
      paused_once = true;
      PrintStatus("pause", elapsed, container);
    } else if (paused_once && !resumed && elapsed >= resume_at) {
      container.Start();
      resumed = true;
      PrintStatus("resume", elapsed, container);
    } else if (!seeked && elapsed >= seek_at) {
      container.Seek(seek_ms);
      seeked = true;
      PrintStatus("seek", elapsed, container);
    }

    if (elapsed >= duration_ms) break;
    if (elapsed >= next_print) {
      PrintStatus("tick", elapsed, container);
      next_print += 250.0;
    }
  }

  container.Stop();
  PrintStatus("stop", wall.NowMs() - begin, container);
  container.Reset();
  PrintStatus("reset", wall.NowMs() - begin, container);
  return 0;
}
