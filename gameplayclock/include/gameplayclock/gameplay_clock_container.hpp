// Copyright (c) 2025 <Your Name>
/**
 * @file
 * @brief Gameplay timing state machine (milliseconds as double).
 *
 * GameplayClockContainer owns a decoupled adjustable clock wrapped around an
 * externally owned source clock (typically an audio track), derives the
 * GameplayClock that gameplay components read, and coordinates start, stop,
 * seek, reset and pause transitions.
 *
 * Threading: single-threaded. All calls, including Update(), must come from
 * the host loop's thread.
 */
#pragma once

#include <functional>
#include <memory>
#include <ostream>
#include <string>

#include "frameclock/clock.hpp"
#include "frameclock/decoupled_clock.hpp"
#include "frameclock/time_source.hpp"
#include "gameplayclock/export.hpp"
#include "gameplayclock/gameplay_clock.hpp"

namespace gameplayclock {

/**
 * @brief Immutable options for GameplayClockContainer.
 *
 * Use the Builder to construct instances. All fields are read-only via
 * getters.
 */
class GAMEPLAYCLOCK_API Options {
 public:
  using LogCallback = std::function<void(const std::string&)>;

  /**
   * @brief Fluent builder for Options.
   */
  class GAMEPLAYCLOCK_API Builder {
   public:
    Builder();
    explicit Builder(const Options& base);

    /** Time Reset() rewinds to, in ms; negative for a lead-in (default 0). */
    Builder& StartOffsetMs(double v);
    /** Fixed output latency compensation in ms (default 0). */
    Builder& PlatformOffsetMs(double v);
    /** User-configured offset in ms (default 0). */
    Builder& UserOffsetMs(double v);
    /** Drift before snapping to the source, in ms (default ~33.3). */
    Builder& AllowableErrorMs(double v);
    /** Receiver for log lines (default: none). */
    Builder& LogSink(LogCallback cb);

    Options Build() const;

   private:
    double start_offset_ms_;
    double platform_offset_ms_;
    double user_offset_ms_;
    double allowable_error_ms_;
    LogCallback log_sink_cb_;
  };

  Options();

  /** @name Getters (immutable) */
  ///@{
  double StartOffsetMs() const { return start_offset_ms_; }
  double PlatformOffsetMs() const { return platform_offset_ms_; }
  double UserOffsetMs() const { return user_offset_ms_; }
  double AllowableErrorMs() const { return allowable_error_ms_; }
  const LogCallback& LogSink() const { return log_callback_; }
  ///@}

  static constexpr double kDefaultStartOffsetMs = 0.0;
  static constexpr double kDefaultAllowableErrorMs =
      frameclock::DecoupledClock::kDefaultAllowableErrorMs;

  /** Stream formatter for logging. */
  friend GAMEPLAYCLOCK_API std::ostream& operator<<(std::ostream& os,
                                                    const Options& o);

 private:
  Options(double start_offset_ms, double platform_offset_ms,
          double user_offset_ms, double allowable_error_ms,
          LogCallback log_cb);

  double start_offset_ms_;
  double platform_offset_ms_;
  double user_offset_ms_;
  double allowable_error_ms_;
  LogCallback log_callback_;
};

/**
 * @brief Current container state snapshot.
 */
struct Status {
  bool initialized = false;
  bool paused = true;
  bool adjustable_running = false;
  bool source_running = false;
  double current_time_ms = 0.0;
  double source_time_ms = 0.0;
  double elapsed_frame_time_ms = 0.0;
  double frames_per_second = 0.0;
  double rate = 1.0;

  /** Stream formatter for logging. */
  friend GAMEPLAYCLOCK_API std::ostream& operator<<(std::ostream& os,
                                                    const Status& s);
};

/**
 * @brief Encapsulates gameplay timing and provides the GameplayClock.
 *
 * Lifecycle: construct, call Initialize() once (creates the GameplayClock via
 * CreateGameplayClock()), then drive Update() once per tick from the host
 * loop. The container starts paused, in the Stopped/Reset state.
 *
 * IsPaused() is the single source of truth for whether time advances.
 * SetPaused() keeps the adjustable clock's running state consistent by
 * invoking OnIsPausedChanged() whenever the value changes.
 */
class GAMEPLAYCLOCK_API GameplayClockContainer {
 public:
  virtual ~GameplayClockContainer();

  GameplayClockContainer(const GameplayClockContainer&) = delete;
  GameplayClockContainer& operator=(const GameplayClockContainer&) = delete;

  /**
   * @brief Setup phase: create the GameplayClock.
   * @return false if already initialized or the factory returned null.
   */
  bool Initialize();
  bool IsInitialized() const { return gameplay_clock_ != nullptr; }

  /**
   * @brief Starts gameplay.
   *
   * Re-anchors the adjustable clock to the current gameplay time when it is
   * not running, so a source that was slow to stop cannot leak drift.
   * Calling Start() while running does not move time.
   */
  virtual void Start();

  /**
   * @brief Seek to a specific time in gameplay.
   * @param time Destination in ms. Negative values (lead-in) are valid; no
   *        bounds are applied here.
   */
  virtual void Seek(double time);

  /** Stops gameplay (sets IsPaused). */
  virtual void Stop();

  /**
   * @brief Rewind to StartOffset() ready for gameplay.
   *
   * The new time is visible immediately. If gameplay was running it keeps
   * running from the start offset, otherwise the container stays stopped.
   */
  virtual void Reset();

  /**
   * @brief Per-frame hook; the only place wall time becomes gameplay time.
   *
   * Processes exactly one frame of the gameplay clock's underlying clock
   * unless paused.
   */
  void Update();

  /** Whether gameplay is paused. */
  bool IsPaused() const { return is_paused_; }

  /**
   * @brief Set the pause flag.
   *
   * When the value changes, updates the GameplayClock's flag and then
   * synchronously calls OnIsPausedChanged().
   */
  void SetPaused(bool paused);

  /** The final clock exposed to gameplay components. Requires Initialize(). */
  GameplayClock& GetGameplayClock();
  const GameplayClock& GetGameplayClock() const;

  Status GetStatus() const;
  const Options& GetOptions() const { return options_; }

 protected:
  /**
   * @param source_clock Source clock (non-null, owned by the caller).
   * @param options Immutable options snapshot.
   * @param time_source Wall-time source for interpolation. Defaults to
   *        frameclock::MonotonicTimeSource::Instance() when null.
   * @throws std::invalid_argument if source_clock is null.
   */
  explicit GameplayClockContainer(frameclock::AdjustableClock* source_clock,
                                  const Options& options = Options(),
                                  frameclock::TimeSource* time_source = nullptr);

  /** Time Reset() rewinds to. Defaults to Options::StartOffsetMs(). */
  virtual double StartOffset() const;

  /** The source clock. */
  frameclock::AdjustableClock* SourceClock() const { return source_clock_; }

  /** The adjustable clock used for gameplay; use it for seeks and control. */
  frameclock::DecoupledClock& AdjustableSource() { return adjustable_source_; }
  const frameclock::DecoupledClock& AdjustableSource() const {
    return adjustable_source_;
  }

  /**
   * @brief Changes the source clock.
   *
   * Keeps the adjustable clock's running state and time. Null is ignored.
   */
  void ChangeSource(frameclock::AdjustableClock* source_clock);

  /**
   * @brief Reaction to IsPaused changes: stops or starts the adjustable
   * clock.
   */
  virtual void OnIsPausedChanged(bool is_paused);

  /**
   * @brief Creates the final GameplayClock exposed to gameplay components.
   *
   * Invoked exactly once, from Initialize(). Intermediate clocks such as
   * platform offsets should be layered here.
   *
   * @param source Frame clock providing the source time.
   */
  virtual std::unique_ptr<GameplayClock> CreateGameplayClock(
      frameclock::FrameBasedClock* source) = 0;

  bool LogEnabled() const { return static_cast<bool>(options_.LogSink()); }
  void Log(const std::string& msg) const;

 private:
  /** Fails fast when used before Initialize(). */
  GameplayClock& RequireGameplayClock() const;

  Options options_;
  frameclock::AdjustableClock* source_clock_;
  frameclock::DecoupledClock adjustable_source_;
  std::unique_ptr<GameplayClock> gameplay_clock_;
  bool is_paused_ = true;
};

}  // namespace gameplayclock
