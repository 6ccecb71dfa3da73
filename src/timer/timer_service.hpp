/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <chrono>
#include <memory>

#include <qtils/outcome.hpp>
#include <qtils/shared_ref.hpp>

#include "timer/execution_type.hpp"
#include "timer/timeout.hpp"
#include "timer/timer_config.hpp"

namespace soralog {
  class Logger;
}  // namespace soralog

namespace chime::log {
  class LoggingSystem;
}  // namespace chime::log

namespace chime::clock {
  class SystemClock;
}  // namespace chime::clock

namespace chime::executor {
  class Executor;
}  // namespace chime::executor

namespace chime::timer {
  class Timer;

  /**
   * @brief Single entry point to schedule delayed one-shot tasks
   *
   * Owns one timer. Tasks scheduled as ExecutionType::Inline are run on the
   * timer thread; they must be short, because they delay every timeout after
   * them. Tasks scheduled as ExecutionType::Threaded are handed to the
   * executor when they fire.
   */
  class TimerService final {
   public:
    using Config = TimerConfig;

    /// Creates a hashed wheel timer. Raises TimerError on invalid config
    TimerService(qtils::SharedRef<log::LoggingSystem> logsys,
                 const Config &config,
                 qtils::SharedRef<executor::Executor> executor,
                 qtils::SharedRef<clock::SystemClock> clock);

    /// Takes ownership of an already running @param timer
    TimerService(qtils::SharedRef<log::LoggingSystem> logsys,
                 const Config &config,
                 std::unique_ptr<Timer> timer,
                 qtils::SharedRef<executor::Executor> executor,
                 qtils::SharedRef<clock::SystemClock> clock);

    TimerService(const TimerService &) = delete;
    TimerService &operator=(const TimerService &) = delete;
    TimerService(TimerService &&) = delete;
    TimerService &operator=(TimerService &&) = delete;

    ~TimerService();

    /**
     * Stops the timer. Scheduled but not fired tasks are dropped. Tasks
     * already handed to the executor are not waited for.
     * Repeated calls do nothing.
     */
    outcome::result<void> close();

    std::chrono::milliseconds estimatedTimeInMillis() const;

    /**
     * Schedules @param task to be run once after @param delay
     * @return handle to cancel the task, or TimerError::TIMER_STOPPED after
     * close()
     */
    outcome::result<TimeoutPtr> newTimeout(TimerTask task,
                                           std::chrono::nanoseconds delay,
                                           ExecutionType type);

    std::chrono::nanoseconds tickDuration() const {
      return tick_duration_;
    }

    /// @return true if called from the timer thread
    bool isTimerThread() const;

   private:
    qtils::SharedRef<soralog::Logger> logger_;
    const std::chrono::nanoseconds tick_duration_;
    qtils::SharedRef<executor::Executor> executor_;
    qtils::SharedRef<clock::SystemClock> clock_;
    std::unique_ptr<Timer> timer_;
  };

}  // namespace chime::timer
