/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "timer/timer_service.hpp"

#include "clock/clock.hpp"
#include "executor/executor.hpp"
#include "log/logger.hpp"
#include "timer/impl/hashed_wheel_timer.hpp"
#include "timer/impl/threaded_timer_task.hpp"
#include "timer/timer.hpp"
#include "timer/timer_error.hpp"

namespace chime::timer {

  TimerService::TimerService(qtils::SharedRef<log::LoggingSystem> logsys,
                             const Config &config,
                             qtils::SharedRef<executor::Executor> executor,
                             qtils::SharedRef<clock::SystemClock> clock)
      : TimerService(logsys,
                     config,
                     std::make_unique<HashedWheelTimer>(logsys,
                                                        config.tick_duration,
                                                        config.ticks_per_wheel,
                                                        "timer"),
                     std::move(executor),
                     std::move(clock)) {}

  TimerService::TimerService(qtils::SharedRef<log::LoggingSystem> logsys,
                             const Config &config,
                             std::unique_ptr<Timer> timer,
                             qtils::SharedRef<executor::Executor> executor,
                             qtils::SharedRef<clock::SystemClock> clock)
      : logger_(logsys->getLogger("TimerService", "timer")),
        tick_duration_(config.tick_duration),
        executor_(std::move(executor)),
        clock_(std::move(clock)),
        timer_(std::move(timer)) {
    SL_INFO(logger_,
            "Timer service started: tick duration {}ms, {} ticks per wheel",
            std::chrono::duration_cast<std::chrono::milliseconds>(
                config.tick_duration)
                .count(),
            config.ticks_per_wheel);
  }

  TimerService::~TimerService() {
    if (auto res = close(); res.has_error()) {
      SL_ERROR(logger_, "Timer service is not closed: {}", res.error());
    }
  }

  outcome::result<void> TimerService::close() {
    OUTCOME_TRY(unprocessed, timer_->stop());
    if (not unprocessed.empty()) {
      SL_DEBUG(logger_,
               "Timer service closed; {} scheduled tasks dropped",
               unprocessed.size());
    }
    return outcome::success();
  }

  std::chrono::milliseconds TimerService::estimatedTimeInMillis() const {
    // don't ask the timer for its time, so we won't wake up its thread
    return clock_->nowMsec();
  }

  outcome::result<TimeoutPtr> TimerService::newTimeout(
      TimerTask task, std::chrono::nanoseconds delay, ExecutionType type) {
    if (type == ExecutionType::Threaded) {
      task = ThreadedTimerTask(std::move(task), executor_, logger_);
    }
    return timer_->newTimeout(std::move(task), delay);
  }

  bool TimerService::isTimerThread() const {
    return timer_->isTimerThread();
  }

}  // namespace chime::timer
