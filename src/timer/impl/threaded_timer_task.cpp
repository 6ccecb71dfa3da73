/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "timer/impl/threaded_timer_task.hpp"

#include "executor/executor.hpp"
#include "log/logger.hpp"

namespace chime::timer {

  ThreadedTimerTask::ThreadedTimerTask(
      TimerTask task,
      qtils::SharedRef<executor::Executor> executor,
      qtils::SharedRef<soralog::Logger> logger)
      : task_(std::move(task)),
        executor_(std::move(executor)),
        logger_(std::move(logger)) {}

  void ThreadedTimerTask::operator()(const TimeoutPtr &timeout) {
    executor_->execute(
        [task{std::move(task_)}, timeout, logger{logger_}] {
          try {
            task(timeout);
          } catch (const std::exception &e) {
            SL_WARN(logger,
                    "An exception was thrown by threaded timer task: {}",
                    e.what());
          }
        });
  }

}  // namespace chime::timer
