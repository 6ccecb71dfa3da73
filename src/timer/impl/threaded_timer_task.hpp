/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <memory>

#include <qtils/shared_ref.hpp>

#include "timer/timeout.hpp"

namespace soralog {
  class Logger;
}  // namespace soralog

namespace chime::executor {
  class Executor;
}  // namespace chime::executor

namespace chime::timer {

  /**
   * Timer task which moves execution of the wrapped task from the timer
   * thread to an executor. Exceptions thrown by the wrapped task are logged
   * inside the executor job and go no further.
   */
  class ThreadedTimerTask {
   public:
    ThreadedTimerTask(TimerTask task,
                      qtils::SharedRef<executor::Executor> executor,
                      qtils::SharedRef<soralog::Logger> logger);

    /// Called by the timer; hands the task over to the executor
    void operator()(const TimeoutPtr &timeout);

   private:
    TimerTask task_;
    qtils::SharedRef<executor::Executor> executor_;
    qtils::SharedRef<soralog::Logger> logger_;
  };

}  // namespace chime::timer
