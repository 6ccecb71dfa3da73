/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <memory>

#include <qtils/shared_ref.hpp>

#include "app/application.hpp"

namespace chime::app {
  class Configuration;
}  // namespace chime::app

namespace chime::clock {
  class SystemClock;
}  // namespace chime::clock

namespace chime::executor {
  class ThreadPool;
}  // namespace chime::executor

namespace chime::timer {
  class TimerService;
}  // namespace chime::timer

namespace soralog {
  class Logger;
}  // namespace soralog

namespace chime::log {
  class LoggingSystem;
}  // namespace chime::log

namespace chime::app {

  /**
   * @brief Schedules every configured probe on the timer service and reports
   * how late each one has fired and on which thread.
   *
   * Returns from run() once all probes have fired. The timer service and the
   * pool are shut down afterwards.
   */
  class ApplicationImpl final : public Application {
   public:
    ApplicationImpl(qtils::SharedRef<log::LoggingSystem> logsys,
                    qtils::SharedRef<Configuration> config,
                    qtils::SharedRef<executor::ThreadPool> pool,
                    qtils::SharedRef<timer::TimerService> timer_service,
                    qtils::SharedRef<clock::SystemClock> system_clock);

    void run() override;

   private:
    void shutdown();

    qtils::SharedRef<soralog::Logger> logger_;
    qtils::SharedRef<Configuration> app_config_;
    qtils::SharedRef<executor::ThreadPool> pool_;
    qtils::SharedRef<timer::TimerService> timer_service_;
    qtils::SharedRef<clock::SystemClock> system_clock_;
  };

}  // namespace chime::app
