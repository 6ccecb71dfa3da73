/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "app/impl/application_impl.hpp"

#include <latch>
#include <unistd.h>

#include "app/configuration.hpp"
#include "clock/clock.hpp"
#include "executor/impl/thread_pool.hpp"
#include "log/logger.hpp"
#include "timer/timer_service.hpp"

namespace chime::app {

  ApplicationImpl::ApplicationImpl(
      qtils::SharedRef<log::LoggingSystem> logsys,
      qtils::SharedRef<Configuration> config,
      qtils::SharedRef<executor::ThreadPool> pool,
      qtils::SharedRef<timer::TimerService> timer_service,
      qtils::SharedRef<clock::SystemClock> system_clock)
      : logger_(logsys->getLogger("Application", "application")),
        app_config_(std::move(config)),
        pool_(std::move(pool)),
        timer_service_(std::move(timer_service)),
        system_clock_(std::move(system_clock)) {}

  void ApplicationImpl::run() {
    logger_->info("Start as version '{}' named as '{}' with PID {}",
                  app_config_->version(),
                  app_config_->name(),
                  getpid());

    const auto &probes = app_config_->probes();
    if (probes.empty()) {
      SL_INFO(logger_, "No probes are configured; nothing to do");
      shutdown();
      return;
    }

    std::latch fired(static_cast<std::ptrdiff_t>(probes.size()));
    size_t scheduled = 0;

    for (size_t index = 0; index < probes.size(); ++index) {
      const auto &probe = probes[index];
      auto delay_ms =
          std::chrono::duration_cast<std::chrono::milliseconds>(probe.delay);
      auto scheduled_at = system_clock_->nowMsec();

      auto res = timer_service_->newTimeout(
          [this, &fired, index, delay_ms, scheduled_at](
              const timer::TimeoutPtr &) {
            auto elapsed = system_clock_->nowMsec() - scheduled_at;
            SL_INFO(logger_,
                    "Probe #{} ({}ms) fired on {} thread; elapsed {}ms, "
                    "late by {}ms",
                    index,
                    delay_ms.count(),
                    timer_service_->isTimerThread() ? "timer"
                    : pool_->isInPool()             ? "pool"
                                                    : "other",
                    elapsed.count(),
                    (elapsed - delay_ms).count());
            fired.count_down();
          },
          probe.delay,
          probe.type);

      if (res.has_error()) {
        SL_ERROR(logger_, "Probe #{} is not scheduled: {}", index, res.error());
        fired.count_down();
        continue;
      }
      ++scheduled;
      SL_DEBUG(logger_,
               "Probe #{} scheduled in {}ms as {}",
               index,
               delay_ms.count(),
               timer::toString(probe.type));
    }

    fired.wait();
    SL_INFO(logger_, "All {} scheduled probes have fired", scheduled);

    shutdown();
  }

  void ApplicationImpl::shutdown() {
    if (auto res = timer_service_->close(); res.has_error()) {
      SL_ERROR(logger_, "Timer service is not closed: {}", res.error());
    }
    pool_->dispose();
  }

}  // namespace chime::app
