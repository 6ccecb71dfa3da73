/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <chrono>
#include <vector>

#include <qtils/outcome.hpp>

#include "timer/timeout.hpp"

namespace chime::timer {

  /**
   * Schedules one-shot tasks to be fired on a background thread
   */
  class Timer {
   public:
    virtual ~Timer() = default;

    /**
     * Schedules @param task to be fired once after @param delay
     * @return handle of the registration, or TimerError::TIMER_STOPPED
     */
    virtual outcome::result<TimeoutPtr> newTimeout(
        TimerTask task, std::chrono::nanoseconds delay) = 0;

    /**
     * Releases all resources acquired by this timer and drops all scheduled
     * but not yet fired timeouts
     * @return timeouts which were scheduled but never fired
     */
    virtual outcome::result<std::vector<TimeoutPtr>> stop() = 0;

    /// @return true if called from the thread which fires tasks
    [[nodiscard]] virtual bool isTimerThread() const = 0;
  };

}  // namespace chime::timer
