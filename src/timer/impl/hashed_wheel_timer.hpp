/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <chrono>
#include <memory>
#include <string>
#include <thread>
#include <vector>

#include <qtils/shared_ref.hpp>

#include "timer/timer.hpp"
#include "utils/ctor_limiters.hpp"

namespace soralog {
  class Logger;
}  // namespace soralog

namespace chime::log {
  class LoggingSystem;
}  // namespace chime::log

namespace chime::timer {

  /**
   * @brief Timer optimized for approximated I/O timeout scheduling
   *
   * Time is divided into ticks of fixed duration. Timeouts are hashed into a
   * circular wheel of buckets by the tick they are due at; a timeout whose
   * delay is longer than one revolution of the wheel carries the number of
   * remaining revolutions (rounds). Once per tick the worker thread
   * - moves newly scheduled timeouts into their buckets,
   * - drops cancelled timeouts from their buckets,
   * - fires due timeouts of the current bucket.
   *
   * Registration and cancellation are O(1). A timeout never fires earlier
   * than its delay and usually not later than one tick after it.
   *
   * Buckets are touched by the worker thread only; other threads hand their
   * requests over through the pending and cancelled queues. The worker
   * co-owns the wheel, so the timer may be destroyed by a task it fires.
   */
  class HashedWheelTimer final : public Timer, NonCopyable, NonMovable {
   public:
    static constexpr size_t kMaxTicksPerWheel = 1ull << 30;

    /**
     * Validates arguments and starts the worker thread.
     * Raises TimerError on invalid configuration.
     *
     * @param tick_duration duration between ticks
     * @param ticks_per_wheel size of the wheel; rounded up to power of two
     * @param thread_name name given to the worker thread
     */
    HashedWheelTimer(qtils::SharedRef<log::LoggingSystem> logsys,
                     std::chrono::nanoseconds tick_duration,
                     size_t ticks_per_wheel,
                     std::string thread_name = "timer");

    /// Stops the timer. If called by a task of this timer, the worker is
    /// left to finish the current tick by itself
    ~HashedWheelTimer() override;

    outcome::result<TimeoutPtr> newTimeout(
        TimerTask task, std::chrono::nanoseconds delay) override;

    outcome::result<std::vector<TimeoutPtr>> stop() override;

    bool isTimerThread() const override;

    /// Number of timeouts held by the wheel. Cancelled timeouts are
    /// released on the next tick.
    size_t pendingTimeouts() const;

    std::chrono::nanoseconds tickDuration() const;

    /// Actual count of buckets after normalization
    size_t wheelSize() const;

   private:
    class Wheel;

    qtils::SharedRef<soralog::Logger> logger_;
    std::shared_ptr<Wheel> wheel_;
    std::thread worker_;
  };

}  // namespace chime::timer
