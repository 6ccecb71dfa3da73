/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <chrono>

namespace chime::clock {

  /**
   * Source of the current time
   * @tparam ClockType underlying std::chrono clock
   */
  template <typename ClockType>
  class Clock {
   public:
    using Duration = typename ClockType::duration;
    using TimePoint = typename ClockType::time_point;

    virtual ~Clock() = default;

    /**
     * @return a time point representing the current time
     */
    [[nodiscard]] virtual TimePoint now() const = 0;

    /**
     * @return milliseconds elapsed since the epoch of the clock
     */
    [[nodiscard]] virtual std::chrono::milliseconds nowMsec() const = 0;
  };

  /**
   * Wall clock. Used where the time is reported to a user
   */
  class SystemClock : public virtual Clock<std::chrono::system_clock> {};

}  // namespace chime::clock
