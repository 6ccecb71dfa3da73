/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <cstdint>

#include <qtils/enum_error_code.hpp>

namespace chime::timer {

  enum class TimerError : uint8_t {
    INVALID_TICK_DURATION = 1,
    INVALID_TICKS_PER_WHEEL,
    TICK_DURATION_TOO_LONG,
    TIMER_STOPPED,
    STOP_FROM_TIMER_THREAD,
  };

}  // namespace chime::timer

OUTCOME_HPP_DECLARE_ERROR(chime::timer, TimerError);
