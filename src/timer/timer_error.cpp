/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "timer/timer_error.hpp"

OUTCOME_CPP_DEFINE_CATEGORY(chime::timer, TimerError, e) {
  using E = TimerError;
  switch (e) {
    case E::INVALID_TICK_DURATION:
      return "Tick duration must be greater than zero";
    case E::INVALID_TICKS_PER_WHEEL:
      return "Ticks per wheel must be in range [1, 2^30]";
    case E::TICK_DURATION_TOO_LONG:
      return "Tick duration is too long for the wheel size";
    case E::TIMER_STOPPED:
      return "Timer is stopped; cannot be started once stopped";
    case E::STOP_FROM_TIMER_THREAD:
      return "Timer can not be stopped from a task it fires";
  }
  return "Unknown timer error";
}
