/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <chrono>
#include <cstddef>

namespace chime::timer {

  /// Parameters of the timer owned by TimerService
  struct TimerConfig {
    std::chrono::nanoseconds tick_duration = std::chrono::milliseconds(100);
    size_t ticks_per_wheel = 1024;
  };

}  // namespace chime::timer
