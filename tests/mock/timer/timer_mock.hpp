/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <gmock/gmock.h>

#include "timer/timer.hpp"

namespace chime::timer {

  class TimerMock : public Timer {
   public:
    MOCK_METHOD(outcome::result<TimeoutPtr>,
                newTimeout,
                (TimerTask task, std::chrono::nanoseconds delay),
                (override));

    MOCK_METHOD(outcome::result<std::vector<TimeoutPtr>>,
                stop,
                (),
                (override));

    MOCK_METHOD(bool, isTimerThread, (), (const, override));
  };

}  // namespace chime::timer
