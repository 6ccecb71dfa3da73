/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <gmock/gmock.h>

#include "executor/executor.hpp"

namespace chime::executor {

  class ExecutorMock : public Executor {
   public:
    MOCK_METHOD(void, execute, (Job && job), (override));
  };

}  // namespace chime::executor
