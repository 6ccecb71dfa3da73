/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <functional>

namespace chime::executor {

  /**
   * Accepts jobs for asynchronous execution. No ordering between jobs is
   * guaranteed.
   */
  class Executor {
   public:
    using Job = std::function<void()>;

    virtual ~Executor() = default;

    virtual void execute(Job &&job) = 0;
  };

}  // namespace chime::executor
