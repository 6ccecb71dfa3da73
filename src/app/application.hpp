/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <utils/ctor_limiters.hpp>

namespace chime::app {

  /// @class Application - chime-application interface
  class Application : private Singleton<Application> {
   public:
    virtual ~Application() = default;

    /// Runs configured probes and shuts the services down
    virtual void run() = 0;
  };

}  // namespace chime::app
