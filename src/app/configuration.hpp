/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <chrono>
#include <cstddef>
#include <string>
#include <vector>

#include <utils/ctor_limiters.hpp>

#include "timer/execution_type.hpp"
#include "timer/timer_config.hpp"

namespace chime::app {
  class Configuration : Singleton<Configuration> {
   public:
    using TimerConfig = timer::TimerConfig;

    struct PoolConfig {
      size_t threads = 4;
    };

    /// Delay scheduled by the probe tool to measure firing lateness
    struct Probe {
      std::chrono::nanoseconds delay;
      timer::ExecutionType type = timer::ExecutionType::Inline;
    };

    Configuration();
    virtual ~Configuration() = default;

    [[nodiscard]] virtual const std::string &version() const;
    [[nodiscard]] virtual const std::string &name() const;

    [[nodiscard]] virtual const TimerConfig &timer() const;
    [[nodiscard]] virtual const PoolConfig &pool() const;
    [[nodiscard]] virtual const std::vector<Probe> &probes() const;

   private:
    friend class Configurator;  // for external configure

    std::string version_;
    std::string name_;

    TimerConfig timer_;
    PoolConfig pool_;
    std::vector<Probe> probes_;
  };

}  // namespace chime::app
