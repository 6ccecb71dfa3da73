/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "app/configuration.hpp"

namespace chime::app {

  Configuration::Configuration()
      : version_("undefined"),
        name_("unnamed"),
        timer_{
            .tick_duration = std::chrono::milliseconds(100),
            .ticks_per_wheel = 1024,
        },
        pool_{
            .threads = 4,
        } {}

  const std::string &Configuration::version() const {
    return version_;
  }

  const std::string &Configuration::name() const {
    return name_;
  }

  const Configuration::TimerConfig &Configuration::timer() const {
    return timer_;
  }

  const Configuration::PoolConfig &Configuration::pool() const {
    return pool_;
  }

  const std::vector<Configuration::Probe> &Configuration::probes() const {
    return probes_;
  }

}  // namespace chime::app
