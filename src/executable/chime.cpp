/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include <iostream>
#include <memory>

#include <fmt/format.h>
#include <fmt/ostream.h>
#include <qtils/final_action.hpp>
#include <soralog/impl/configurator_from_yaml.hpp>
#include <soralog/logging_system.hpp>
#include <soralog/util.hpp>

#include "app/configuration.hpp"
#include "app/configurator.hpp"
#include "app/impl/application_impl.hpp"
#include "clock/impl/clock_impl.hpp"
#include "executor/impl/thread_pool.hpp"
#include "log/logger.hpp"
#include "timer/timer_service.hpp"

namespace {
  void wrong_usage() {
    std::cerr << "Wrong usage.\n"
                 "Run with `--help' argument to print usage\n";
  }

  using chime::app::ApplicationImpl;
  using chime::app::Configuration;
  using chime::log::LoggingSystem;

  int run_probes(qtils::SharedRef<LoggingSystem> logsys,
                 qtils::SharedRef<Configuration> appcfg) {
    auto logger = logsys->getLogger("Main", chime::log::defaultGroupName);

    std::shared_ptr<ApplicationImpl> app;
    try {
      auto clock = std::make_shared<chime::clock::SystemClockImpl>();
      auto pool = std::make_shared<chime::executor::ThreadPool>(
          logsys, appcfg->pool().threads);
      auto timer_service = std::make_shared<chime::timer::TimerService>(
          logsys, appcfg->timer(), pool, clock);
      app = std::make_shared<ApplicationImpl>(
          logsys, appcfg, pool, timer_service, clock);
    } catch (const std::exception &e) {
      SL_CRITICAL(logger, "Failed to start services: {}", e.what());
      return EXIT_FAILURE;
    }

    SL_INFO(logger, "Started. Version: {} ", appcfg->version());

    app->run();

    SL_INFO(logger, "Stopped");
    logger->flush();

    return EXIT_SUCCESS;
  }

}  // namespace

int main(int argc, const char **argv) {
  setlinebuf(stdout);
  setlinebuf(stderr);

  soralog::util::setThreadName("chime");

  qtils::FinalAction flush_std_streams_at_exit([] {
    std::cout.flush();
    std::cerr.flush();
  });

  if (argc == 0) {
    // Abnormal run
    wrong_usage();
    return EXIT_FAILURE;
  }

  auto app_configurator =
      std::make_unique<chime::app::Configurator>(argc, argv);

  // Parse CLI args for help, version and config
  if (auto res = app_configurator->step1(); res.has_value()) {
    if (res.value()) {
      return EXIT_SUCCESS;
    }
  } else {
    return EXIT_FAILURE;
  }

  // Parse remaining args
  if (auto res = app_configurator->step2(); res.has_value()) {
    if (res.value()) {
      return EXIT_SUCCESS;
    }
  } else {
    return EXIT_FAILURE;
  }

  // Setup logging system
  auto logging_system = ({
    auto log_config = app_configurator->getLoggingConfig();
    if (log_config.has_error()) {
      std::cerr << "Logging config is empty.\n";
      return EXIT_FAILURE;
    }

    auto log_configurator = std::make_shared<soralog::ConfiguratorFromYAML>(
        std::shared_ptr<soralog::Configurator>(nullptr), log_config.value());

    auto logging_system =
        std::make_shared<soralog::LoggingSystem>(std::move(log_configurator));

    auto config_result = logging_system->configure();
    if (not config_result.message.empty()) {
      (config_result.has_error ? std::cerr : std::cout)
          << config_result.message << '\n';
    }
    if (config_result.has_error) {
      return EXIT_FAILURE;
    }

    std::make_shared<chime::log::LoggingSystem>(std::move(logging_system));
  });

  // Apply `-l` filters over the configured levels
  if (auto res =
          logging_system->tuneLoggingSystem(app_configurator->getLoggingCliArgs());
      res.has_error()) {
    fmt::println(std::cerr, "Wrong value of option --log: {}", res.error());
    return EXIT_FAILURE;
  }

  // Setup config
  auto app_configuration = ({
    auto logger = logging_system->getLogger("Configurator", "chime");

    auto config_res = app_configurator->calculateConfig(logger);
    if (config_res.has_error()) {
      auto error = config_res.error();
      SL_CRITICAL(logger, "Failed to calculate config: {}", error);
      fmt::println(std::cerr, "Failed to calculate config: {}", error);
      fmt::println(std::cerr, "See more details in the log");
      return EXIT_FAILURE;
    }

    config_res.value();
  });

  auto logger =
      logging_system->getLogger("Main", chime::log::defaultGroupName);

  int exit_code = run_probes(logging_system, app_configuration);

  SL_INFO(logger, "All components are stopped");
  logger->flush();

  return exit_code;
}
