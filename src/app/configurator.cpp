/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "app/configurator.hpp"

#include <cassert>
#include <cstdint>
#include <filesystem>
#include <iostream>
#include <optional>
#include <string>
#include <string_view>

#include <boost/algorithm/string/trim.hpp>
#include <boost/config.hpp>
#include <boost/program_options.hpp>
#include <boost/program_options/value_semantic.hpp>
#include <qtils/outcome.hpp>
#include <qtils/shared_ref.hpp>
#include <soralog/macro.hpp>

#include "app/build_version.hpp"
#include "app/configuration.hpp"
#include "log/logger.hpp"
#include "timer/impl/hashed_wheel_timer.hpp"
#include "utils/parsers.hpp"

OUTCOME_CPP_DEFINE_CATEGORY(chime::app, Configurator::Error, e) {
  using E = chime::app::Configurator::Error;
  switch (e) {
    case E::CliArgsParseFailed:
      return "CLI Arguments parse failed";
    case E::ConfigFileParseFailed:
      return "Config file parse failed";
    case E::InvalidValue:
      return "Result config has invalid values";
  }
  BOOST_UNREACHABLE_RETURN("Unknown app::Configurator::Error");
}

namespace {
  template <typename T, typename Func>
  void find_argument(boost::program_options::variables_map &vm,
                     const char *name,
                     Func &&f) {
    assert(nullptr != name);
    if (auto it = vm.find(name); it != vm.end()) {
      if (it->second.defaulted()) {
        return;
      }
      std::forward<Func>(f)(it->second.as<T>());
    }
  }

  /// Probe is written as `<delay>[:<execution type>]`, e.g. `20ms:threaded`
  std::optional<chime::app::Configuration::Probe> parseProbe(
      std::string_view str) {
    chime::app::Configuration::Probe probe;
    auto colon = str.find(':');
    if (colon != std::string_view::npos) {
      auto type = chime::timer::executionTypeFromString(
          chime::util::trim(str.substr(colon + 1)));
      if (not type.has_value()) {
        return std::nullopt;
      }
      probe.type = type.value();
      str = str.substr(0, colon);
    }
    auto delay = chime::util::parseTimeDuration(str);
    if (not delay.has_value()) {
      return std::nullopt;
    }
    probe.delay = delay.value();
    return probe;
  }

}  // namespace

namespace chime::app {

  Configurator::Configurator(int argc, const char **argv)
      : argc_(argc), argv_(argv) {
    config_ = std::make_shared<Configuration>();

    config_->version_ = buildVersion();
    config_->name_ = "chime";

    namespace po = boost::program_options;

    // clang-format off

    po::options_description general_options("General options", 120, 100);
    general_options.add_options()
        ("help,h", "Show this help message.")
        ("version,v", "Show version information.")
        ("config,c", po::value<std::string>(),  "Optional. Filepath to load configuration from. Overrides default configuration values.")
        ("name,n", po::value<std::string>(), "Set name of the instance.")
        ("log,l", po::value<std::vector<std::string>>(),
          "Sets a custom logging filter.\n"
          "Syntax: <target>=<level>, e.g., -ltimer=debug.\n"
          "Log levels: trace, debug, verbose, info, warn, error, critical, off.\n"
          "Default: all targets log at `info`.\n"
          "Global log level can be set with: -l<level>.")
        ;

    po::options_description timer_options("Timer options");
    timer_options.add_options()
        ("tick-duration", po::value<std::string>(), "Granularity of the timer clock, e.g. 100ms. Default: 100ms.")
        ("ticks-per-wheel", po::value<size_t>(), "Number of buckets of the timer wheel. Default: 1024.")
        ;

    po::options_description pool_options("Pool options");
    pool_options.add_options()
        ("pool-threads", po::value<size_t>(), "Number of threads running threaded timer tasks. Default: 4.")
        ;

    po::options_description probe_options("Probe options");
    probe_options.add_options()
        ("probe,p", po::value<std::vector<std::string>>(),
          "Schedule a probe task and report its lateness.\n"
          "Syntax: <delay>[:<inline|threaded>], e.g., -p50ms -p20ms:threaded.")
        ;

    // clang-format on

    cli_options_
        .add(general_options)  //
        .add(timer_options)
        .add(pool_options)
        .add(probe_options);
  }

  outcome::result<bool> Configurator::step1() {  // read min cli-args and config
    namespace po = boost::program_options;

    po::options_description options;
    options.add_options()("help,h", "show help")("version,v", "show version")(
        "config,c", po::value<std::string>(), "config-file path");

    po::variables_map vm;

    // first-run parse to read-only general options and to lookup for "help",
    // "config" and "version". all the rest options are ignored
    try {
      po::parsed_options parsed = po::command_line_parser(argc_, argv_)
                                      .options(options)
                                      .allow_unregistered()
                                      .run();
      po::store(parsed, vm);
      po::notify(vm);
    } catch (const std::exception &e) {
      std::cerr << "Error: " << e.what() << '\n'
                << "Try run with option '--help' for more information\n";
      return Error::CliArgsParseFailed;
    }

    if (vm.contains("help")) {
      std::cout << "Chime version " << buildVersion() << '\n';
      std::cout << cli_options_ << '\n';
      return true;
    }

    if (vm.contains("version")) {
      std::cout << "Chime version " << buildVersion() << '\n';
      return true;
    }

    if (vm.contains("config")) {
      auto path = vm["config"].as<std::string>();
      try {
        config_file_ = YAML::LoadFile(path);
      } catch (const std::exception &exception) {
        std::cerr << "Error: Can't parse file "
                  << std::filesystem::weakly_canonical(path) << ": "
                  << exception.what() << "\n"
                  << "Option --config must be path to correct yaml-file\n"
                  << "Try run with option '--help' for more information\n";
        return Error::ConfigFileParseFailed;
      }
    }

    return false;
  }

  outcome::result<bool> Configurator::step2() {
    namespace po = boost::program_options;

    try {
      // second-run parse to gather all known options
      // with reporting about any unrecognized input
      po::parsed_options parsed =
          po::command_line_parser(argc_, argv_).options(cli_options_).run();
      po::store(parsed, cli_values_map_);
      po::notify(cli_values_map_);
    } catch (const std::exception &e) {
      std::cerr << "Error: " << e.what() << '\n'
                << "Try run with option '--help' for more information\n";
      return Error::CliArgsParseFailed;
    }

    return false;
  }

  static constexpr std::string_view default_logging_yaml = R"yaml(
sinks:
  - name: console
    type: console
    stream: stdout
    thread: name
    color: true
    latency: 0
groups:
  - name: main
    sink: console
    level: info
    is_fallback: true
    children:
      - name: chime
        children:
          - name: application
          - name: timer
          - name: executor
)yaml";

  outcome::result<YAML::Node> Configurator::getLoggingConfig() {
    auto load_default = [&]() -> outcome::result<YAML::Node> {
      try {
        return YAML::Load(std::string(default_logging_yaml));
      } catch (const std::exception &e) {
        file_errors_ << "E: Failed to load default logging config: " << e.what()
                     << "\n";
        return Error::ConfigFileParseFailed;
      }
    };

    if (not config_file_.has_value()) {
      return load_default();
    }
    auto logging = (*config_file_)["logging"];
    if (logging.IsDefined()) {
      return logging;
    }
    return load_default();
  }

  std::vector<std::string> Configurator::getLoggingCliArgs() const {
    if (auto it = cli_values_map_.find("log"); it != cli_values_map_.end()) {
      return it->second.as<std::vector<std::string>>();
    }
    return {};
  }

  outcome::result<std::shared_ptr<Configuration>> Configurator::calculateConfig(
      qtils::SharedRef<soralog::Logger> logger) {
    logger_ = std::move(logger);
    OUTCOME_TRY(initGeneralConfig());
    OUTCOME_TRY(initTimerConfig());
    OUTCOME_TRY(initPoolConfig());
    OUTCOME_TRY(initProbesConfig());

    return config_;
  }

  outcome::result<void> Configurator::reportFileErrors() {
    if (not file_has_error_) {
      return outcome::success();
    }
    std::string path;
    find_argument<std::string>(
        cli_values_map_, "config", [&](const std::string &value) {
          path = value;
        });
    SL_ERROR(logger_, "Config file `{}` has some problems:", path);
    std::istringstream iss(file_errors_.str());
    std::string line;
    while (std::getline(iss, line)) {
      SL_ERROR(logger_, "  {}", std::string_view(line).substr(3));
    }
    return Error::ConfigFileParseFailed;
  }

  outcome::result<void> Configurator::initGeneralConfig() {
    // Init by config-file
    if (config_file_.has_value()) {
      auto section = (*config_file_)["general"];
      if (section.IsDefined()) {
        if (section.IsMap()) {
          auto name = section["name"];
          if (name.IsDefined()) {
            if (name.IsScalar()) {
              auto value = name.as<std::string>();
              boost::trim(value);
              config_->name_ = value;
            } else {
              file_errors_ << "E: Value 'general.name' must be scalar\n";
              file_has_error_ = true;
            }
          }
        } else {
          file_errors_ << "E: Section 'general' defined, but is not map\n";
          file_has_error_ = true;
        }
      }
    }

    OUTCOME_TRY(reportFileErrors());

    // Adjust by CLI arguments
    find_argument<std::string>(
        cli_values_map_, "name", [&](const std::string &value) {
          config_->name_ = value;
        });

    // Check values
    if (config_->name_.empty()) {
      SL_ERROR(logger_, "The 'name' must not be empty");
      return Error::InvalidValue;
    }

    return outcome::success();
  }

  outcome::result<void> Configurator::initTimerConfig() {
    // Init by config-file
    if (config_file_.has_value()) {
      auto section = (*config_file_)["timer"];
      if (section.IsDefined()) {
        if (section.IsMap()) {
          auto tick_duration = section["tick_duration"];
          if (tick_duration.IsDefined()) {
            if (tick_duration.IsScalar()) {
              auto value =
                  util::parseTimeDuration(tick_duration.as<std::string>());
              if (value.has_value()) {
                config_->timer_.tick_duration = value.value();
              } else {
                file_errors_ << "E: Bad 'timer.tick_duration' value; "
                                "Expected: 100, 10ms, 1s, etc.\n";
                file_has_error_ = true;
              }
            } else {
              file_errors_ << "E: Value 'timer.tick_duration' must be scalar\n";
              file_has_error_ = true;
            }
          }
          auto ticks_per_wheel = section["ticks_per_wheel"];
          if (ticks_per_wheel.IsDefined()) {
            if (ticks_per_wheel.IsScalar()) {
              try {
                config_->timer_.ticks_per_wheel = ticks_per_wheel.as<size_t>();
              } catch (const YAML::BadConversion &) {
                file_errors_ << "E: Value 'timer.ticks_per_wheel' must be "
                                "a positive number\n";
                file_has_error_ = true;
              }
            } else {
              file_errors_
                  << "E: Value 'timer.ticks_per_wheel' must be scalar\n";
              file_has_error_ = true;
            }
          }
        } else {
          file_errors_ << "E: Section 'timer' defined, but is not map\n";
          file_has_error_ = true;
        }
      }
    }

    OUTCOME_TRY(reportFileErrors());

    // Adjust by CLI arguments
    bool fail = false;
    find_argument<std::string>(
        cli_values_map_, "tick-duration", [&](const std::string &value) {
          auto duration = util::parseTimeDuration(value);
          if (duration.has_value()) {
            config_->timer_.tick_duration = duration.value();
          } else {
            std::cerr << "Option --tick-duration has invalid value\n"
                      << "Try run with option '--help' for more information\n";
            fail = true;
          }
        });
    find_argument<size_t>(
        cli_values_map_, "ticks-per-wheel", [&](const size_t &value) {
          config_->timer_.ticks_per_wheel = value;
        });
    if (fail) {
      return Error::CliArgsParseFailed;
    }

    // Check values
    if (config_->timer_.tick_duration <= std::chrono::nanoseconds::zero()) {
      SL_ERROR(logger_, "The 'tick_duration' must be greater than zero");
      return Error::InvalidValue;
    }
    if (config_->timer_.ticks_per_wheel == 0
        or config_->timer_.ticks_per_wheel
               > timer::HashedWheelTimer::kMaxTicksPerWheel) {
      SL_ERROR(logger_,
               "The 'ticks_per_wheel' must be in range [1, {}]: {}",
               timer::HashedWheelTimer::kMaxTicksPerWheel,
               config_->timer_.ticks_per_wheel);
      return Error::InvalidValue;
    }

    return outcome::success();
  }

  outcome::result<void> Configurator::initPoolConfig() {
    // Init by config-file
    if (config_file_.has_value()) {
      auto section = (*config_file_)["pool"];
      if (section.IsDefined()) {
        if (section.IsMap()) {
          auto threads = section["threads"];
          if (threads.IsDefined()) {
            if (threads.IsScalar()) {
              try {
                config_->pool_.threads = threads.as<size_t>();
              } catch (const YAML::BadConversion &) {
                file_errors_
                    << "E: Value 'pool.threads' must be a positive number\n";
                file_has_error_ = true;
              }
            } else {
              file_errors_ << "E: Value 'pool.threads' must be scalar\n";
              file_has_error_ = true;
            }
          }
        } else {
          file_errors_ << "E: Section 'pool' defined, but is not map\n";
          file_has_error_ = true;
        }
      }
    }

    OUTCOME_TRY(reportFileErrors());

    // Adjust by CLI arguments
    find_argument<size_t>(
        cli_values_map_, "pool-threads", [&](const size_t &value) {
          config_->pool_.threads = value;
        });

    // Check values
    if (config_->pool_.threads == 0) {
      SL_ERROR(logger_, "The 'pool.threads' must be greater than zero");
      return Error::InvalidValue;
    }

    return outcome::success();
  }

  outcome::result<void> Configurator::initProbesConfig() {
    // Init by config-file
    if (config_file_.has_value()) {
      auto section = (*config_file_)["probes"];
      if (section.IsDefined()) {
        if (section.IsSequence()) {
          for (const auto &item : section) {
            if (not item.IsScalar()) {
              file_errors_ << "E: Items of 'probes' must be scalar\n";
              file_has_error_ = true;
              continue;
            }
            auto value = item.as<std::string>();
            if (auto probe = parseProbe(value)) {
              config_->probes_.emplace_back(probe.value());
            } else {
              file_errors_ << "E: Bad probe '" << value
                           << "'; Expected: 50ms, 20ms:threaded, etc.\n";
              file_has_error_ = true;
            }
          }
        } else {
          file_errors_ << "E: Section 'probes' defined, but is not sequence\n";
          file_has_error_ = true;
        }
      }
    }

    OUTCOME_TRY(reportFileErrors());

    // Probes from CLI are added to ones from the file
    bool fail = false;
    find_argument<std::vector<std::string>>(
        cli_values_map_, "probe", [&](const std::vector<std::string> &values) {
          for (const auto &value : values) {
            if (auto probe = parseProbe(value)) {
              config_->probes_.emplace_back(probe.value());
            } else {
              std::cerr << "Option --probe has invalid value '" << value
                        << "'\nTry run with option '--help' for more "
                           "information\n";
              fail = true;
            }
          }
        });
    if (fail) {
      return Error::CliArgsParseFailed;
    }

    return outcome::success();
  }

}  // namespace chime::app
