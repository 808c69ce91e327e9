/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include <iostream>
#include <memory>
#include <sstream>
#include <system_error>

#include <fmt/format.h>
#include <fmt/ostream.h>
#include <qtils/enum_error_code.hpp>
#include <qtils/final_action.hpp>
#include <qtils/read_file.hpp>
#include <soralog/impl/configurator_from_yaml.hpp>
#include <soralog/logging_system.hpp>

#include "app/appchain_service.hpp"
#include "app/configuration.hpp"
#include "app/configurator.hpp"
#include "injector/node_injector.hpp"
#include "log/logger.hpp"

// NOLINTBEGIN(cppcoreguidelines-pro-bounds-pointer-arithmetic)

namespace appchain::cli {
  enum class CommandError : uint8_t {
    UNKNOWN_COMMAND = 1,
    WRONG_ARGUMENTS,
  };
  Q_ENUM_ERROR_CODE(CommandError) {
    using E = decltype(e);
    switch (e) {
      case E::UNKNOWN_COMMAND:
        return "Unknown command";
      case E::WRONG_ARGUMENTS:
        return "Wrong command arguments";
    }
    return "Unknown CommandError";
  }
}  // namespace appchain::cli

namespace {
  void wrong_usage() {
    std::cerr << "Wrong usage.\n"
                 "Run with `--help' argument to print usage\n";
  }

  using appchain::Felt;
  using appchain::app::AppchainService;
  using appchain::app::Configuration;
  using appchain::injector::NodeInjector;
  using appchain::log::LoggingSystem;

  using appchain::cli::CommandError;

  /// Felts separated by whitespace
  outcome::result<std::vector<Felt>> parseStream(const std::string &text) {
    std::vector<Felt> stream;
    std::istringstream iss(text);
    std::string token;
    while (iss >> token) {
      BOOST_OUTCOME_TRY(auto felt, Felt::fromString(token));
      stream.emplace_back(felt);
    }
    return stream;
  }

  outcome::result<Felt> singleAddress(const Configuration::CommandConfig &cmd) {
    if (cmd.args.size() != 1) {
      return CommandError::WRONG_ARGUMENTS;
    }
    return Felt::fromString(cmd.args.front());
  }

  outcome::result<void> execute(AppchainService &service,
                                const Configuration &config,
                                const appchain::log::Logger &logger) {
    const auto &cmd = config.command();
    auto caller = cmd.caller.value_or(config.appchain().owner);

    if (cmd.name == "init") {
      if (not cmd.args.empty() or not cmd.state_root or not cmd.block_hash) {
        return CommandError::WRONG_ARGUMENTS;
      }
      return service.initialize(
          caller,
          {
              .state_root = *cmd.state_root,
              .block_number = cmd.block_number.value_or(appchain::maxFelt()),
              .block_hash = *cmd.block_hash,
          });
    }

    if (cmd.name == "update") {
      if (cmd.args.size() != 1) {
        return CommandError::WRONG_ARGUMENTS;
      }
      BOOST_OUTCOME_TRY(auto text, qtils::readText(cmd.args.front()));
      BOOST_OUTCOME_TRY(auto stream, parseStream(text));
      SL_DEBUG(logger, "Read {} felts from {}", stream.size(), cmd.args[0]);
      BOOST_OUTCOME_TRY(auto state, service.updateState(caller, stream));
      fmt::println("{}", state);
      return outcome::success();
    }

    if (cmd.name == "state") {
      if (not cmd.args.empty()) {
        return CommandError::WRONG_ARGUMENTS;
      }
      fmt::println("{}", service.getState());
      return outcome::success();
    }

    if (cmd.name == "register-operator") {
      BOOST_OUTCOME_TRY(auto address, singleAddress(cmd));
      return service.registerOperator(caller, address);
    }

    if (cmd.name == "unregister-operator") {
      BOOST_OUTCOME_TRY(auto address, singleAddress(cmd));
      return service.unregisterOperator(caller, address);
    }

    if (cmd.name == "set-program-info") {
      if (not cmd.args.empty()) {
        return CommandError::WRONG_ARGUMENTS;
      }
      return service.setProgramInfo(
          caller,
          {
              .program_hash = config.appchain().program_hash,
              .config_hash = config.appchain().config_hash,
          });
    }

    return CommandError::UNKNOWN_COMMAND;
  }

  int run_command(std::shared_ptr<LoggingSystem> logsys,
                  std::shared_ptr<Configuration> appcfg) {
    auto logger = logsys->getLogger("Main", appchain::log::defaultGroupName);
    SL_DEBUG(logger,
             "Node '{}' version {}, command '{}'",
             appcfg->nodeName(),
             appcfg->nodeVersion(),
             appcfg->command().name);

    try {
      auto injector = std::make_unique<NodeInjector>(logsys, appcfg);
      auto service = injector->injectAppchainService();

      auto res = execute(*service, *appcfg, logger);
      if (res.has_error()) {
        SL_ERROR(logger,
                 "Command '{}' failed: {}",
                 appcfg->command().name,
                 res.error());
        fmt::println(std::cerr, "Error: {}", res.error().message());
        return EXIT_FAILURE;
      }
    } catch (const std::system_error &e) {
      SL_CRITICAL(logger, "Can't start: {}", e.what());
      fmt::println(std::cerr, "Error: {}", e.what());
      return EXIT_FAILURE;
    }

    logger->flush();
    return EXIT_SUCCESS;
  }

}  // namespace

int main(int argc, const char **argv) {
  setlinebuf(stdout);
  setlinebuf(stderr);

  soralog::util::setThreadName("appchain-node");

  qtils::FinalAction flush_std_streams_at_exit([] {
    std::cout.flush();
    std::cerr.flush();
  });

  if (argc <= 1) {
    // Run without arguments
    wrong_usage();
    return EXIT_FAILURE;
  }

  auto app_configurator =
      std::make_unique<appchain::app::Configurator>(argc, argv);

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

    std::make_shared<LoggingSystem>(std::move(logging_system));
  });

  if (auto res = logging_system->tuneLoggingSystem(
          app_configurator->getLoggingCliArgs());
      res.has_error()) {
    fmt::println(std::cerr, "Wrong --log option: {}", res.error().message());
    return EXIT_FAILURE;
  }

  // Setup config
  auto app_configuration = ({
    auto logger = logging_system->getLogger("Configurator", "appchain");

    auto config_res = app_configurator->calculateConfig(logger);
    if (config_res.has_error()) {
      auto error = config_res.error();
      SL_CRITICAL(logger, "Failed to calculate config: {}", error);
      fmt::println(std::cerr, "Failed to calculate config: {}", error.message());
      fmt::println(std::cerr, "See more details in the log");
      return EXIT_FAILURE;
    }

    config_res.value();
  });

  return run_command(logging_system, app_configuration);
}

// NOLINTEND(cppcoreguidelines-pro-bounds-pointer-arithmetic)
