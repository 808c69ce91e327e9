/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <sstream>

#include <boost/program_options.hpp>
#include <qtils/enum_error_code.hpp>
#include <qtils/outcome.hpp>
#include <qtils/shared_ref.hpp>
#include <yaml-cpp/yaml.h>

#include "injector/dont_inject.hpp"
#include "log/logger.hpp"

namespace appchain::app {
  class Configuration;
}  // namespace appchain::app

namespace appchain::app {

  /**
   * Builds Configuration from defaults, YAML config file and CLI arguments,
   * CLI having the last word.
   */
  class Configurator final {
   public:
    enum class Error : uint8_t {
      CliArgsParseFailed = 1,
      ConfigFileParseFailed,
      InvalidValue,
    };

    DONT_INJECT(Configurator);

    Configurator() = delete;
    Configurator(Configurator &&) noexcept = delete;
    Configurator(const Configurator &) = delete;
    ~Configurator() = default;
    Configurator &operator=(Configurator &&) noexcept = delete;
    Configurator &operator=(const Configurator &) = delete;

    Configurator(int argc, const char **argv);

    // Parse CLI args for help, version and config
    outcome::result<bool> step1();

    // Parse remaining CLI args
    outcome::result<bool> step2();

    outcome::result<YAML::Node> getLoggingConfig();

    std::vector<std::string> getLoggingCliArgs();

    outcome::result<std::shared_ptr<Configuration>> calculateConfig(
        qtils::SharedRef<soralog::Logger> logger);

   private:
    outcome::result<void> initGeneralConfig();
    outcome::result<void> initDatabaseConfig();
    outcome::result<void> initAppchainConfig();
    outcome::result<void> initCommandConfig();

    /// Log collected config file problems, if any
    outcome::result<void> checkFileErrors();

    void printHelp() const;

    int argc_;
    const char **argv_;

    std::shared_ptr<Configuration> config_;
    std::shared_ptr<soralog::Logger> logger_;

    std::optional<YAML::Node> config_file_;
    bool file_has_error_ = false;
    std::ostringstream file_errors_;

    boost::program_options::options_description cli_options_;
    boost::program_options::positional_options_description cli_positional_;
    boost::program_options::variables_map cli_values_map_;
  };

}  // namespace appchain::app

OUTCOME_HPP_DECLARE_ERROR(appchain::app, Configurator::Error);
