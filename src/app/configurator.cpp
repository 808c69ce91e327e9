/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "app/configurator.hpp"

#include <filesystem>
#include <iostream>
#include <optional>
#include <string>
#include <string_view>

#include <boost/algorithm/string/trim.hpp>
#include <boost/program_options.hpp>

#include "app/build_version.hpp"
#include "app/configuration.hpp"
#include "utils/parsers.hpp"

OUTCOME_CPP_DEFINE_CATEGORY(appchain::app, Configurator::Error, e) {
  using E = appchain::app::Configurator::Error;
  switch (e) {
    case E::CliArgsParseFailed:
      return "CLI Arguments parse failed";
    case E::ConfigFileParseFailed:
      return "Config file parse failed";
    case E::InvalidValue:
      return "Result config has invalid values";
  }
  return "Unknown Configurator::Error";
}

namespace {
  template <typename T, typename Func>
  void find_argument(boost::program_options::variables_map &vm,
                     const char *name,
                     Func &&f) {
    if (auto it = vm.find(name); it != vm.end()) {
      if (it->second.defaulted()) {
        return;
      }
      std::forward<Func>(f)(it->second.as<T>());
    }
  }

  /// Scalar of YAML `section`, reporting wrong node kind into `errors`
  std::optional<std::string> scalar(const YAML::Node &section,
                                    const std::string &section_name,
                                    const std::string &key,
                                    std::ostream &errors,
                                    bool &has_error) {
    auto node = section[key];
    if (not node.IsDefined()) {
      return std::nullopt;
    }
    if (not node.IsScalar()) {
      errors << "E: Value '" << section_name << "." << key
             << "' must be scalar\n";
      has_error = true;
      return std::nullopt;
    }
    auto value = node.as<std::string>();
    boost::trim(value);
    return value;
  }

  std::optional<bool> parseBool(std::string_view value) {
    if (value == "true" or value == "yes" or value == "on") {
      return true;
    }
    if (value == "false" or value == "no" or value == "off") {
      return false;
    }
    return std::nullopt;
  }

  constexpr std::string_view kCommandsHelp = R"(Commands:
  init --state-root R --block-number N|genesis --block-hash H
                                  Overwrite appchain state (owner only)
  update <file> [--caller A]      Apply program output read from file
                                  (whitespace separated felts)
  state                           Print current appchain state
  register-operator <address>     Allow address to submit updates
  unregister-operator <address>   Revoke operator
  set-program-info                Persist configured program and config
                                  hashes
)";
}  // namespace

namespace appchain::app {

  Configurator::Configurator(int argc, const char **argv)
      : argc_(argc), argv_(argv) {
    config_ = std::make_shared<Configuration>();

    config_->version_ = buildVersion();
    config_->name_ = "appchain";

    namespace po = boost::program_options;

    // clang-format off

    po::options_description general_options("General options", 120, 100);
    general_options.add_options()
        ("help,h", "Show this help message.")
        ("version,v", "Show version information.")
        ("base-path", po::value<std::string>(), "Set base path. All relative paths will be resolved based on this path.")
        ("config,c", po::value<std::string>(),  "Optional. Filepath to load configuration from. Overrides default configuration values.")
        ("name,n", po::value<std::string>(), "Set name of node.")
        ("log,l", po::value<std::vector<std::string>>(),
          "Sets a custom logging filter.\n"
          "Syntax: <target>=<level>, e.g., -lstorage=debug.\n"
          "Log levels: trace, debug, verbose, info, warn, error, critical, off.\n"
          "Default: all targets log at `info`.\n"
          "Global log level can be set with: -l<level>.")
        ;

    po::options_description storage_options("Storage options");
    storage_options.add_options()
        ("db-path", po::value<std::string>(), "Path to DB directory. Can be relative on base path.")
        ("db-cache-size", po::value<std::string>(), "Limit the memory the database cache can use, e.g. 4096, 512Mb, 1G.")
        ("db-in-memory", po::bool_switch(), "Keep state in memory only.")
        ;

    po::options_description appchain_options("Appchain options");
    appchain_options.add_options()
        ("owner", po::value<std::string>(), "Owner address (felt), required.")
        ("program-hash", po::value<std::string>(), "Expected program hash (felt).")
        ("config-hash", po::value<std::string>(), "Expected config hash (felt).")
        ("facts", po::value<std::string>(), "Path to YAML list of verified facts.")
        ("check-prev-block-hash", po::bool_switch(), "Reject outputs whose previous block hash differs from the current one.")
        ("strict-message-records", po::bool_switch(), "Reject outputs with incomplete message records.")
        ;

    po::options_description command_options("Command options");
    command_options.add_options()
        ("caller", po::value<std::string>(), "Caller address (felt). Default: owner.")
        ("state-root", po::value<std::string>(), "State root (felt).")
        ("block-number", po::value<std::string>(), "Block number (felt) or `genesis`.")
        ("block-hash", po::value<std::string>(), "Block hash (felt).")
        ;

    po::options_description hidden_options;
    hidden_options.add_options()
        ("command", po::value<std::string>(), "Command to run.")
        ("args", po::value<std::vector<std::string>>(), "Command arguments.")
        ;

    // clang-format on

    cli_options_
        .add(general_options)  //
        .add(storage_options)
        .add(appchain_options)
        .add(command_options)
        .add(hidden_options);

    cli_positional_.add("command", 1).add("args", -1);
  }

  void Configurator::printHelp() const {
    std::cout << "Appchain node version " << buildVersion() << '\n';
    std::cout << "Usage: appchain_node <command> [args] [options]\n\n";
    std::cout << kCommandsHelp << '\n';
    // hidden options are the last group
    for (auto &group : cli_options_.groups()) {
      if (group->caption().empty()) {
        continue;
      }
      std::cout << *group << '\n';
    }
  }

  outcome::result<bool> Configurator::step1() {  // read min cli-args and config
    namespace po = boost::program_options;

    po::options_description options;
    options.add_options()("help,h", "show help")("version,v", "show version")(
        "config,c", po::value<std::string>(), "config-file path")(
        "command", po::value<std::string>(), "command")(
        "args", po::value<std::vector<std::string>>(), "command arguments");

    po::variables_map vm;

    // first-run parse to read-only general options and to lookup for "help",
    // "config" and "version". all the rest options are ignored
    try {
      po::parsed_options parsed = po::command_line_parser(argc_, argv_)
                                      .options(options)
                                      .positional(cli_positional_)
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
      printHelp();
      return true;
    }

    if (vm.contains("version")) {
      std::cout << "Appchain node version " << buildVersion() << '\n';
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
      po::parsed_options parsed = po::command_line_parser(argc_, argv_)
                                      .options(cli_options_)
                                      .positional(cli_positional_)
                                      .run();
      po::store(parsed, cli_values_map_);
      po::notify(cli_values_map_);
    } catch (const std::exception &e) {
      std::cerr << "Error: " << e.what() << '\n'
                << "Try run with option '--help' for more information\n";
      return Error::CliArgsParseFailed;
    }

    if (not cli_values_map_.contains("command")) {
      std::cerr << "Error: No command given\n"
                << "Try run with option '--help' for more information\n";
      return Error::CliArgsParseFailed;
    }

    return false;
  }

  static constexpr std::string_view default_logging_yaml = R"yaml(
sinks:
  - name: console
    type: console
    stream: stderr
    thread: none
    color: false
    latency: 0
groups:
  - name: main
    sink: console
    level: info
    is_fallback: true
    children:
      - name: appchain
        children:
          - name: application
          - name: snos
          - name: blockchain
          - name: access
          - name: storage
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

  std::vector<std::string> Configurator::getLoggingCliArgs() {
    std::vector<std::string> args;
    find_argument<std::vector<std::string>>(
        cli_values_map_, "log", [&](const std::vector<std::string> &value) {
          args = value;
        });
    return args;
  }

  outcome::result<std::shared_ptr<Configuration>> Configurator::calculateConfig(
      qtils::SharedRef<soralog::Logger> logger) {
    logger_ = std::move(logger);
    BOOST_OUTCOME_TRY(initGeneralConfig());
    BOOST_OUTCOME_TRY(initDatabaseConfig());
    BOOST_OUTCOME_TRY(initAppchainConfig());
    BOOST_OUTCOME_TRY(initCommandConfig());

    return config_;
  }

  outcome::result<void> Configurator::checkFileErrors() {
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
          if (auto value = scalar(
                  section, "general", "name", file_errors_, file_has_error_)) {
            config_->name_ = *value;
          }
          if (auto value = scalar(section,
                                  "general",
                                  "base-path",
                                  file_errors_,
                                  file_has_error_)) {
            config_->base_path_ = *value;
          }
        } else {
          file_errors_ << "E: Section 'general' defined, but is not map\n";
          file_has_error_ = true;
        }
      }
    }

    BOOST_OUTCOME_TRY(checkFileErrors());

    // Adjust by CLI arguments
    find_argument<std::string>(
        cli_values_map_, "name", [&](const std::string &value) {
          config_->name_ = value;
        });
    find_argument<std::string>(
        cli_values_map_, "base-path", [&](const std::string &value) {
          config_->base_path_ = value;
        });

    // Check values
    config_->base_path_ = std::filesystem::absolute(config_->base_path_);
    if (not is_directory(config_->base_path_)) {
      SL_ERROR(logger_,
               "The 'base_path' does not exist or is not a directory: {}",
               config_->base_path_.c_str());
      return Error::InvalidValue;
    }

    return outcome::success();
  }

  outcome::result<void> Configurator::initDatabaseConfig() {
    auto parse_cache_size = [&](std::string_view value) -> bool {
      auto size = util::parseByteQuantity(value);
      if (not size.has_value()) {
        return false;
      }
      config_->database_.cache_size = size.value();
      return true;
    };

    // Init by config-file
    if (config_file_.has_value()) {
      auto section = (*config_file_)["database"];
      if (section.IsDefined()) {
        if (section.IsMap()) {
          if (auto value = scalar(
                  section, "database", "path", file_errors_, file_has_error_)) {
            config_->database_.directory = *value;
          }
          if (auto value = scalar(section,
                                  "database",
                                  "cache_size",
                                  file_errors_,
                                  file_has_error_)) {
            if (not parse_cache_size(*value)) {
              file_errors_ << "E: Bad 'database.cache_size' value; "
                              "Expected: 4096, 512Mb, 1G, etc.\n";
              file_has_error_ = true;
            }
          }
          if (auto value = scalar(section,
                                  "database",
                                  "in-memory",
                                  file_errors_,
                                  file_has_error_)) {
            if (auto flag = parseBool(*value)) {
              config_->database_.in_memory = *flag;
            } else {
              file_errors_ << "E: Value 'database.in-memory' must be boolean\n";
              file_has_error_ = true;
            }
          }
        } else {
          file_errors_ << "E: Section 'database' defined, but is not map\n";
          file_has_error_ = true;
        }
      }
    }

    BOOST_OUTCOME_TRY(checkFileErrors());

    // Adjust by CLI arguments
    bool fail = false;
    find_argument<std::string>(
        cli_values_map_, "db-path", [&](const std::string &value) {
          config_->database_.directory = value;
        });
    find_argument<std::string>(
        cli_values_map_, "db-cache-size", [&](const std::string &value) {
          if (not parse_cache_size(value)) {
            std::cerr << "Option --db-cache-size has invalid value\n"
                      << "Try run with option '--help' for more information\n";
            fail = true;
          }
        });
    find_argument<bool>(cli_values_map_, "db-in-memory", [&](bool value) {
      config_->database_.in_memory = value;
    });
    if (fail) {
      return Error::CliArgsParseFailed;
    }

    // Check values
    if (config_->database_.directory.is_relative()) {
      config_->database_.directory =
          config_->base_path_ / config_->database_.directory;
    }
    config_->database_.directory =
        std::filesystem::weakly_canonical(config_->database_.directory);

    return outcome::success();
  }

  outcome::result<void> Configurator::initAppchainConfig() {
    auto &appchain = config_->appchain_;

    auto felt_from_file = [&](const YAML::Node &section,
                              const std::string &key,
                              Felt &out) {
      auto value =
          scalar(section, "appchain", key, file_errors_, file_has_error_);
      if (not value.has_value()) {
        return;
      }
      auto felt = Felt::fromString(*value);
      if (felt.has_error()) {
        file_errors_ << "E: Value 'appchain." << key
                     << "' is not a field element: " << felt.error().message()
                     << "\n";
        file_has_error_ = true;
        return;
      }
      out = felt.value();
    };

    auto bool_from_file = [&](const YAML::Node &section,
                              const std::string &key,
                              bool &out) {
      auto value =
          scalar(section, "appchain", key, file_errors_, file_has_error_);
      if (not value.has_value()) {
        return;
      }
      if (auto flag = parseBool(*value)) {
        out = *flag;
      } else {
        file_errors_ << "E: Value 'appchain." << key << "' must be boolean\n";
        file_has_error_ = true;
      }
    };

    bool owner_set = false;

    // Init by config-file
    if (config_file_.has_value()) {
      auto section = (*config_file_)["appchain"];
      if (section.IsDefined()) {
        if (section.IsMap()) {
          owner_set = section["owner"].IsDefined();
          felt_from_file(section, "owner", appchain.owner);
          felt_from_file(section, "program-hash", appchain.program_hash);
          felt_from_file(section, "config-hash", appchain.config_hash);
          if (auto value = scalar(
                  section, "appchain", "facts", file_errors_, file_has_error_)) {
            appchain.facts_file = *value;
          }
          bool_from_file(
              section, "check-prev-block-hash", appchain.check_prev_block_hash);
          bool_from_file(section,
                         "strict-message-records",
                         appchain.strict_message_records);
        } else {
          file_errors_ << "E: Section 'appchain' defined, but is not map\n";
          file_has_error_ = true;
        }
      }
    }

    BOOST_OUTCOME_TRY(checkFileErrors());

    // Adjust by CLI arguments
    bool fail = false;
    auto felt_from_cli = [&](const char *name, Felt &out) {
      find_argument<std::string>(
          cli_values_map_, name, [&](const std::string &value) {
            auto felt = Felt::fromString(value);
            if (felt.has_error()) {
              std::cerr << "Option --" << name
                        << " has invalid value: " << felt.error().message()
                        << "\nTry run with option '--help' for more "
                           "information\n";
              fail = true;
              return;
            }
            out = felt.value();
          });
    };
    felt_from_cli("owner", appchain.owner);
    owner_set = owner_set or cli_values_map_.contains("owner");
    felt_from_cli("program-hash", appchain.program_hash);
    felt_from_cli("config-hash", appchain.config_hash);
    find_argument<std::string>(
        cli_values_map_, "facts", [&](const std::string &value) {
          appchain.facts_file = value;
        });
    find_argument<bool>(
        cli_values_map_, "check-prev-block-hash", [&](bool value) {
          appchain.check_prev_block_hash = value;
        });
    find_argument<bool>(
        cli_values_map_, "strict-message-records", [&](bool value) {
          appchain.strict_message_records = value;
        });
    if (fail) {
      return Error::CliArgsParseFailed;
    }

    // Check values
    if (not appchain.facts_file.empty()) {
      if (appchain.facts_file.is_relative()) {
        appchain.facts_file = config_->base_path_ / appchain.facts_file;
      }
      if (not is_regular_file(appchain.facts_file)) {
        SL_ERROR(logger_,
                 "The 'facts' file does not exist or is not a file: {}",
                 appchain.facts_file.c_str());
        return Error::InvalidValue;
      }
    }
    if (not owner_set) {
      SL_ERROR(logger_,
               "Appchain owner is not set; use --owner or 'appchain.owner'");
      return Error::InvalidValue;
    }

    return outcome::success();
  }

  outcome::result<void> Configurator::initCommandConfig() {
    auto &command = config_->command_;

    find_argument<std::string>(
        cli_values_map_, "command", [&](const std::string &value) {
          command.name = value;
        });
    find_argument<std::vector<std::string>>(
        cli_values_map_, "args", [&](const std::vector<std::string> &value) {
          command.args = value;
        });

    bool fail = false;
    auto felt_from_cli = [&](const char *name, std::optional<Felt> &out) {
      find_argument<std::string>(
          cli_values_map_, name, [&](const std::string &value) {
            auto felt = Felt::fromString(value);
            if (felt.has_error()) {
              SL_ERROR(logger_,
                       "Option --{} has invalid value '{}': {}",
                       name,
                       value,
                       felt.error().message());
              fail = true;
              return;
            }
            out = felt.value();
          });
    };
    felt_from_cli("caller", command.caller);
    felt_from_cli("state-root", command.state_root);
    felt_from_cli("block-hash", command.block_hash);
    find_argument<std::string>(
        cli_values_map_, "block-number", [&](const std::string &value) {
          if (value == "genesis") {
            command.block_number.reset();
            return;
          }
          auto felt = Felt::fromString(value);
          if (felt.has_error()) {
            SL_ERROR(logger_,
                     "Option --block-number has invalid value '{}': {}",
                     value,
                     felt.error().message());
            fail = true;
            return;
          }
          command.block_number = felt.value();
        });
    if (fail) {
      return Error::InvalidValue;
    }

    return outcome::success();
  }

}  // namespace appchain::app
