/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "log/logger.hpp"

OUTCOME_CPP_DEFINE_CATEGORY(appchain::log, Error, e) {
  using E = appchain::log::Error;
  switch (e) {
    case E::WRONG_LEVEL:
      return "Unknown log level";
    case E::WRONG_GROUP:
      return "Unknown log group";
    case E::WRONG_FORMAT:
      return "Log level must be given as <level> or <group>=<level>";
  }
  return "Unknown log::Error";
}

namespace appchain::log {

  outcome::result<Level> str2lvl(std::string_view str) {
    if (str == "trace") {
      return Level::TRACE;
    }
    if (str == "debug") {
      return Level::DEBUG;
    }
    if (str == "verbose") {
      return Level::VERBOSE;
    }
    if (str == "info" or str == "inf") {
      return Level::INFO;
    }
    if (str == "warning" or str == "warn") {
      return Level::WARN;
    }
    if (str == "error" or str == "err") {
      return Level::ERROR;
    }
    if (str == "critical" or str == "crit") {
      return Level::CRITICAL;
    }
    if (str == "off" or str == "no") {
      return Level::OFF;
    }
    return Error::WRONG_LEVEL;
  }

  LoggingSystem::LoggingSystem(
      std::shared_ptr<soralog::LoggingSystem> logging_system)
      : logging_system_(std::move(logging_system)) {}

  outcome::result<void> LoggingSystem::tuneLoggingSystem(
      const std::vector<std::string> &cfg) {
    for (std::string_view chunk : cfg) {
      auto eq = chunk.find('=');
      if (eq == std::string_view::npos) {
        BOOST_OUTCOME_TRY(auto level, str2lvl(chunk));
        logging_system_->setLevelOfGroup(defaultGroupName, level);
        continue;
      }

      std::string group_name{chunk.substr(0, eq)};
      auto level_string = chunk.substr(eq + 1);
      if (group_name.empty() or level_string.empty()) {
        return Error::WRONG_FORMAT;
      }
      if (not logging_system_->getGroup(group_name)) {
        return Error::WRONG_GROUP;
      }
      BOOST_OUTCOME_TRY(auto level, str2lvl(level_string));
      logging_system_->setLevelOfGroup(group_name, level);
    }
    return outcome::success();
  }

}  // namespace appchain::log
