/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "app/configuration.hpp"

namespace appchain::app {

  Configuration::Configuration()
      : version_("undefined"),
        name_("unnamed"),
        base_path_(std::filesystem::current_path()),
        database_{
            .directory = "db",
            .cache_size = 512 << 20,
            .in_memory = false,
        } {}

  const std::string &Configuration::nodeVersion() const {
    return version_;
  }

  const std::string &Configuration::nodeName() const {
    return name_;
  }

  const std::filesystem::path &Configuration::basePath() const {
    return base_path_;
  }

  const Configuration::DatabaseConfig &Configuration::database() const {
    return database_;
  }

  const Configuration::AppchainConfig &Configuration::appchain() const {
    return appchain_;
  }

  const Configuration::CommandConfig &Configuration::command() const {
    return command_;
  }

}  // namespace appchain::app
