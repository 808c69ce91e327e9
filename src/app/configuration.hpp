/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include "types/felt.hpp"
#include "utils/ctor_limiters.hpp"

namespace appchain::app {

  class Configuration : Singleton<Configuration> {
   public:
    struct DatabaseConfig {
      std::filesystem::path directory = "db";
      size_t cache_size = 512 << 20;  // 512MiB
      /// Keep everything in memory, nothing survives the process
      bool in_memory = false;
    };

    struct AppchainConfig {
      Felt owner;
      /// Used until program info is set explicitly
      Felt program_hash;
      Felt config_hash;
      /// YAML list of verified facts; empty disables fact checking
      std::filesystem::path facts_file;
      bool check_prev_block_hash = false;
      bool strict_message_records = false;
    };

    /// Parameters of the command given on the command line
    struct CommandConfig {
      std::string name;
      std::vector<std::string> args;
      std::optional<Felt> caller;
      std::optional<Felt> state_root;
      /// std::nullopt for "genesis"
      std::optional<Felt> block_number;
      std::optional<Felt> block_hash;
    };

    Configuration();
    virtual ~Configuration() = default;

    [[nodiscard]] virtual const std::string &nodeVersion() const;
    [[nodiscard]] virtual const std::string &nodeName() const;
    [[nodiscard]] virtual const std::filesystem::path &basePath() const;

    [[nodiscard]] virtual const DatabaseConfig &database() const;

    [[nodiscard]] virtual const AppchainConfig &appchain() const;

    [[nodiscard]] virtual const CommandConfig &command() const;

   private:
    friend class Configurator;  // for external configure

    std::string version_;
    std::string name_;
    std::filesystem::path base_path_;

    DatabaseConfig database_;
    AppchainConfig appchain_;
    CommandConfig command_;
  };

}  // namespace appchain::app
