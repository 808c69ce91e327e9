/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <filesystem>
#include <string_view>
#include <unordered_set>

#include <qtils/bytes_std_hash.hpp>
#include <qtils/enum_error_code.hpp>
#include <qtils/shared_ref.hpp>

#include "app/fact_registry.hpp"
#include "log/logger.hpp"

namespace YAML {
  class Node;
}  // namespace YAML

namespace appchain::app {
  class Configuration;
}  // namespace appchain::app

namespace appchain::app {

  /**
   * Facts loaded once from YAML list of 0x-prefixed hashes:
   *
   * ```yaml
   * - 0x5f...01
   * - 0x9a...ee
   * ```
   *
   * No file configured means the registry is disabled.
   */
  class FactRegistryImpl final : public FactRegistry {
   public:
    enum class Error {
      FILE_NOT_LOADED = 1,
      NOT_A_SEQUENCE,
      INVALID_FACT,
    };
    Q_ENUM_ERROR_CODE_FRIEND(Error) {
      using E = decltype(e);
      switch (e) {
        case E::FILE_NOT_LOADED:
          return "Fact registry file can't be loaded";
        case E::NOT_A_SEQUENCE:
          return "Fact registry must be a YAML sequence";
        case E::INVALID_FACT:
          return "Fact must be 0x-prefixed hex of 32 bytes";
      }
      return "Unknown FactRegistryImpl error";
    }

    FactRegistryImpl(qtils::SharedRef<log::LoggingSystem> logsys,
                     qtils::SharedRef<Configuration> config);

    static FactRegistryImpl createForTesting(
        qtils::SharedRef<log::LoggingSystem> logsys, std::string_view yaml);

    bool enabled() const override {
      return enabled_;
    }

    bool isValid(const Hash256 &fact) const override;

    size_t size() const {
      return facts_.size();
    }

   private:
    explicit FactRegistryImpl(qtils::SharedRef<log::LoggingSystem> logsys);

    void load(const YAML::Node &root);

    log::Logger logger_;
    bool enabled_ = false;
    std::unordered_set<Hash256> facts_;
  };

}  // namespace appchain::app
