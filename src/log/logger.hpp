/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <memory>
#include <string>
#include <vector>

#include <qtils/enum_error_code.hpp>
#include <qtils/outcome.hpp>
#include <qtils/shared_ref.hpp>
#include <soralog/level.hpp>
#include <soralog/logger.hpp>
#include <soralog/logging_system.hpp>
#include <soralog/macro.hpp>

#include "injector/dont_inject.hpp"
#include "utils/ctor_limiters.hpp"

namespace appchain::log {
  using soralog::Level;

  using Logger = qtils::SharedRef<soralog::Logger>;

  enum class Error : uint8_t { WRONG_LEVEL = 1, WRONG_GROUP, WRONG_FORMAT };

  outcome::result<Level> str2lvl(std::string_view str);

  inline const std::string defaultGroupName{"appchain"};

  /**
   * Process-wide owner of the soralog logging system.
   */
  class LoggingSystem : public Singleton<LoggingSystem> {
   public:
    DONT_INJECT(LoggingSystem);

    explicit LoggingSystem(
        std::shared_ptr<soralog::LoggingSystem> logging_system);

    /**
     * Apply `-l` arguments: either `<level>` for the default group or
     * `<group>=<level>`.
     * Stops on the first malformed chunk.
     */
    outcome::result<void> tuneLoggingSystem(
        const std::vector<std::string> &cfg);

    [[nodiscard]] Logger getLogger(const std::string &logger_name,
                                   const std::string &group_name) const {
      return logging_system_->getLogger(logger_name, group_name);
    }

    [[nodiscard]] bool setLevelOfGroup(const std::string &group_name,
                                       Level level) const {
      return logging_system_->setLevelOfGroup(group_name, level);
    }

    auto &getSoralog() const {
      return logging_system_;
    }

   private:
    std::shared_ptr<soralog::LoggingSystem> logging_system_;
  };

}  // namespace appchain::log

OUTCOME_HPP_DECLARE_ERROR(appchain::log, Error);
