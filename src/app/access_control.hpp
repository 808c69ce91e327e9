/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <qtils/enum_error_code.hpp>
#include <qtils/outcome.hpp>
#include <qtils/shared_ref.hpp>

#include "log/logger.hpp"
#include "storage/buffer_map_types.hpp"
#include "types/felt.hpp"

namespace appchain::storage {
  class SpacedStorage;
}  // namespace appchain::storage

namespace appchain::app {

  struct AccessControlConfig {
    Felt owner;
  };

  /**
   * Owner fixed at construction and a persistent set of operators.
   * Only the owner manages operators; the owner and operators may
   * submit state updates.
   */
  class AccessControl {
   public:
    enum class Error {
      UNAUTHORIZED = 1,
      OWNER_ONLY,
      OPERATOR_ALREADY_REGISTERED,
      OPERATOR_NOT_REGISTERED,
    };
    Q_ENUM_ERROR_CODE_FRIEND(Error) {
      using E = decltype(e);
      switch (e) {
        case E::UNAUTHORIZED:
          return "Caller is neither owner nor operator";
        case E::OWNER_ONLY:
          return "Caller is not the owner";
        case E::OPERATOR_ALREADY_REGISTERED:
          return "Operator is already registered";
        case E::OPERATOR_NOT_REGISTERED:
          return "Operator is not registered";
      }
      return "Unknown AccessControl error";
    }

    AccessControl(qtils::SharedRef<log::LoggingSystem> logsys,
                  qtils::SharedRef<storage::SpacedStorage> storage,
                  AccessControlConfig config);

    const Felt &owner() const {
      return config_.owner;
    }

    outcome::result<void> assertOwner(const Felt &caller) const;

    outcome::result<void> assertOwnerOrOperator(const Felt &caller) const;

    outcome::result<bool> isOperator(const Felt &address) const;

    outcome::result<void> registerOperator(const Felt &address);

    outcome::result<void> unregisterOperator(const Felt &address);

   private:
    log::Logger logger_;
    std::shared_ptr<storage::BufferStorage> space_;
    AccessControlConfig config_;
  };

}  // namespace appchain::app
