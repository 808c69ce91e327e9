/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "app/access_control.hpp"

#include "storage/predefined_keys.hpp"
#include "storage/spaced_storage.hpp"

namespace appchain::app {
  namespace {
    qtils::ByteVec operatorKey(const Felt &address) {
      return storage::prefixedKey(storage::kOperatorKeyPrefix,
                                  address.bytes());
    }
  }  // namespace

  AccessControl::AccessControl(
      qtils::SharedRef<log::LoggingSystem> logsys,
      qtils::SharedRef<storage::SpacedStorage> storage,
      AccessControlConfig config)
      : logger_{logsys->getLogger("AccessControl", "access")},
        space_{storage->getSpace(storage::Space::Appchain)},
        config_{config} {
    SL_DEBUG(logger_, "Appchain owner is {}", config_.owner);
  }

  outcome::result<void> AccessControl::assertOwner(const Felt &caller) const {
    if (caller != config_.owner) {
      SL_WARN(logger_, "Owner-only call by {}", caller);
      return Error::OWNER_ONLY;
    }
    return outcome::success();
  }

  outcome::result<void> AccessControl::assertOwnerOrOperator(
      const Felt &caller) const {
    if (caller == config_.owner) {
      return outcome::success();
    }
    BOOST_OUTCOME_TRY(auto is_operator, isOperator(caller));
    if (not is_operator) {
      SL_WARN(logger_, "Unauthorized call by {}", caller);
      return Error::UNAUTHORIZED;
    }
    return outcome::success();
  }

  outcome::result<bool> AccessControl::isOperator(const Felt &address) const {
    return space_->contains(operatorKey(address));
  }

  outcome::result<void> AccessControl::registerOperator(const Felt &address) {
    BOOST_OUTCOME_TRY(auto registered, isOperator(address));
    if (registered) {
      return Error::OPERATOR_ALREADY_REGISTERED;
    }
    BOOST_OUTCOME_TRY(space_->put(operatorKey(address), qtils::ByteVec{1}));
    SL_INFO(logger_, "Operator {} registered", address);
    return outcome::success();
  }

  outcome::result<void> AccessControl::unregisterOperator(
      const Felt &address) {
    BOOST_OUTCOME_TRY(auto registered, isOperator(address));
    if (not registered) {
      return Error::OPERATOR_NOT_REGISTERED;
    }
    BOOST_OUTCOME_TRY(space_->remove(operatorKey(address)));
    SL_INFO(logger_, "Operator {} unregistered", address);
    return outcome::success();
  }

}  // namespace appchain::app
