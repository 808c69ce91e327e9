/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "app/appchain_service.hpp"

#include "app/access_control.hpp"
#include "blockchain/message_ledger.hpp"
#include "blockchain/rolling_state.hpp"
#include "storage/spaced_storage.hpp"

namespace appchain::app {

  AppchainService::AppchainService(
      qtils::SharedRef<log::LoggingSystem> logsys,
      qtils::SharedRef<storage::SpacedStorage> storage,
      qtils::SharedRef<AccessControl> access,
      qtils::SharedRef<ProgramConfig> program,
      qtils::SharedRef<blockchain::RollingState> rolling_state,
      qtils::SharedRef<blockchain::MessageLedger> ledger,
      snos::DecodeOptions decode_options)
      : logger_{logsys->getLogger("AppchainService", "application")},
        space_{storage->getSpace(storage::Space::Appchain)},
        access_{std::move(access)},
        program_{std::move(program)},
        rolling_state_{std::move(rolling_state)},
        ledger_{std::move(ledger)},
        decode_options_{decode_options} {}

  outcome::result<void> AppchainService::initialize(
      const Felt &caller, const AppchainState &state) {
    std::lock_guard lock{mutex_};
    BOOST_OUTCOME_TRY(access_->assertOwner(caller));
    return rolling_state_->initialize(state);
  }

  outcome::result<AppchainState> AppchainService::updateState(
      const Felt &caller, std::span<const Felt> stream) {
    std::lock_guard lock{mutex_};
    auto res = [&]() -> outcome::result<AppchainState> {
      BOOST_OUTCOME_TRY(access_->assertOwnerOrOperator(caller));
      return applyUpdate(stream);
    }();
    if (res.has_error()) {
      SL_WARN(logger_,
              "State update by {} rejected: {}",
              caller,
              res.error().message());
      return res.error();
    }
    SL_INFO(logger_,
            "State updated to block {} with root {}",
            res.value().block_number,
            res.value().state_root);
    return res;
  }

  outcome::result<AppchainState> AppchainService::applyUpdate(
      std::span<const Felt> stream) {
    BOOST_OUTCOME_TRY(auto output,
                      snos::decodeProgramOutput(stream, decode_options_));
    SL_DEBUG(logger_,
             "Decoded output: block {} -> {}, {} messages to Starknet, "
             "{} messages to appchain",
             output.prev_block_number,
             output.new_block_number,
             output.messages_to_starknet.size(),
             output.messages_to_appchain.size());

    BOOST_OUTCOME_TRY(program_->checkOutput(output, stream));
    BOOST_OUTCOME_TRY(auto next, rolling_state_->validate(output));

    auto batch = space_->batch();
    BOOST_OUTCOME_TRY(rolling_state_->stage(*batch, next));
    BOOST_OUTCOME_TRY(ledger_->stage(*batch, output));
    BOOST_OUTCOME_TRY(batch->commit());

    rolling_state_->onCommitted(next);
    return next;
  }

  AppchainState AppchainService::getState() const {
    std::lock_guard lock{mutex_};
    return rolling_state_->getState();
  }

  outcome::result<void> AppchainService::registerOperator(
      const Felt &caller, const Felt &address) {
    std::lock_guard lock{mutex_};
    BOOST_OUTCOME_TRY(access_->assertOwner(caller));
    return access_->registerOperator(address);
  }

  outcome::result<void> AppchainService::unregisterOperator(
      const Felt &caller, const Felt &address) {
    std::lock_guard lock{mutex_};
    BOOST_OUTCOME_TRY(access_->assertOwner(caller));
    return access_->unregisterOperator(address);
  }

  outcome::result<bool> AppchainService::isOperator(
      const Felt &address) const {
    std::lock_guard lock{mutex_};
    return access_->isOperator(address);
  }

  outcome::result<void> AppchainService::setProgramInfo(
      const Felt &caller, const ProgramInfo &info) {
    std::lock_guard lock{mutex_};
    BOOST_OUTCOME_TRY(access_->assertOwner(caller));
    return program_->setProgramInfo(info);
  }

  ProgramInfo AppchainService::getProgramInfo() const {
    std::lock_guard lock{mutex_};
    return program_->getProgramInfo();
  }

  outcome::result<uint64_t> AppchainService::messageToStarknetCount(
      const Hash256 &message_hash) const {
    std::lock_guard lock{mutex_};
    return ledger_->messageToStarknetCount(message_hash);
  }

  outcome::result<bool> AppchainService::isMessageToAppchainSealed(
      const Hash256 &message_hash) const {
    std::lock_guard lock{mutex_};
    return ledger_->isMessageToAppchainSealed(message_hash);
  }

}  // namespace appchain::app
