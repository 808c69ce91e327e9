/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "blockchain/rolling_state.hpp"

#include <qtils/error_throw.hpp>

#include "storage/predefined_keys.hpp"
#include "storage/spaced_storage.hpp"

namespace appchain::blockchain {

  RollingState::RollingState(qtils::SharedRef<log::LoggingSystem> logsys,
                             qtils::SharedRef<storage::SpacedStorage> storage,
                             RollingStateConfig config)
      : logger_{logsys->getLogger("RollingState", "blockchain")},
        space_{storage->getSpace(storage::Space::Appchain)},
        config_{config},
        state_{
            .state_root = kZeroFelt,
            .block_number = maxFelt(),
            .block_hash = kZeroFelt,
        } {
    auto raw_res = space_->tryGet(storage::kRollingStateLookupKey);
    if (raw_res.has_error()) {
      SL_CRITICAL(
          logger_, "Can't read persisted appchain state: {}", raw_res.error());
      qtils::raise(raw_res.error());
    }
    auto &raw = raw_res.value();
    if (not raw.has_value()) {
      SL_INFO(logger_, "No appchain state persisted yet");
      return;
    }
    auto state_res = decode(raw.value());
    if (state_res.has_error()) {
      SL_CRITICAL(logger_,
                  "Can't decode persisted appchain state: {}",
                  state_res.error());
      qtils::raise(state_res.error());
    }
    state_ = state_res.value();
    initialized_ = true;
    SL_INFO(logger_, "Appchain state loaded: {}", state_);
  }

  outcome::result<void> RollingState::initialize(const AppchainState &state) {
    BOOST_OUTCOME_TRY(commit(state));
    SL_INFO(logger_, "Appchain state initialized: {}", state);
    return outcome::success();
  }

  outcome::result<AppchainState> RollingState::validate(
      const ProgramOutput &output) const {
    if (not initialized_) {
      return Error::STATE_NOT_INITIALIZED;
    }

    if (output.prev_block_number != state_.block_number) {
      return Error::INVALID_PREVIOUS_BLOCK_NUMBER;
    }

    // any number is a valid first block, including zero; once tracking, the
    // sentinel would reopen the genesis regime
    if (not state_.isGenesis()
        and (output.new_block_number == maxFelt()
             or output.new_block_number.toU256()
                    <= state_.block_number.toU256())) {
      return Error::INVALID_BLOCK_NUMBER;
    }

    if (output.initial_root != state_.state_root) {
      return Error::INVALID_PREVIOUS_ROOT;
    }

    if (config_.prev_block_hash == PrevBlockHashPolicy::Enforce
        and output.prev_block_hash != state_.block_hash) {
      return Error::INVALID_PREVIOUS_BLOCK_HASH;
    }

    return AppchainState{
        .state_root = output.final_root,
        .block_number = output.new_block_number,
        .block_hash = output.new_block_hash,
    };
  }

  outcome::result<void> RollingState::stage(storage::BufferBatch &batch,
                                            const AppchainState &state) const {
    return batch.put(storage::kRollingStateLookupKey, encode(state));
  }

  void RollingState::onCommitted(const AppchainState &state) {
    state_ = state;
    initialized_ = true;
  }

  outcome::result<AppchainState> RollingState::update(
      const ProgramOutput &output) {
    BOOST_OUTCOME_TRY(auto next, validate(output));
    BOOST_OUTCOME_TRY(commit(next));
    return next;
  }

  outcome::result<void> RollingState::commit(const AppchainState &state) {
    auto batch = space_->batch();
    BOOST_OUTCOME_TRY(stage(*batch, state));
    BOOST_OUTCOME_TRY(batch->commit());
    onCommitted(state);
    return outcome::success();
  }

  qtils::ByteVec RollingState::encode(const AppchainState &state) {
    qtils::ByteVec out;
    out.reserve(3 * Felt::kSize);
    for (const auto &felt :
         {state.state_root, state.block_number, state.block_hash}) {
      out.insert(out.end(), felt.bytes().begin(), felt.bytes().end());
    }
    return out;
  }

  outcome::result<AppchainState> RollingState::decode(qtils::BytesIn bytes) {
    if (bytes.size() != 3 * Felt::kSize) {
      return Error::CORRUPTED_STATE;
    }
    auto felt = [&](size_t i) -> outcome::result<Felt> {
      auto res = Felt::fromBytes(bytes.subspan(i * Felt::kSize, Felt::kSize));
      if (res.has_error()) {
        return Error::CORRUPTED_STATE;
      }
      return res.value();
    };
    BOOST_OUTCOME_TRY(auto state_root, felt(0));
    BOOST_OUTCOME_TRY(auto block_number, felt(1));
    BOOST_OUTCOME_TRY(auto block_hash, felt(2));
    return AppchainState{
        .state_root = state_root,
        .block_number = block_number,
        .block_hash = block_hash,
    };
  }

}  // namespace appchain::blockchain
