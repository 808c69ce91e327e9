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
#include "types/appchain_state.hpp"
#include "types/program_output.hpp"

namespace appchain::storage {
  class SpacedStorage;
}  // namespace appchain::storage

namespace appchain::blockchain {

  /// Whether `prev_block_hash` of an output must match the current hash
  enum class PrevBlockHashPolicy : uint8_t {
    Ignore,
    Enforce,
  };

  struct RollingStateConfig {
    PrevBlockHashPolicy prev_block_hash = PrevBlockHashPolicy::Ignore;
  };

  /**
   * Last accepted appchain state and the rules for moving it forward.
   *
   * Block numbers are compared after widening to 256 bits, never as raw
   * field elements. `maxFelt()` as block number means nothing was accepted
   * yet; in that state any new block number is acceptable.
   */
  class RollingState {
   public:
    enum class Error {
      INVALID_PREVIOUS_BLOCK_NUMBER = 1,
      INVALID_BLOCK_NUMBER,
      INVALID_PREVIOUS_ROOT,
      INVALID_PREVIOUS_BLOCK_HASH,
      STATE_NOT_INITIALIZED,
      CORRUPTED_STATE,
    };
    Q_ENUM_ERROR_CODE_FRIEND(Error) {
      using E = decltype(e);
      switch (e) {
        case E::INVALID_PREVIOUS_BLOCK_NUMBER:
          return "Previous block number doesn't match current state";
        case E::INVALID_BLOCK_NUMBER:
          return "New block number is not greater than current one";
        case E::INVALID_PREVIOUS_ROOT:
          return "Initial state root doesn't match current state";
        case E::INVALID_PREVIOUS_BLOCK_HASH:
          return "Previous block hash doesn't match current state";
        case E::STATE_NOT_INITIALIZED:
          return "Appchain state is not initialized";
        case E::CORRUPTED_STATE:
          return "Persisted appchain state is corrupted";
      }
      return "Unknown RollingState error";
    }

    /// Loads persisted state, raises CORRUPTED_STATE if it can't be decoded
    RollingState(qtils::SharedRef<log::LoggingSystem> logsys,
                 qtils::SharedRef<storage::SpacedStorage> storage,
                 RollingStateConfig config);

    /// Overwrite the state without any checks
    outcome::result<void> initialize(const AppchainState &state);

    [[nodiscard]] bool isInitialized() const {
      return initialized_;
    }

    /// Genesis state with zero root and hash until initialized
    [[nodiscard]] const AppchainState &getState() const {
      return state_;
    }

    /**
     * Check that `output` continues the current state.
     * @return state after applying `output`, nothing is changed
     */
    [[nodiscard]] outcome::result<AppchainState> validate(
        const ProgramOutput &output) const;

    /// Put `state` into `batch`, the cache is untouched
    outcome::result<void> stage(storage::BufferBatch &batch,
                                const AppchainState &state) const;

    /// Refresh the cache after the batch written by `stage` was committed
    void onCommitted(const AppchainState &state);

    /// validate, stage into own batch, commit, refresh
    outcome::result<AppchainState> update(const ProgramOutput &output);

    static qtils::ByteVec encode(const AppchainState &state);

    static outcome::result<AppchainState> decode(qtils::BytesIn bytes);

   private:
    outcome::result<void> commit(const AppchainState &state);

    log::Logger logger_;
    std::shared_ptr<storage::BufferStorage> space_;
    RollingStateConfig config_;
    bool initialized_ = false;
    AppchainState state_;
  };

}  // namespace appchain::blockchain
