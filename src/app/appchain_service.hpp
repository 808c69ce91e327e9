/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <mutex>
#include <span>

#include <qtils/outcome.hpp>
#include <qtils/shared_ref.hpp>

#include "app/program_config.hpp"
#include "crypto/hash_types.hpp"
#include "log/logger.hpp"
#include "snos/program_output_codec.hpp"
#include "types/appchain_state.hpp"

namespace appchain::storage {
  class SpacedStorage;
}  // namespace appchain::storage

namespace appchain::blockchain {
  class RollingState;
  class MessageLedger;
}  // namespace appchain::blockchain

namespace appchain::app {
  class AccessControl;

  /**
   * Entry points of the appchain core contract.
   *
   * Every state update is checked in full before anything is written; the
   * new state and the message records are then committed by one batch.
   * Mutating calls are serialized.
   */
  class AppchainService {
   public:
    AppchainService(qtils::SharedRef<log::LoggingSystem> logsys,
                    qtils::SharedRef<storage::SpacedStorage> storage,
                    qtils::SharedRef<AccessControl> access,
                    qtils::SharedRef<ProgramConfig> program,
                    qtils::SharedRef<blockchain::RollingState> rolling_state,
                    qtils::SharedRef<blockchain::MessageLedger> ledger,
                    snos::DecodeOptions decode_options);

    /// Overwrite state, owner only
    outcome::result<void> initialize(const Felt &caller,
                                     const AppchainState &state);

    /// Apply raw program output, owner or operator only
    outcome::result<AppchainState> updateState(const Felt &caller,
                                               std::span<const Felt> stream);

    AppchainState getState() const;

    outcome::result<void> registerOperator(const Felt &caller,
                                           const Felt &address);

    outcome::result<void> unregisterOperator(const Felt &caller,
                                             const Felt &address);

    outcome::result<bool> isOperator(const Felt &address) const;

    outcome::result<void> setProgramInfo(const Felt &caller,
                                         const ProgramInfo &info);

    ProgramInfo getProgramInfo() const;

    outcome::result<uint64_t> messageToStarknetCount(
        const Hash256 &message_hash) const;

    outcome::result<bool> isMessageToAppchainSealed(
        const Hash256 &message_hash) const;

   private:
    outcome::result<AppchainState> applyUpdate(std::span<const Felt> stream);

    log::Logger logger_;
    std::shared_ptr<storage::BufferStorage> space_;
    qtils::SharedRef<AccessControl> access_;
    qtils::SharedRef<ProgramConfig> program_;
    qtils::SharedRef<blockchain::RollingState> rolling_state_;
    qtils::SharedRef<blockchain::MessageLedger> ledger_;
    snos::DecodeOptions decode_options_;
    mutable std::mutex mutex_;
  };

}  // namespace appchain::app
