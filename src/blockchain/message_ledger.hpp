/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <qtils/outcome.hpp>
#include <qtils/shared_ref.hpp>

#include "crypto/hash_types.hpp"
#include "log/logger.hpp"
#include "storage/buffer_map_types.hpp"
#include "types/program_output.hpp"

namespace appchain::storage {
  class SpacedStorage;
}  // namespace appchain::storage

namespace appchain::blockchain {

  /**
   * Presence records of messages carried by accepted state updates.
   *
   * A message to Starknet bumps a pending counter under its hash, so
   * identical messages sent several times are counted. A message to the
   * appchain is marked sealed under its hash.
   * Messages are only recorded here, never consumed or executed.
   */
  class MessageLedger {
   public:
    MessageLedger(qtils::SharedRef<log::LoggingSystem> logsys,
                  qtils::SharedRef<storage::SpacedStorage> storage);

    /// SHA-256 of (from, to, payload size, payload...)
    static Hash256 messageHash(const MessageToStarknet &message);

    /// SHA-256 of (from, to, nonce, selector, payload size, payload...)
    static Hash256 messageHash(const MessageToAppchain &message);

    /// Put records of all messages of `output` into `batch`
    outcome::result<void> stage(storage::BufferBatch &batch,
                                const ProgramOutput &output) const;

    /// Number of times the message was sent to Starknet
    outcome::result<uint64_t> messageToStarknetCount(
        const Hash256 &message_hash) const;

    outcome::result<bool> isMessageToAppchainSealed(
        const Hash256 &message_hash) const;

   private:
    log::Logger logger_;
    std::shared_ptr<storage::BufferStorage> space_;
  };

}  // namespace appchain::blockchain
