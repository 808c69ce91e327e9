/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "blockchain/message_ledger.hpp"

#include <algorithm>
#include <array>

#include "crypto/sha/sha256.hpp"
#include "storage/predefined_keys.hpp"
#include "storage/spaced_storage.hpp"
#include "storage/storage_error.hpp"

namespace appchain::blockchain {
  namespace {
    const qtils::ByteVec kSealed{1};

    qtils::ByteVec encodeCounter(uint64_t value) {
      qtils::ByteVec out(sizeof(value));
      for (size_t i = 0; i < sizeof(value); ++i) {
        out[sizeof(value) - 1 - i] = static_cast<uint8_t>(value >> (8 * i));
      }
      return out;
    }

    outcome::result<uint64_t> decodeCounter(qtils::BytesIn bytes) {
      if (bytes.size() != sizeof(uint64_t)) {
        return storage::StorageError::INVALID_VALUE;
      }
      uint64_t value = 0;
      for (auto byte : bytes) {
        value = (value << 8) | byte;
      }
      return value;
    }
  }  // namespace

  MessageLedger::MessageLedger(qtils::SharedRef<log::LoggingSystem> logsys,
                               qtils::SharedRef<storage::SpacedStorage> storage)
      : logger_{logsys->getLogger("MessageLedger", "blockchain")},
        space_{storage->getSpace(storage::Space::Appchain)} {}

  Hash256 MessageLedger::messageHash(const MessageToStarknet &message) {
    std::array header{
        message.from_address,
        message.to_address,
        Felt::fromU64(message.payload.size()),
    };
    return crypto::sha256Felts({header, message.payload});
  }

  Hash256 MessageLedger::messageHash(const MessageToAppchain &message) {
    std::array header{
        message.from_address,
        message.to_address,
        message.nonce,
        message.selector,
        Felt::fromU64(message.payload.size()),
    };
    return crypto::sha256Felts({header, message.payload});
  }

  outcome::result<void> MessageLedger::stage(
      storage::BufferBatch &batch, const ProgramOutput &output) const {
    // the same message may occur several times within one output
    std::vector<std::pair<qtils::ByteVec, uint64_t>> counters;
    for (auto &message : output.messages_to_starknet) {
      auto hash = messageHash(message);
      auto key =
          storage::prefixedKey(storage::kMessageToStarknetKeyPrefix, hash);
      auto it = std::ranges::find(
          counters, key, &std::pair<qtils::ByteVec, uint64_t>::first);
      if (it == counters.end()) {
        BOOST_OUTCOME_TRY(auto count, messageToStarknetCount(hash));
        it = counters.emplace(counters.end(), std::move(key), count);
      }
      ++it->second;
    }
    for (auto &[key, count] : counters) {
      BOOST_OUTCOME_TRY(batch.put(key, encodeCounter(count)));
    }

    for (auto &message : output.messages_to_appchain) {
      BOOST_OUTCOME_TRY(
          batch.put(storage::prefixedKey(storage::kMessageToAppchainKeyPrefix,
                                         messageHash(message)),
                    kSealed));
    }

    SL_DEBUG(logger_,
             "Staged {} messages to Starknet ({} distinct), "
             "{} messages to appchain",
             output.messages_to_starknet.size(),
             counters.size(),
             output.messages_to_appchain.size());
    return outcome::success();
  }

  outcome::result<uint64_t> MessageLedger::messageToStarknetCount(
      const Hash256 &message_hash) const {
    BOOST_OUTCOME_TRY(
        auto raw,
        space_->tryGet(storage::prefixedKey(
            storage::kMessageToStarknetKeyPrefix, message_hash)));
    if (not raw.has_value()) {
      return 0;
    }
    return decodeCounter(raw.value());
  }

  outcome::result<bool> MessageLedger::isMessageToAppchainSealed(
      const Hash256 &message_hash) const {
    return space_->contains(storage::prefixedKey(
        storage::kMessageToAppchainKeyPrefix, message_hash));
  }

}  // namespace appchain::blockchain
