/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <qtils/byte_vec.hpp>
#include <qtils/bytes.hpp>
#include <qtils/literals.hpp>

namespace appchain::storage {

  using qtils::literals::operator""_vec;

  /// Last accepted state: root, block number and block hash, 32 bytes each
  inline const qtils::ByteVec kRollingStateLookupKey =
      ":appchain:rolling_state"_vec;

  /// Program hash and config hash, 32 bytes each
  inline const qtils::ByteVec kProgramInfoLookupKey =
      ":appchain:program_info"_vec;

  /// Prefix of operator keys, followed by the operator address
  inline const qtils::ByteVec kOperatorKeyPrefix = ":appchain:operator:"_vec;

  /// Prefix of message to Starknet counters, followed by the message hash
  inline const qtils::ByteVec kMessageToStarknetKeyPrefix =
      ":appchain:l2_to_l1:"_vec;

  /// Prefix of sealed message to appchain marks, followed by the message hash
  inline const qtils::ByteVec kMessageToAppchainKeyPrefix =
      ":appchain:l1_to_l2:"_vec;

  inline qtils::ByteVec prefixedKey(const qtils::ByteVec &prefix,
                                    qtils::BytesIn suffix) {
    qtils::ByteVec key;
    key.reserve(prefix.size() + suffix.size());
    key.insert(key.end(), prefix.begin(), prefix.end());
    key.insert(key.end(), suffix.begin(), suffix.end());
    return key;
  }

}  // namespace appchain::storage
