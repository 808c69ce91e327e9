/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <initializer_list>
#include <span>

#include <qtils/byte_view.hpp>

#include "crypto/hash_types.hpp"
#include "types/felt.hpp"

namespace appchain::crypto {

  /**
   * Take a SHA-256 hash from bytes
   * @param input to be hashed
   * @return hashed bytes
   */
  Hash256 sha256(qtils::ByteView input);

  /**
   * SHA-256 of felts, each one fed as 32 big-endian bytes.
   * Spans are hashed one after another as if concatenated.
   */
  Hash256 sha256Felts(std::initializer_list<std::span<const Felt>> felts);

}  // namespace appchain::crypto
