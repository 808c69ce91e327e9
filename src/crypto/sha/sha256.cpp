/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "crypto/sha/sha256.hpp"

#include <openssl/sha.h>

namespace appchain::crypto {

  Hash256 sha256(qtils::ByteView input) {
    Hash256 out;
    SHA256_CTX ctx;
    SHA256_Init(&ctx);
    SHA256_Update(&ctx, input.data(), input.size());
    SHA256_Final(out.data(), &ctx);
    return out;
  }

  Hash256 sha256Felts(std::initializer_list<std::span<const Felt>> felts) {
    Hash256 out;
    SHA256_CTX ctx;
    SHA256_Init(&ctx);
    for (auto &span : felts) {
      for (auto &felt : span) {
        SHA256_Update(&ctx, felt.bytes().data(), felt.bytes().size());
      }
    }
    SHA256_Final(out.data(), &ctx);
    return out;
  }

}  // namespace appchain::crypto
