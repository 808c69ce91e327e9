/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include <gtest/gtest.h>

#include <qtils/test/outcome.hpp>
#include <qtils/unhex.hpp>

#include "crypto/sha/sha256.hpp"

using appchain::Felt;
using appchain::crypto::sha256;
using appchain::crypto::sha256Felts;

TEST(Sha256Test, KnownVector) {
  qtils::ByteVec abc{'a', 'b', 'c'};
  auto hash = sha256(abc);
  qtils::ByteVec expected;
  ASSERT_OUTCOME_SUCCESS(qtils::unhex0x(
      expected,
      "0xba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad",
      true));
  EXPECT_EQ(qtils::ByteVec(hash.begin(), hash.end()), expected);
}

/**
 * @given felts split into several spans
 * @when hashed
 * @then result equals hash of their concatenated 32-byte encodings
 */
TEST(Sha256Test, FeltsAreConcatenated) {
  std::vector<Felt> a{Felt::fromU64(1), Felt::fromU64(2)};
  std::vector<Felt> b{Felt::fromU64(3)};
  std::vector<Felt> all{Felt::fromU64(1), Felt::fromU64(2), Felt::fromU64(3)};

  qtils::ByteVec bytes;
  for (auto &felt : all) {
    bytes.insert(bytes.end(), felt.bytes().begin(), felt.bytes().end());
  }

  EXPECT_EQ(sha256Felts({a, b}), sha256Felts({all}));
  EXPECT_EQ(sha256Felts({all}), sha256(bytes));
  EXPECT_NE(sha256Felts({b, a}), sha256Felts({all}));
}
