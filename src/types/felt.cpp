/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "types/felt.hpp"

#include <algorithm>
#include <iterator>

OUTCOME_CPP_DEFINE_CATEGORY(appchain, FeltError, e) {
  using E = appchain::FeltError;
  switch (e) {
    case E::INVALID_FORMAT:
      return "Invalid field element format";
    case E::OUT_OF_RANGE:
      return "Value is out of field range";
  }
  return "Unknown FeltError";
}

namespace appchain {

  const U256 &feltModulus() {
    static const U256 modulus = (U256{1} << 251) + (U256{17} << 192) + 1;
    return modulus;
  }

  const Felt &maxFelt() {
    static const Felt max = Felt::fromU256(feltModulus() - 1);
    return max;
  }

  Felt Felt::fromU64(uint64_t value) {
    Felt felt;
    for (size_t i = 0; i < sizeof(value); ++i) {
      felt.bytes_[kSize - 1 - i] = static_cast<uint8_t>(value >> (8 * i));
    }
    return felt;
  }

  Felt Felt::fromU256(const U256 &value) {
    U256 reduced = value % feltModulus();
    Felt felt;
    for (size_t i = 0; i < kSize; ++i) {
      U256 low = reduced & 0xff;
      felt.bytes_[kSize - 1 - i] = static_cast<uint8_t>(low);
      reduced >>= 8;
    }
    return felt;
  }

  outcome::result<Felt> Felt::fromBytes(qtils::BytesIn bytes) {
    if (bytes.size() != kSize) {
      return FeltError::INVALID_FORMAT;
    }
    Felt felt;
    std::ranges::copy(bytes, felt.bytes_.begin());
    if (felt.toU256() >= feltModulus()) {
      return FeltError::OUT_OF_RANGE;
    }
    return felt;
  }

  outcome::result<Felt> Felt::fromString(std::string_view str) {
    unsigned base = 10;
    if (str.starts_with("0x") or str.starts_with("0X")) {
      base = 16;
      str.remove_prefix(2);
    }
    if (str.empty()) {
      return FeltError::INVALID_FORMAT;
    }

    // accumulator stays below modulus, so one more digit never overflows
    U256 value = 0;
    for (auto c : str) {
      unsigned digit;
      if (c >= '0' and c <= '9') {
        digit = c - '0';
      } else if (base == 16 and c >= 'a' and c <= 'f') {
        digit = c - 'a' + 10;
      } else if (base == 16 and c >= 'A' and c <= 'F') {
        digit = c - 'A' + 10;
      } else {
        return FeltError::INVALID_FORMAT;
      }
      value = value * base + digit;
      if (value >= feltModulus()) {
        return FeltError::OUT_OF_RANGE;
      }
    }
    return fromU256(value);
  }

  U256 Felt::toU256() const {
    U256 value = 0;
    for (auto byte : bytes_) {
      value = (value << 8) | byte;
    }
    return value;
  }

  std::string Felt::toHex() const {
    std::string hex;
    hex.reserve(2 * kSize);
    for (auto byte : bytes_) {
      fmt::format_to(std::back_inserter(hex), "{:02x}", byte);
    }
    auto first = hex.find_first_not_of('0');
    if (first == std::string::npos) {
      return "0x0";
    }
    return "0x" + hex.substr(first);
  }

}  // namespace appchain
