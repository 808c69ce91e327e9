/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <cstdint>
#include <string>
#include <string_view>

#include <boost/multiprecision/cpp_int.hpp>
#include <fmt/format.h>
#include <qtils/byte_arr.hpp>
#include <qtils/bytes.hpp>
#include <qtils/enum_error_code.hpp>
#include <qtils/outcome.hpp>

namespace appchain {
  using U256 = boost::multiprecision::uint256_t;

  enum class FeltError : uint8_t {
    INVALID_FORMAT = 1,
    OUT_OF_RANGE,
  };

  /// Stark field modulus, 2^251 + 17 * 2^192 + 1
  const U256 &feltModulus();

  /**
   * Element of the Stark prime field.
   *
   * Kept as 32 big-endian bytes, always reduced. Only equality is defined on
   * the raw representation; anything that needs ordering must widen the value
   * with `toU256()` first.
   */
  class Felt {
   public:
    using Bytes = qtils::ByteArr<32>;
    static constexpr size_t kSize = 32;

    constexpr Felt() = default;

    static Felt fromU64(uint64_t value);

    /// Reduces `value` modulo the field modulus
    static Felt fromU256(const U256 &value);

    /// Big-endian, exactly 32 bytes, must be canonical (less than modulus)
    static outcome::result<Felt> fromBytes(qtils::BytesIn bytes);

    /// "0x"-prefixed hex or decimal, must be less than modulus
    static outcome::result<Felt> fromString(std::string_view str);

    U256 toU256() const;

    const Bytes &bytes() const {
      return bytes_;
    }

    bool isZero() const {
      return *this == Felt{};
    }

    std::string toHex() const;

    bool operator==(const Felt &other) const = default;

   private:
    Bytes bytes_{};
  };

  inline const Felt kZeroFelt{};

  /// Largest field element, `-1` in field arithmetic
  const Felt &maxFelt();
}  // namespace appchain

OUTCOME_HPP_DECLARE_ERROR(appchain, FeltError);

template <>
struct fmt::formatter<appchain::Felt> : fmt::formatter<std::string_view> {
  template <typename FormatContext>
  auto format(const appchain::Felt &felt, FormatContext &ctx) const
      -> decltype(ctx.out()) {
    return fmt::formatter<std::string_view>::format(felt.toHex(), ctx);
  }
};
