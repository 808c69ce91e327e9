/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "types/felt.hpp"

namespace appchain {

  /**
   * Last accepted state of the appchain.
   * `block_number == maxFelt()` means no block has been accepted yet.
   */
  struct AppchainState {
    Felt state_root;
    Felt block_number;
    Felt block_hash;

    bool isGenesis() const {
      return block_number == maxFelt();
    }

    bool operator==(const AppchainState &) const = default;
  };

}  // namespace appchain

template <>
struct fmt::formatter<appchain::AppchainState> {
  constexpr auto parse(format_parse_context &ctx) -> decltype(ctx.begin()) {
    return ctx.begin();
  }

  template <typename FormatContext>
  auto format(const appchain::AppchainState &v, FormatContext &ctx) const
      -> decltype(ctx.out()) {
    if (v.isGenesis()) {
      return fmt::format_to(
          ctx.out(), "root={} block=genesis hash={}", v.state_root, v.block_hash);
    }
    return fmt::format_to(ctx.out(),
                          "root={} block={} hash={}",
                          v.state_root,
                          v.block_number.toU256().str(),
                          v.block_hash);
  }
};
