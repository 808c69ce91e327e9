/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <charconv>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

#include <boost/algorithm/string/predicate.hpp>
#include <boost/algorithm/string/trim.hpp>

namespace appchain::util {

  /**
   * Parses a byte size such as "64", "512KiB", "64 MiB" or "1GB".
   * Suffixes are case-insensitive; K, M, G are binary (1024-based),
   * KB, MB, GB are decimal.
   * @return number of bytes, or nullopt on malformed input or overflow
   */
  inline std::optional<uint64_t> parseByteQuantity(std::string_view input) {
    auto text = boost::algorithm::trim_copy(std::string{input});
    std::string_view view{text};

    uint64_t number = 0;
    auto [end, ec] =
        std::from_chars(view.data(), view.data() + view.size(), number);
    if (ec != std::errc() or end == view.data()) {
      return std::nullopt;
    }
    auto suffix = boost::algorithm::trim_left_copy(
        std::string{end, view.data() + view.size()});

    static constexpr std::pair<std::string_view, uint64_t> kUnits[] = {
        {"", 1},
        {"b", 1},
        {"k", 1ull << 10},
        {"kib", 1ull << 10},
        {"kb", 1'000ull},
        {"m", 1ull << 20},
        {"mib", 1ull << 20},
        {"mb", 1'000'000ull},
        {"g", 1ull << 30},
        {"gib", 1ull << 30},
        {"gb", 1'000'000'000ull},
    };
    for (auto &[unit, multiplier] : kUnits) {
      if (boost::algorithm::iequals(unit, suffix)) {
        if (number > UINT64_MAX / multiplier) {
          return std::nullopt;
        }
        return number * multiplier;
      }
    }
    return std::nullopt;
  }

}  // namespace appchain::util
