/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "storage/spaces.hpp"

#include <algorithm>
#include <array>

namespace appchain::storage {

  namespace {
    constexpr std::array<std::string_view, SpacesCount> kNames{
        "default",  // rocksdb::kDefaultColumnFamilyName
        "appchain",
    };
  }  // namespace

  std::string_view spaceName(Space space) {
    return kNames.at(static_cast<size_t>(space));
  }

  std::optional<Space> spaceFromString(std::string_view string) {
    auto it = std::ranges::find(kNames, string);
    if (it == kNames.end()) {
      return std::nullopt;
    }
    return static_cast<Space>(std::distance(kNames.begin(), it));
  }

}  // namespace appchain::storage
