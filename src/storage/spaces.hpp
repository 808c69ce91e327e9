/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string_view>

namespace appchain::storage {

  /**
   * @enum Space
   * @brief Logical storage spaces. Writes of one batch never cross spaces.
   */
  enum class Space : uint8_t {
    Default = 0,  ///< Default space used for general-purpose storage

    /// Rolling state, operators, program info and message ledger
    Appchain,
    // ... append here

    Total  ///< Total number of defined spaces (must be last)
  };

  constexpr size_t SpacesCount = static_cast<size_t>(Space::Total);

  std::string_view spaceName(Space space);

  std::optional<Space> spaceFromString(std::string_view string);

}  // namespace appchain::storage
