/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "crypto/hash_types.hpp"

namespace appchain::app {

  /// Set of proven program facts
  class FactRegistry {
   public:
    virtual ~FactRegistry() = default;

    /// Disabled registry must not be consulted
    [[nodiscard]] virtual bool enabled() const = 0;

    [[nodiscard]] virtual bool isValid(const Hash256 &fact) const = 0;
  };

}  // namespace appchain::app
