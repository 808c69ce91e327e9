/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "storage/face/writeable.hpp"

namespace appchain::storage::face {

  /**
   * @brief Accumulates writes and applies them to the storage at once.
   *
   * Nothing written into a batch is visible through the storage until
   * commit() succeeds. A failed commit leaves the storage unchanged.
   */
  struct WriteBatch : public Writeable {
    /// Apply all accumulated writes atomically
    virtual outcome::result<void> commit() = 0;

    /// Drop all accumulated writes
    virtual void clear() = 0;

    /// Number of accumulated writes
    [[nodiscard]] virtual size_t size() const = 0;
  };

}  // namespace appchain::storage::face
