/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <qtils/byte_vec.hpp>
#include <qtils/byte_view.hpp>
#include <qtils/outcome.hpp>

namespace appchain::storage::face {

  /**
   * @brief A mixin for modifiable byte map.
   */
  struct Writeable {
    virtual ~Writeable() = default;

    /// Store or overwrite value by key
    virtual outcome::result<void> put(qtils::ByteView key,
                                      qtils::ByteVec value) = 0;

    /// Remove value by key, absent key is not an error
    virtual outcome::result<void> remove(qtils::ByteView key) = 0;
  };

}  // namespace appchain::storage::face
