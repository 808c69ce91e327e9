/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <optional>

#include <qtils/byte_vec.hpp>
#include <qtils/byte_view.hpp>
#include <qtils/outcome.hpp>

namespace appchain::storage::face {

  /**
   * @brief A mixin for read-only byte map.
   */
  struct Readable {
    virtual ~Readable() = default;

    /**
     * @brief Checks if given key has a value in the storage.
     * @return true if key has value, false if does not, or error
     */
    [[nodiscard]] virtual outcome::result<bool> contains(
        qtils::ByteView key) const = 0;

    /**
     * @brief Get value by key
     * @return value, or StorageError::NOT_FOUND
     */
    [[nodiscard]] virtual outcome::result<qtils::ByteVec> get(
        qtils::ByteView key) const = 0;

    /**
     * @brief Get value by key
     * @return value if contains(key) or std::nullopt
     */
    [[nodiscard]] virtual outcome::result<std::optional<qtils::ByteVec>>
    tryGet(qtils::ByteView key) const = 0;
  };

}  // namespace appchain::storage::face
