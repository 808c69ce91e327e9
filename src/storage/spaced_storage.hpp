/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <memory>

#include "storage/buffer_map_types.hpp"
#include "storage/spaces.hpp"

namespace appchain::storage {

  /**
   * @class SpacedStorage
   * @brief Access to isolated storage spaces, one BufferStorage per Space.
   */
  class SpacedStorage {
   public:
    virtual ~SpacedStorage() = default;

    /**
     * Retrieve the map representing particular storage space
     * @param space - identifier of required space
     * @return buffer storage for a space
     */
    virtual std::shared_ptr<BufferStorage> getSpace(Space space) = 0;
  };

}  // namespace appchain::storage
