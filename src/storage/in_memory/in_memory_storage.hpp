/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <map>
#include <string>

#include "storage/buffer_map_types.hpp"

namespace appchain::storage {

  /**
   * Storage kept in process memory.
   * Used by tests and by `--db-in-memory` runs.
   */
  class InMemoryStorage : public BufferStorage {
   public:
    [[nodiscard]] outcome::result<bool> contains(ByteView key) const override;

    [[nodiscard]] outcome::result<ByteVec> get(ByteView key) const override;

    [[nodiscard]] outcome::result<std::optional<ByteVec>> tryGet(
        ByteView key) const override;

    outcome::result<void> put(ByteView key, ByteVec value) override;

    outcome::result<void> remove(ByteView key) override;

    std::unique_ptr<BufferBatch> batch() override;

    /// Number of stored entries
    size_t size() const {
      return storage_.size();
    }

   private:
    std::map<std::string, ByteVec> storage_;

    friend class InMemoryBatch;
  };

}  // namespace appchain::storage
