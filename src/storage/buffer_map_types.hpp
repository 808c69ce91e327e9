/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <memory>

#include "storage/face/readable.hpp"
#include "storage/face/write_batch.hpp"

namespace appchain::storage {

  using qtils::ByteVec;
  using qtils::ByteView;

  using BufferBatch = face::WriteBatch;

  /**
   * @brief Byte key-value storage with atomic write batches.
   */
  struct BufferStorage : face::Readable, face::Writeable {
    /// Create a new empty batch bound to this storage
    virtual std::unique_ptr<BufferBatch> batch() = 0;
  };

}  // namespace appchain::storage
