/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <rocksdb/write_batch.h>

#include "storage/rocksdb/rocksdb.hpp"

namespace appchain::storage {

  /// Batch of one column family, written with a single DB::Write
  class RocksDbBatch : public BufferBatch {
   public:
    RocksDbBatch(RocksDbSpace &db, log::Logger logger);

    outcome::result<void> commit() override;

    void clear() override;

    size_t size() const override;

    outcome::result<void> put(ByteView key, ByteVec value) override;

    outcome::result<void> remove(ByteView key) override;

   private:
    // NOLINTNEXTLINE(cppcoreguidelines-avoid-const-or-ref-data-members)
    RocksDbSpace &db_;
    log::Logger logger_;
    rocksdb::WriteBatch batch_;
  };

}  // namespace appchain::storage
