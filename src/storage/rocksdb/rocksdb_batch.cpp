/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "storage/rocksdb/rocksdb_batch.hpp"

#include "storage/rocksdb/rocksdb_util.hpp"
#include "storage/storage_error.hpp"

namespace appchain::storage {

  RocksDbBatch::RocksDbBatch(RocksDbSpace &db, log::Logger logger)
      : db_(db), logger_(std::move(logger)) {}

  outcome::result<void> RocksDbBatch::put(ByteView key, ByteVec value) {
    auto status = batch_.Put(db_.column_, make_slice(key), make_slice(value));
    if (not status.ok()) {
      return status_as_error(status, logger_);
    }
    return outcome::success();
  }

  outcome::result<void> RocksDbBatch::remove(ByteView key) {
    auto status = batch_.Delete(db_.column_, make_slice(key));
    if (not status.ok()) {
      return status_as_error(status, logger_);
    }
    return outcome::success();
  }

  outcome::result<void> RocksDbBatch::commit() {
    BOOST_OUTCOME_TRY(auto rocks, db_.use());
    auto status = rocks->db_->Write(rocks->wo_, &batch_);
    if (not status.ok()) {
      return status_as_error(status, logger_);
    }
    batch_.Clear();
    return outcome::success();
  }

  void RocksDbBatch::clear() {
    batch_.Clear();
  }

  size_t RocksDbBatch::size() const {
    return batch_.Count();
  }

}  // namespace appchain::storage
