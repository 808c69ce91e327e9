/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "storage/in_memory/in_memory_storage.hpp"

#include <qtils/bytestr.hpp>

#include "storage/in_memory/in_memory_batch.hpp"
#include "storage/storage_error.hpp"

namespace appchain::storage {

  outcome::result<bool> InMemoryStorage::contains(ByteView key) const {
    return storage_.contains(std::string{qtils::byte2str(key)});
  }

  outcome::result<ByteVec> InMemoryStorage::get(ByteView key) const {
    auto it = storage_.find(std::string{qtils::byte2str(key)});
    if (it == storage_.end()) {
      return StorageError::NOT_FOUND;
    }
    return it->second;
  }

  outcome::result<std::optional<ByteVec>> InMemoryStorage::tryGet(
      ByteView key) const {
    auto it = storage_.find(std::string{qtils::byte2str(key)});
    if (it == storage_.end()) {
      return std::nullopt;
    }
    return it->second;
  }

  outcome::result<void> InMemoryStorage::put(ByteView key, ByteVec value) {
    storage_[std::string{qtils::byte2str(key)}] = std::move(value);
    return outcome::success();
  }

  outcome::result<void> InMemoryStorage::remove(ByteView key) {
    storage_.erase(std::string{qtils::byte2str(key)});
    return outcome::success();
  }

  std::unique_ptr<BufferBatch> InMemoryStorage::batch() {
    return std::make_unique<InMemoryBatch>(*this);
  }

}  // namespace appchain::storage
