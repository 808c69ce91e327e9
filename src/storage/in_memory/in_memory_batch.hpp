/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <qtils/bytestr.hpp>

#include "storage/in_memory/in_memory_storage.hpp"

namespace appchain::storage {

  class InMemoryBatch : public BufferBatch {
   public:
    explicit InMemoryBatch(InMemoryStorage &db) : db_{db} {}

    outcome::result<void> put(ByteView key, ByteVec value) override {
      entries_[std::string{qtils::byte2str(key)}] = std::move(value);
      return outcome::success();
    }

    outcome::result<void> remove(ByteView key) override {
      entries_[std::string{qtils::byte2str(key)}] = std::nullopt;
      return outcome::success();
    }

    // nothing below can fail, so the map is never left half-updated
    outcome::result<void> commit() override {
      for (auto &[key, value] : entries_) {
        if (value.has_value()) {
          db_.storage_[key] = std::move(value.value());
        } else {
          db_.storage_.erase(key);
        }
      }
      entries_.clear();
      return outcome::success();
    }

    void clear() override {
      entries_.clear();
    }

    size_t size() const override {
      return entries_.size();
    }

   private:
    /// std::nullopt marks removal
    std::map<std::string, std::optional<ByteVec>> entries_;
    // NOLINTNEXTLINE(cppcoreguidelines-avoid-const-or-ref-data-members)
    InMemoryStorage &db_;
  };

}  // namespace appchain::storage
