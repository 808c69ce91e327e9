/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <filesystem>

#include <boost/container/flat_map.hpp>
#include <qtils/shared_ref.hpp>
#include <rocksdb/db.h>
#include <rocksdb/table.h>

#include "log/logger.hpp"
#include "storage/buffer_map_types.hpp"
#include "storage/spaced_storage.hpp"
#include "utils/ctor_limiters.hpp"

namespace appchain::app {
  class Configuration;
}

namespace appchain::storage {

  /**
   * RocksDB database with a column family per storage space.
   */
  class RocksDb : public SpacedStorage,
                  public std::enable_shared_from_this<RocksDb>,
                  NonCopyable,
                  NonMovable {
    using ColumnFamilyHandlePtr = rocksdb::ColumnFamilyHandle *;

   public:
    RocksDb(qtils::SharedRef<log::LoggingSystem> logsys,
            qtils::SharedRef<app::Configuration> app_config);

    ~RocksDb() override;

    static constexpr uint32_t kDefaultLruCacheSizeMiB = 64;
    static constexpr uint32_t kDefaultBlockSizeKiB = 16;

    std::shared_ptr<BufferStorage> getSpace(Space space) override;

    /**
     * Prepare configuration structure
     * @param lru_cache_size_mib - LRU rocksdb cache in MiB
     * @param block_size_kib - internal rocksdb block size in KiB
     * @return options structure
     */
    static rocksdb::BlockBasedTableOptions tableOptionsConfiguration(
        uint32_t lru_cache_size_mib = kDefaultLruCacheSizeMiB,
        uint32_t block_size_kib = kDefaultBlockSizeKiB);

    friend class RocksDbSpace;
    friend class RocksDbBatch;

   private:
    static outcome::result<void> createDirectory(
        const std::filesystem::path &absolute_path, log::Logger &log);

    rocksdb::DB *db_{};
    std::vector<ColumnFamilyHandlePtr> column_family_handles_;
    boost::container::flat_map<Space, std::shared_ptr<BufferStorage>> spaces_;
    rocksdb::ReadOptions ro_;
    rocksdb::WriteOptions wo_;
    log::Logger logger_;
  };

  class RocksDbSpace : public BufferStorage {
   public:
    RocksDbSpace(std::weak_ptr<RocksDb> storage,
                 rocksdb::ColumnFamilyHandle *column,
                 log::Logger logger);

    std::unique_ptr<BufferBatch> batch() override;

    outcome::result<bool> contains(ByteView key) const override;

    outcome::result<ByteVec> get(ByteView key) const override;

    outcome::result<std::optional<ByteVec>> tryGet(
        ByteView key) const override;

    outcome::result<void> put(ByteView key, ByteVec value) override;

    outcome::result<void> remove(ByteView key) override;

    friend class RocksDbBatch;

   private:
    // gather storage instance from weak ptr
    outcome::result<std::shared_ptr<RocksDb>> use() const;

    std::weak_ptr<RocksDb> storage_;
    rocksdb::ColumnFamilyHandle *column_;
    log::Logger logger_;
  };
}  // namespace appchain::storage
