/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "storage/rocksdb/rocksdb.hpp"

#include <algorithm>
#include <unordered_set>

#include <qtils/error_throw.hpp>
#include <rocksdb/filter_policy.h>
#include <soralog/macro.hpp>

#include "app/configuration.hpp"
#include "storage/rocksdb/rocksdb_batch.hpp"
#include "storage/rocksdb/rocksdb_util.hpp"
#include "storage/storage_error.hpp"

namespace appchain::storage {
  namespace fs = std::filesystem;

  namespace {
    rocksdb::ColumnFamilyOptions configureColumn(uint64_t memory_budget) {
      rocksdb::ColumnFamilyOptions options;
      options.OptimizeLevelStyleCompaction(memory_budget);
      options.table_factory.reset(rocksdb::NewBlockBasedTableFactory(
          RocksDb::tableOptionsConfiguration()));
      return options;
    }
  }  // namespace

  RocksDb::RocksDb(qtils::SharedRef<log::LoggingSystem> logsys,
                   qtils::SharedRef<app::Configuration> app_config)
      : logger_(logsys->getLogger("RocksDB", "storage")) {
    ro_.fill_cache = false;
    // state updates must survive a crash right after commit
    wo_.sync = true;

    const auto &path = app_config->database().directory;

    auto options = rocksdb::Options{};
    options.create_if_missing = true;
    options.create_missing_column_families = true;
    options.table_factory.reset(
        rocksdb::NewBlockBasedTableFactory(tableOptionsConfiguration()));

    if (auto res = createDirectory(path, logger_); res.has_error()) {
      SL_CRITICAL(logger_,
                  "Can't create DB directory ({}): {}",
                  path.native(),
                  res.error());
      qtils::raise(res.error());
    }

    std::vector<std::string> existing_families;
    auto status = rocksdb::DB::ListColumnFamilies(
        options, path.native(), &existing_families);
    if (not status.ok() and not status.IsPathNotFound()) {
      SL_ERROR(logger_,
               "Can't list column families in {}: {}",
               path.native(),
               status.ToString());
      qtils::raise(status_as_error(status, logger_));
    }

    std::vector<std::string> all_families;
    for (size_t i = 0; i < SpacesCount; ++i) {
      all_families.emplace_back(spaceName(static_cast<Space>(i)));
    }
    for (auto &existing_family : existing_families) {
      if (std::ranges::find(all_families, existing_family)
          == all_families.end()) {
        SL_WARN(logger_,
                "Column family '{}' present in database but not used; "
                "probably obsolete",
                existing_family);
        all_families.emplace_back(existing_family);
      }
    }

    const auto memory_budget =
        app_config->database().cache_size / all_families.size();

    std::vector<rocksdb::ColumnFamilyDescriptor> column_family_descriptors;
    for (auto &family : all_families) {
      column_family_descriptors.emplace_back(family,
                                             configureColumn(memory_budget));
      SL_DEBUG(logger_,
               "Column family '{}' configured with cache_size={:.0f}Mb",
               family,
               static_cast<double>(memory_budget) / 1024.0 / 1024.0);
    }

    status = rocksdb::DB::Open(options,
                               path.native(),
                               column_family_descriptors,
                               &column_family_handles_,
                               &db_);
    if (not status.ok()) {
      SL_CRITICAL(logger_,
                  "Can't open database in {}: {}",
                  path.native(),
                  status.ToString());
      qtils::raise(status_as_error(status, logger_));
    }
    SL_INFO(logger_, "Database opened in {}", path.native());
  }

  RocksDb::~RocksDb() {
    for (auto *handle : column_family_handles_) {
      auto status = db_->DestroyColumnFamilyHandle(handle);
      if (not status.ok()) {
        SL_ERROR(logger_,
                 "Can't destroy column family handle: {}",
                 status.ToString());
      }
    }
    if (db_ != nullptr) {
      auto status = db_->Close();
      if (not status.ok()) {
        SL_ERROR(logger_, "Can't close database: {}", status.ToString());
      }
    }
    delete db_;
  }

  outcome::result<void> RocksDb::createDirectory(
      const std::filesystem::path &absolute_path, log::Logger &log) {
    std::error_code ec;
    if (not fs::create_directories(absolute_path, ec) and ec.value()) {
      SL_ERROR(log,
               "Can't create directory {} for database: {}",
               absolute_path.native(),
               ec.message());
      return StorageError::IO_ERROR;
    }
    if (not fs::is_directory(absolute_path)) {
      SL_ERROR(log,
               "Can't open {} for database: is not a directory",
               absolute_path.native());
      return StorageError::IO_ERROR;
    }
    return outcome::success();
  }

  std::shared_ptr<BufferStorage> RocksDb::getSpace(Space space) {
    if (auto it = spaces_.find(space); it != spaces_.end()) {
      return it->second;
    }
    auto space_name = spaceName(space);
    auto column = std::ranges::find_if(
        column_family_handles_,
        [&space_name](const ColumnFamilyHandlePtr &handle) {
          return handle->GetName() == space_name;
        });
    if (column_family_handles_.end() == column) {
      qtils::raise(StorageError::INVALID_ARGUMENT);
    }
    auto space_ptr =
        std::make_shared<RocksDbSpace>(weak_from_this(), *column, logger_);
    spaces_[space] = space_ptr;
    return space_ptr;
  }

  rocksdb::BlockBasedTableOptions RocksDb::tableOptionsConfiguration(
      uint32_t lru_cache_size_mib, uint32_t block_size_kib) {
    rocksdb::BlockBasedTableOptions table_options;
    table_options.format_version = 5;
    table_options.block_cache = rocksdb::NewLRUCache(
        static_cast<uint64_t>(lru_cache_size_mib) * 1024 * 1024);
    table_options.block_size = static_cast<size_t>(block_size_kib) * 1024;
    table_options.cache_index_and_filter_blocks = true;
    table_options.filter_policy.reset(rocksdb::NewBloomFilterPolicy(10, false));
    return table_options;
  }

  RocksDbSpace::RocksDbSpace(std::weak_ptr<RocksDb> storage,
                             rocksdb::ColumnFamilyHandle *column,
                             log::Logger logger)
      : storage_{std::move(storage)},
        column_{column},
        logger_{std::move(logger)} {}

  std::unique_ptr<BufferBatch> RocksDbSpace::batch() {
    return std::make_unique<RocksDbBatch>(*this, logger_);
  }

  outcome::result<bool> RocksDbSpace::contains(ByteView key) const {
    BOOST_OUTCOME_TRY(auto value, tryGet(key));
    return value.has_value();
  }

  outcome::result<ByteVec> RocksDbSpace::get(ByteView key) const {
    BOOST_OUTCOME_TRY(auto value, tryGet(key));
    if (not value.has_value()) {
      return StorageError::NOT_FOUND;
    }
    return std::move(value.value());
  }

  outcome::result<std::optional<ByteVec>> RocksDbSpace::tryGet(
      ByteView key) const {
    BOOST_OUTCOME_TRY(auto rocks, use());
    std::string value;
    auto status = rocks->db_->Get(rocks->ro_, column_, make_slice(key), &value);
    if (status.IsNotFound()) {
      return std::nullopt;
    }
    if (not status.ok()) {
      return status_as_error(status, logger_);
    }
    return make_buffer(value);
  }

  outcome::result<void> RocksDbSpace::put(ByteView key, ByteVec value) {
    BOOST_OUTCOME_TRY(auto rocks, use());
    auto status = rocks->db_->Put(
        rocks->wo_, column_, make_slice(key), make_slice(value));
    if (not status.ok()) {
      return status_as_error(status, logger_);
    }
    return outcome::success();
  }

  outcome::result<void> RocksDbSpace::remove(ByteView key) {
    BOOST_OUTCOME_TRY(auto rocks, use());
    auto status = rocks->db_->Delete(rocks->wo_, column_, make_slice(key));
    if (not status.ok()) {
      return status_as_error(status, logger_);
    }
    return outcome::success();
  }

  outcome::result<std::shared_ptr<RocksDb>> RocksDbSpace::use() const {
    auto rocks = storage_.lock();
    if (not rocks) {
      return StorageError::STORAGE_GONE;
    }
    return rocks;
  }

}  // namespace appchain::storage
