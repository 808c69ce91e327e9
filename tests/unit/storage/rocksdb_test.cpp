/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include <gtest/gtest.h>

#include <mock/app/configuration_mock.hpp>
#include <qtils/test/outcome.hpp>

#include "app/configuration.hpp"
#include "storage/rocksdb/rocksdb.hpp"
#include "storage/storage_error.hpp"
#include "testutil/prepare_loggers.hpp"
#include "testutil/storage/base_fs_test.hpp"

using appchain::app::ConfigurationMock;
using appchain::log::LoggingSystem;
using appchain::storage::RocksDb;
using appchain::storage::Space;
using appchain::storage::StorageError;
using DatabaseConfig = appchain::app::Configuration::DatabaseConfig;
using qtils::ByteVec;
using namespace testing;

struct RocksDbTest : public test::BaseFS_Test {
  RocksDbTest() : test::BaseFS_Test("/tmp/appchain-test-rocksdb") {}

  void SetUp() override {
    BaseFS_Test::SetUp();

    logsys = testutil::prepareLoggers();
    app_config = std::make_shared<ConfigurationMock>();

    db_config = DatabaseConfig{
        .directory = getPathString() + "/db",
        .cache_size = 8 << 20,  // 8Mb
    };
    EXPECT_CALL(*app_config, database()).WillRepeatedly(ReturnRef(db_config));
  };

  void TearDown() override {
    app_config.reset();
    BaseFS_Test::TearDown();
  }

  std::shared_ptr<LoggingSystem> logsys;
  std::shared_ptr<ConfigurationMock> app_config;
  DatabaseConfig db_config;
};

/**
 * @given path which can't be a directory
 * @when open database
 * @then database can not be opened
 */
TEST_F(RocksDbTest, OpenImpossiblePath) {
  db_config.directory = "/dev/zero/impossible/path";

  EXPECT_THROW_OUTCOME(std::make_shared<RocksDb>(logsys, app_config),
                       StorageError::IO_ERROR);
}

/**
 * @given writable path
 * @when open database, write through a batch, reopen
 * @then data written by the batch is read back
 */
TEST_F(RocksDbTest, BatchSurvivesReopen) {
  ByteVec key{1, 2, 3};
  ByteVec value{4, 5, 6};
  {
    std::shared_ptr<RocksDb> rocks;
    ASSERT_NO_THROW(rocks = std::make_shared<RocksDb>(logsys, app_config));
    auto space = rocks->getSpace(Space::Appchain);

    auto batch = space->batch();
    ASSERT_OUTCOME_SUCCESS(batch->put(key, value));
    EXPECT_EQ(batch->size(), 1);
    ASSERT_OUTCOME_SUCCESS(before, space->contains(key));
    EXPECT_FALSE(before);
    ASSERT_OUTCOME_SUCCESS(batch->commit());
  }

  std::shared_ptr<RocksDb> rocks;
  ASSERT_NO_THROW(rocks = std::make_shared<RocksDb>(logsys, app_config));
  auto space = rocks->getSpace(Space::Appchain);
  ASSERT_OUTCOME_SUCCESS(got, space->get(key));
  EXPECT_EQ(got, value);

  ASSERT_OUTCOME_SUCCESS(in_default,
                         rocks->getSpace(Space::Default)->contains(key));
  EXPECT_FALSE(in_default);
}

TEST_F(RocksDbTest, GetMissingAndRemove) {
  auto rocks = std::make_shared<RocksDb>(logsys, app_config);
  auto space = rocks->getSpace(Space::Appchain);
  ByteVec key{9};

  ASSERT_OUTCOME_ERROR(space->get(key), StorageError::NOT_FOUND);
  ASSERT_OUTCOME_SUCCESS(missing, space->tryGet(key));
  EXPECT_FALSE(missing.has_value());

  ASSERT_OUTCOME_SUCCESS(space->put(key, ByteVec{1}));
  ASSERT_OUTCOME_SUCCESS(space->remove(key));
  ASSERT_OUTCOME_SUCCESS(contains, space->contains(key));
  EXPECT_FALSE(contains);
}
