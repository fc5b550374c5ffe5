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

using kvext::app::ConfigurationMock;
using kvext::log::LoggingSystem;
using kvext::storage::ColumnFamilyConfig;
using kvext::storage::RocksDb;
using DatabaseConfig = kvext::app::Configuration::DatabaseConfig;
using namespace testing;

struct RocksDb_Open : public test::BaseFS_Test {
  RocksDb_Open() : test::BaseFS_Test("/tmp/kvext-test-rocksdb-open") {}

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
  std::vector<ColumnFamilyConfig> column_families{{.name = "test"}};
};

/**
 * @given database directory under a path that can't be a directory
 * @when open database
 * @then database can not be opened
 */
TEST_F(RocksDb_Open, OpenNonExistingDB) {
  db_config.directory = "/dev/zero/impossible/path";

  ASSERT_THROW_OUTCOME(RocksDb(logsys, app_config, column_families),
                       std::errc::not_a_directory);
}

/**
 * @given writable database directory
 * @when open database
 * @then database is opened
 */
TEST_F(RocksDb_Open, OpenExistingDB) {
  ASSERT_NO_THROW(RocksDb(logsys, app_config, column_families));
}

/**
 * @given database with an entry in column family "test"
 * @when it is reopened without requesting that column family
 * @then database still opens and the family keeps its data
 */
TEST_F(RocksDb_Open, ReopenWithUnrequestedColumnFamily) {
  const qtils::ByteVec key{1, 2, 3};
  const qtils::ByteVec value{4, 5};
  {
    auto rocks =
        std::make_shared<RocksDb>(logsys, app_config, column_families);
    EXPECT_OUTCOME_SUCCESS(rocks->getSpace("test")->put(key, value));
  }
  {
    std::vector<ColumnFamilyConfig> other{{.name = "other"}};
    ASSERT_NO_THROW(RocksDb(logsys, app_config, other));
  }
  auto rocks = std::make_shared<RocksDb>(logsys, app_config, column_families);
  ASSERT_OUTCOME_SUCCESS(stored, rocks->getSpace("test")->get(key));
  EXPECT_EQ(stored, value);
}

/**
 * @given database with an entry
 * @when it is reopened with delete_existing_on_startup
 * @then entry is gone
 */
TEST_F(RocksDb_Open, DeleteExistingOnStartup) {
  const qtils::ByteVec key{7};
  {
    auto rocks =
        std::make_shared<RocksDb>(logsys, app_config, column_families);
    EXPECT_OUTCOME_SUCCESS(rocks->getSpace("test")->put(key, key));
  }

  db_config.delete_existing_on_startup = true;
  auto rocks = std::make_shared<RocksDb>(logsys, app_config, column_families);
  ASSERT_OUTCOME_SUCCESS(found, rocks->getSpace("test")->contains(key));
  EXPECT_FALSE(found);
}
