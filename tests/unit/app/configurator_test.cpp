/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "app/configurator.hpp"

#include <fstream>

#include <gtest/gtest.h>
#include <qtils/test/outcome.hpp>

#include "app/configuration.hpp"
#include "testutil/storage/base_fs_test.hpp"

using kvext::app::Configurator;

struct ConfiguratorTest : public test::BaseFS_Test {
  ConfiguratorTest() : test::BaseFS_Test("/tmp/kvext-test-configurator") {}

  fs::path writeConfig(const std::string &content) {
    auto path = base_path / "config.yaml";
    std::ofstream{path} << content;
    return path;
  }
};

/**
 * @given no config file
 * @when config is calculated
 * @then defaults are used with the directory made absolute
 */
TEST_F(ConfiguratorTest, Defaults) {
  Configurator configurator{std::nullopt};
  EXPECT_OUTCOME_SUCCESS(configurator.loadConfigFile());
  ASSERT_OUTCOME_SUCCESS(config, configurator.calculateConfig(logger));

  const auto &db = config->database();
  EXPECT_TRUE(db.directory.is_absolute());
  EXPECT_EQ(db.directory.filename(), "db");
  EXPECT_EQ(db.cache_size, 512ull << 20);
  EXPECT_FALSE(db.delete_existing_on_startup);
  EXPECT_FALSE(db.disable_wal);
  EXPECT_TRUE(db.wait_for_flush);

  ASSERT_OUTCOME_SUCCESS(logging, configurator.getLoggingConfig());
  EXPECT_TRUE(logging["groups"].IsSequence());
}

TEST_F(ConfiguratorTest, DatabaseSection) {
  auto path = writeConfig(R"yaml(
database:
  path: /tmp/kvext-test-configurator/data
  cache_size: 64MiB
  delete_existing_on_startup: true
  use_direct_reads: true
  disable_wal: true
  wait_for_flush: false
logging:
  groups:
    - name: main
)yaml");

  Configurator configurator{path};
  EXPECT_OUTCOME_SUCCESS(configurator.loadConfigFile());
  ASSERT_OUTCOME_SUCCESS(config, configurator.calculateConfig(logger));

  const auto &db = config->database();
  EXPECT_EQ(db.directory, fs::weakly_canonical(base_path / "data"));
  EXPECT_EQ(db.cache_size, 64ull << 20);
  EXPECT_TRUE(db.delete_existing_on_startup);
  EXPECT_TRUE(db.use_direct_reads);
  EXPECT_FALSE(db.use_direct_io_for_flush_and_compaction);
  EXPECT_TRUE(db.disable_wal);
  EXPECT_FALSE(db.wait_for_flush);

  ASSERT_OUTCOME_SUCCESS(logging, configurator.getLoggingConfig());
  EXPECT_EQ(logging["groups"][0]["name"].as<std::string>(), "main");
}

/**
 * @given config file with malformed values
 * @when config is calculated
 * @then parse failure is reported
 */
TEST_F(ConfiguratorTest, BadValues) {
  for (const auto *content : {
           "database:\n  cache_size: lots\n",
           "database:\n  disable_wal: maybe\n",
           "database:\n  path: [a, b]\n",
           "database: 42\n",
       }) {
    Configurator configurator{writeConfig(content)};
    EXPECT_OUTCOME_SUCCESS(configurator.loadConfigFile());
    ASSERT_OUTCOME_ERROR(configurator.calculateConfig(logger),
                         Configurator::Error::ConfigFileParseFailed);
  }
}

TEST_F(ConfiguratorTest, ZeroCacheSizeIsInvalid) {
  Configurator configurator{writeConfig("database:\n  cache_size: 0\n")};
  EXPECT_OUTCOME_SUCCESS(configurator.loadConfigFile());
  ASSERT_OUTCOME_ERROR(configurator.calculateConfig(logger),
                       Configurator::Error::InvalidValue);
}

TEST_F(ConfiguratorTest, MissingOrBrokenFile) {
  Configurator missing{base_path / "absent.yaml"};
  ASSERT_OUTCOME_ERROR(missing.loadConfigFile(),
                       Configurator::Error::ConfigFileParseFailed);

  Configurator broken{writeConfig("database: [unclosed\n")};
  ASSERT_OUTCOME_ERROR(broken.loadConfigFile(),
                       Configurator::Error::ConfigFileParseFailed);
}
