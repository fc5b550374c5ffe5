/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include <iostream>
#include <memory>
#include <string>

#include <fmt/format.h>
#include <fmt/ranges.h>
#include <qtils/final_action.hpp>

#include "app/configuration.hpp"
#include "app/configurator.hpp"
#include "log/logger.hpp"
#include "merge/operators/int64_add_merge_operator.hpp"
#include "merge/operators/list_merge_operator.hpp"
#include "storage/mergeable_rocksdb_store.hpp"
#include "storage/rocksdb_builder.hpp"
#include "storage/rocksdb_store.hpp"

// NOLINTBEGIN(cppcoreguidelines-pro-bounds-pointer-arithmetic)

namespace {
  using kvext::app::Configuration;
  using kvext::log::LoggingSystem;

  class CounterStore
      : public kvext::storage::MergeableRocksDbStore<std::string,
                                                     int64_t,
                                                     int64_t> {
   public:
    using MergeableRocksDbStore::MergeableRocksDbStore;

    auto increment(const std::string &key, int64_t delta = 1) {
      return merge(key, delta);
    }
  };

  class TagsStore : public kvext::storage::MergeableRocksDbStore<
                        std::string,
                        std::vector<std::string>,
                        kvext::merge::CollectionOperation<std::string>> {
   public:
    using MergeableRocksDbStore::MergeableRocksDbStore;
    using Operation = kvext::merge::CollectionOperation<std::string>;

    auto addTag(const std::string &key, std::string tag) {
      return merge(key, Operation::add({std::move(tag)}));
    }

    auto removeTag(const std::string &key, std::string tag) {
      return merge(key, Operation::remove({std::move(tag)}));
    }
  };

  class NamesStore
      : public kvext::storage::RocksDbStore<int64_t, std::string> {
   public:
    using RocksDbStore::RocksDbStore;
  };

  outcome::result<void> run_demo(
      const std::shared_ptr<LoggingSystem> &logsys,
      const std::shared_ptr<Configuration> &appcfg) {
    auto logger = logsys->getLogger("Demo", kvext::log::defaultGroupName);

    auto context =
        kvext::storage::RocksDbBuilder{logsys, appcfg}
            .addStore<NamesStore>("names")
            .addMergeableStore<CounterStore>(
                "counters",
                std::make_shared<kvext::merge::Int64AddMergeOperator>())
            .addMergeableStore<TagsStore>(
                "tags",
                std::make_shared<
                    kvext::merge::ListMergeOperator<std::string>>())
            .build();

    OUTCOME_TRY(names, context->store<NamesStore>());
    OUTCOME_TRY(counters, context->store<CounterStore>());
    OUTCOME_TRY(tags, context->store<TagsStore>());

    OUTCOME_TRY(names->put(1, "alice"));
    OUTCOME_TRY(names->put(2, "bob"));
    OUTCOME_TRY(all_names, names->getAll());
    SL_INFO(logger, "names: {}", fmt::join(all_names, ", "));

    for (auto delta : {5, 3, 5}) {
      OUTCOME_TRY(counters->increment("visits", delta));
    }
    OUTCOME_TRY(visits, counters->tryGet("visits"));
    SL_INFO(logger, "visits: {}", visits.value_or(0));

    OUTCOME_TRY(tags->addTag("alice", "admin"));
    OUTCOME_TRY(tags->addTag("alice", "ops"));
    OUTCOME_TRY(tags->removeTag("alice", "admin"));
    OUTCOME_TRY(alice_tags, tags->tryGet("alice"));
    SL_INFO(logger,
            "tags of alice: [{}]",
            fmt::join(alice_tags.value_or(std::vector<std::string>{}), ", "));

    OUTCOME_TRY(context->db().flush());
    return outcome::success();
  }

}  // namespace

int main(int argc, const char **argv) {
  setlinebuf(stdout);
  setlinebuf(stderr);

  qtils::FinalAction flush_std_streams_at_exit([] {
    std::cout.flush();
    std::cerr.flush();
  });

  if (argc > 2) {
    std::cerr << "Usage: " << argv[0] << " [config.yaml]\n";
    return EXIT_FAILURE;
  }

  std::optional<std::filesystem::path> config_path;
  if (argc == 2) {
    config_path = argv[1];
  }

  auto app_configurator =
      std::make_unique<kvext::app::Configurator>(std::move(config_path));
  if (auto res = app_configurator->loadConfigFile(); res.has_error()) {
    return EXIT_FAILURE;
  }

  // Setup logging system
  std::shared_ptr<LoggingSystem> logging_system;
  {
    auto log_config = app_configurator->getLoggingConfig();
    if (log_config.has_error()) {
      std::cerr << "Logging config is empty.\n";
      return EXIT_FAILURE;
    }
    auto res = LoggingSystem::fromYaml(log_config.value());
    if (res.has_error()) {
      return EXIT_FAILURE;
    }
    logging_system = std::move(res.value());
  }

  // Setup config
  std::shared_ptr<Configuration> app_configuration;
  {
    auto logger =
        logging_system->getLogger("Configurator", kvext::log::defaultGroupName);

    auto config_res = app_configurator->calculateConfig(logger);
    if (config_res.has_error()) {
      auto error = config_res.error();
      SL_CRITICAL(logger, "Failed to calculate config: {}", error);
      fmt::println(std::cerr, "Failed to calculate config: {}", error);
      fmt::println(std::cerr, "See more details in the log");
      return EXIT_FAILURE;
    }

    app_configuration = config_res.value();
  }

  auto logger =
      logging_system->getLogger("Main", kvext::log::defaultGroupName);

  auto res = run_demo(logging_system, app_configuration);
  if (res.has_error()) {
    SL_CRITICAL(logger, "Demo failed: {}", res.error());
    logger->flush();
    return EXIT_FAILURE;
  }

  SL_INFO(logger, "Demo finished");
  logger->flush();

  return EXIT_SUCCESS;
}

// NOLINTEND(cppcoreguidelines-pro-bounds-pointer-arithmetic)
