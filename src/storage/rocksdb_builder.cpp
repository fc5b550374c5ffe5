/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "storage/rocksdb_builder.hpp"

#include "utils/parsers.hpp"

namespace kvext::storage {

  RocksDbBuilder::RocksDbBuilder(qtils::SharedRef<log::LoggingSystem> logsys,
                                 qtils::SharedRef<app::Configuration> config,
                                 codec::CodecRegistry codecs)
      : logsys_{std::move(logsys)},
        config_{std::move(config)},
        codecs_{std::move(codecs)},
        pool_{BufferPool::shared()},
        logger_{logsys_->getLogger("RocksDbBuilder", "storage")} {}

  void RocksDbBuilder::registerColumnFamily(
      const std::string &name,
      std::optional<merge::MergeOperatorConfig> merge_operator) {
    for (const auto &family : column_families_) {
      if (util::iequals(family.name, name)) {
        SL_CRITICAL(logger_,
                    "Column family '{}' is already registered as '{}'",
                    name,
                    family.name);
        qtils::raise(BuilderError::COLUMN_FAMILY_ALREADY_REGISTERED);
      }
    }
    column_families_.emplace_back(ColumnFamilyConfig{
        .name = name,
        .merge_operator = std::move(merge_operator),
    });
  }

  void RocksDbBuilder::registerStore(std::type_index store,
                                     StoreFactory factory) {
    for (const auto &[type, _] : stores_) {
      if (type == store) {
        SL_CRITICAL(logger_, "Store {} is already registered", store.name());
        qtils::raise(BuilderError::STORE_ALREADY_REGISTERED);
      }
    }
    stores_.emplace_back(store, std::move(factory));
  }

  log::Logger RocksDbBuilder::accessorLogger() const {
    return logsys_->getLogger("RocksDbAccessor", "storage");
  }

  log::Logger RocksDbBuilder::mergeLogger() const {
    return logsys_->getLogger("MergeOperator", "storage");
  }

  std::shared_ptr<RocksDbContext> RocksDbBuilder::build() {
    auto db = std::make_shared<RocksDb>(logsys_, config_, column_families_);

    RocksDbContext::Stores stores;
    for (const auto &[type, factory] : stores_) {
      stores.emplace(type, factory(*db));
    }
    SL_INFO(logger_,
            "Database opened with {} store(s) in {} column family(ies)",
            stores.size(),
            column_families_.size());
    return std::make_shared<RocksDbContext>(std::move(db), std::move(stores));
  }

}  // namespace kvext::storage
