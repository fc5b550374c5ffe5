/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <functional>
#include <memory>
#include <string>
#include <typeindex>
#include <vector>

#include <qtils/error_throw.hpp>
#include <qtils/shared_ref.hpp>

#include "codec/codec_registry.hpp"
#include "log/logger.hpp"
#include "merge/collection_operation_codec.hpp"
#include "merge/merge_operator.hpp"
#include "merge/merge_operator_config.hpp"
#include "storage/buffer_pool.hpp"
#include "storage/mergeable_rocksdb_store.hpp"
#include "storage/rocksdb_context.hpp"
#include "storage/rocksdb_store.hpp"

namespace kvext::app {
  class Configuration;
}

namespace kvext::storage {

  /**
   * @class RocksDbBuilder
   * @brief Collects stores, each bound to its own column family, and opens
   * the database with all of them.
   *
   * Registration errors (missing codec, column family name taken) are
   * configuration mistakes and are thrown from addStore() and
   * addMergeableStore() right away.
   *
   * @code
   * auto context = RocksDbBuilder{logsys, config}
   *                    .addStore<UsersStore>("users")
   *                    .addMergeableStore<CounterStore>(
   *                        "counters",
   *                        std::make_shared<merge::Int64AddMergeOperator>())
   *                    .build();
   * auto counters = context->store<CounterStore>().value();
   * @endcode
   */
  class RocksDbBuilder {
   public:
    RocksDbBuilder(
        qtils::SharedRef<log::LoggingSystem> logsys,
        qtils::SharedRef<app::Configuration> config,
        codec::CodecRegistry codecs = codec::CodecRegistry::withDefaults());

    /// Registry used to resolve codecs of stores added after this call
    codec::CodecRegistry &codecs() {
      return codecs_;
    }

    /**
     * Registers @tparam Store (derived from RocksDbStore) over the column
     * family @param column_family
     */
    template <typename Store>
    RocksDbBuilder &addStore(std::string column_family) {
      using K = typename Store::KeyType;
      using V = typename Store::ValueType;
      using Accessor = typename Store::AccessorType;

      auto key_codec = resolve<K>();
      auto value_codec = resolve<V>();
      registerColumnFamily(column_family, std::nullopt);
      registerStore(
          std::type_index(typeid(Store)),
          [this,
           column_family,
           key_codec = std::move(key_codec),
           value_codec = std::move(value_codec)](RocksDb &db) {
            auto accessor =
                std::make_shared<Accessor>(db.getSpace(column_family),
                                           key_codec,
                                           value_codec,
                                           pool_,
                                           accessorLogger());
            return std::static_pointer_cast<void>(
                std::make_shared<Store>(std::move(accessor)));
          });
      return *this;
    }

    /**
     * Registers @tparam Store (derived from MergeableRocksDbStore) over the
     * column family @param column_family, which gets @param merge_operator
     */
    template <typename Store>
    RocksDbBuilder &addMergeableStore(
        std::string column_family,
        std::shared_ptr<const merge::MergeOperator<
            typename Store::ValueType,
            typename Store::OperandType>> merge_operator) {
      using K = typename Store::KeyType;
      using V = typename Store::ValueType;
      using O = typename Store::OperandType;
      using Accessor = typename Store::AccessorType;

      auto key_codec = resolve<K>();
      auto value_codec = resolve<V>();
      auto operand_codec = resolve<O>();
      registerColumnFamily(
          column_family,
          merge::makeMergeOperatorConfig<V, O>(std::move(merge_operator),
                                               value_codec,
                                               operand_codec,
                                               mergeLogger()));
      registerStore(
          std::type_index(typeid(Store)),
          [this,
           column_family,
           key_codec = std::move(key_codec),
           value_codec = std::move(value_codec),
           operand_codec = std::move(operand_codec)](RocksDb &db) {
            auto accessor =
                std::make_shared<Accessor>(db.getSpace(column_family),
                                           key_codec,
                                           value_codec,
                                           operand_codec,
                                           pool_,
                                           accessorLogger());
            return std::static_pointer_cast<void>(
                std::make_shared<Store>(std::move(accessor)));
          });
      return *this;
    }

    /// Opens the database with every registered column family
    std::shared_ptr<RocksDbContext> build();

   private:
    using StoreFactory = std::function<std::shared_ptr<void>(RocksDb &)>;

    template <typename T>
    std::shared_ptr<const codec::Codec<T>> resolve() const {
      auto codec = codecs_.get<T>();
      if (codec.has_error()) {
        SL_CRITICAL(logger_,
                    "No codec for type {}: {}",
                    typeid(T).name(),
                    codec.error());
        qtils::raise(codec.error());
      }
      return std::move(codec.value());
    }

    void registerColumnFamily(
        const std::string &name,
        std::optional<merge::MergeOperatorConfig> merge_operator);

    void registerStore(std::type_index store, StoreFactory factory);

    log::Logger accessorLogger() const;
    log::Logger mergeLogger() const;

    qtils::SharedRef<log::LoggingSystem> logsys_;
    qtils::SharedRef<app::Configuration> config_;
    codec::CodecRegistry codecs_;
    std::shared_ptr<BufferPool> pool_;
    std::vector<ColumnFamilyConfig> column_families_;
    std::vector<std::pair<std::type_index, StoreFactory>> stores_;
    log::Logger logger_;
  };

}  // namespace kvext::storage
