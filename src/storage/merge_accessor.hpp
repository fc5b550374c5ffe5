/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "storage/rocksdb_accessor.hpp"

namespace kvext::storage {

  /**
   * @class MergeAccessor
   * @brief Accessor of a column family with a merge operator whose operand
   * type may differ from the stored value type.
   *
   * @tparam K key type
   * @tparam V stored value type
   * @tparam O operand type
   */
  template <typename K, typename V, typename O>
  class MergeAccessor : public RocksDbAccessor<K, V> {
   public:
    using OperandType = O;

    MergeAccessor(std::shared_ptr<BufferStorage> storage,
                  std::shared_ptr<const codec::Codec<K>> key_codec,
                  std::shared_ptr<const codec::Codec<V>> value_codec,
                  std::shared_ptr<const codec::Codec<O>> operand_codec,
                  std::shared_ptr<BufferPool> pool,
                  log::Logger logger)
        : RocksDbAccessor<K, V>{std::move(storage),
                                std::move(key_codec),
                                std::move(value_codec),
                                std::move(pool),
                                std::move(logger)},
          operand_codec_{std::move(operand_codec)} {}

    /**
     * Queues @param operand for @param key. It is applied to the stored
     * value by the merge operator on the next read or compaction.
     */
    outcome::result<void> merge(const K &key, const O &operand) {
      EncodedBytes<K> key_bytes{*this->key_codec_, key, *this->pool_};
      EncodedBytes<O> operand_bytes{*operand_codec_, operand, *this->pool_};
      return this->storage_->merge(key_bytes.view(), operand_bytes.view());
    }

   private:
    std::shared_ptr<const codec::Codec<O>> operand_codec_;
  };

}  // namespace kvext::storage
