/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "storage/merge_accessor.hpp"
#include "storage/rocksdb_store.hpp"

namespace kvext::storage {

  /**
   * @class MergeableRocksDbStore
   * @brief Store whose column family has a merge operator.
   *
   * A counter store looks like:
   * @code
   * class CounterStore
   *     : public MergeableRocksDbStore<std::string, int64_t, int64_t> {
   *  public:
   *   using MergeableRocksDbStore::MergeableRocksDbStore;
   *   auto increment(const std::string &key, int64_t delta = 1) {
   *     return merge(key, delta);
   *   }
   * };
   * @endcode
   */
  template <typename K, typename V, typename O>
  class MergeableRocksDbStore : public RocksDbStoreBase<K, V> {
   public:
    using AccessorType = MergeAccessor<K, V, O>;
    using OperandType = O;

    explicit MergeableRocksDbStore(std::shared_ptr<AccessorType> accessor)
        : RocksDbStoreBase<K, V>{accessor},
          merge_accessor_{std::move(accessor)} {}

    outcome::result<void> merge(const K &key, const O &operand) {
      return merge_accessor_->merge(key, operand);
    }

   private:
    std::shared_ptr<AccessorType> merge_accessor_;
  };

}  // namespace kvext::storage
