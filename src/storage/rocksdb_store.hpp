/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <memory>

#include "storage/rocksdb_accessor.hpp"

namespace kvext::storage {

  /**
   * @class RocksDbStoreBase
   * @brief Operations shared by all stores; application stores derive from
   * RocksDbStore or MergeableRocksDbStore and add domain methods on top.
   */
  template <typename K, typename V>
  class RocksDbStoreBase {
   public:
    using KeyType = K;
    using ValueType = V;

    virtual ~RocksDbStoreBase() = default;

    outcome::result<void> put(const K &key, const V &value) {
      return accessor_->put(key, value);
    }

    outcome::result<std::optional<V>> tryGet(const K &key) const {
      return accessor_->tryGet(key);
    }

    outcome::result<bool> hasKey(const K &key) const {
      return accessor_->hasKey(key);
    }

    outcome::result<void> remove(const K &key) {
      return accessor_->remove(key);
    }

    outcome::result<void> putRange(std::span<const K> keys,
                                   std::span<const V> values) {
      return accessor_->putRange(keys, values);
    }

    outcome::result<void> putRange(
        std::span<const V> values,
        const std::function<K(const V &)> &key_selector) {
      return accessor_->putRange(values, key_selector);
    }

    outcome::result<void> putRange(std::span<const std::pair<K, V>> items) {
      return accessor_->putRange(items);
    }

    outcome::result<std::vector<K>> getAllKeys() const {
      return accessor_->getAllKeys();
    }

    outcome::result<std::vector<V>> getAllValues() const {
      return accessor_->getAllValues();
    }

    outcome::result<size_t> count() const {
      return accessor_->count();
    }

    /// Drops all entries of the column family
    outcome::result<void> clear() {
      return accessor_->clear();
    }

   protected:
    explicit RocksDbStoreBase(std::shared_ptr<RocksDbAccessor<K, V>> accessor)
        : accessor_{std::move(accessor)} {}

   private:
    std::shared_ptr<RocksDbAccessor<K, V>> accessor_;
  };

  /// Plain key-value store
  template <typename K, typename V>
  class RocksDbStore : public RocksDbStoreBase<K, V> {
   public:
    using AccessorType = RocksDbAccessor<K, V>;

    explicit RocksDbStore(std::shared_ptr<AccessorType> accessor)
        : RocksDbStoreBase<K, V>{std::move(accessor)} {}

    outcome::result<std::vector<V>> getAll() const {
      return this->getAllValues();
    }
  };

}  // namespace kvext::storage
