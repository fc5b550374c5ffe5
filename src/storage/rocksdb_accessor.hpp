/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <functional>
#include <memory>
#include <optional>
#include <span>
#include <utility>
#include <vector>

#include <qtils/outcome.hpp>

#include "codec/codec.hpp"
#include "log/logger.hpp"
#include "storage/buffer_map_types.hpp"
#include "storage/buffer_pool.hpp"
#include "storage/encoded_bytes.hpp"
#include "storage/storage_error.hpp"

namespace kvext::storage {

  /**
   * @class RocksDbAccessor
   * @brief Typed operations over the byte storage of one column family.
   *
   * Keys and values are encoded per call into buffers chosen by
   * EncodedBytes; nothing is kept between calls. Safe to use from many
   * threads at once.
   *
   * @tparam K key type
   * @tparam V value type
   */
  template <typename K, typename V>
  class RocksDbAccessor {
   public:
    using KeyType = K;
    using ValueType = V;

    RocksDbAccessor(std::shared_ptr<BufferStorage> storage,
                    std::shared_ptr<const codec::Codec<K>> key_codec,
                    std::shared_ptr<const codec::Codec<V>> value_codec,
                    std::shared_ptr<BufferPool> pool,
                    log::Logger logger)
        : storage_{std::move(storage)},
          key_codec_{std::move(key_codec)},
          value_codec_{std::move(value_codec)},
          pool_{std::move(pool)},
          logger_{std::move(logger)} {}

    virtual ~RocksDbAccessor() = default;

    outcome::result<void> put(const K &key, const V &value) {
      EncodedBytes<K> key_bytes{*key_codec_, key, *pool_};
      EncodedBytes<V> value_bytes{*value_codec_, value, *pool_};
      return storage_->put(key_bytes.view(), value_bytes.view());
    }

    /**
     * @return value of @param key, std::nullopt if the key is absent or the
     * merge of its operands failed
     */
    outcome::result<std::optional<V>> tryGet(const K &key) const {
      EncodedBytes<K> key_bytes{*key_codec_, key, *pool_};
      OUTCOME_TRY(bytes, storage_->tryGet(key_bytes.view()));
      if (not bytes.has_value()) {
        return std::nullopt;
      }
      return std::make_optional(value_codec_->read(bytes.value()));
    }

    outcome::result<bool> hasKey(const K &key) const {
      EncodedBytes<K> key_bytes{*key_codec_, key, *pool_};
      return storage_->contains(key_bytes.view());
    }

    outcome::result<void> remove(const K &key) {
      EncodedBytes<K> key_bytes{*key_codec_, key, *pool_};
      return storage_->remove(key_bytes.view());
    }

    /// Submits @param operand of the value type; the column family must have
    /// a merge operator over V
    outcome::result<void> merge(const K &key, const V &operand) {
      EncodedBytes<K> key_bytes{*key_codec_, key, *pool_};
      EncodedBytes<V> operand_bytes{*value_codec_, operand, *pool_};
      return storage_->merge(key_bytes.view(), operand_bytes.view());
    }

    /**
     * Writes keys[i] -> values[i] in one atomic batch
     * @return StorageError::INVALID_ARGUMENT if the spans differ in length
     */
    outcome::result<void> putRange(std::span<const K> keys,
                                   std::span<const V> values) {
      if (keys.size() != values.size()) {
        SL_ERROR(logger_,
                 "putRange: {} keys but {} values",
                 keys.size(),
                 values.size());
        return StorageError::INVALID_ARGUMENT;
      }
      auto batch = storage_->batch();
      for (size_t i = 0; i < keys.size(); ++i) {
        OUTCOME_TRY(addToBatch(*batch, keys[i], values[i]));
      }
      return batch->commit();
    }

    /// Writes each value under the key computed by @param key_selector
    outcome::result<void> putRange(
        std::span<const V> values,
        const std::function<K(const V &)> &key_selector) {
      auto batch = storage_->batch();
      for (const auto &value : values) {
        OUTCOME_TRY(addToBatch(*batch, key_selector(value), value));
      }
      return batch->commit();
    }

    outcome::result<void> putRange(std::span<const std::pair<K, V>> items) {
      auto batch = storage_->batch();
      for (const auto &[key, value] : items) {
        OUTCOME_TRY(addToBatch(*batch, key, value));
      }
      return batch->commit();
    }

    /// Keys in the byte order of their encodings
    outcome::result<std::vector<K>> getAllKeys() const {
      std::vector<K> keys;
      OUTCOME_TRY(forEach([&](const BufferStorageCursor &cursor) {
        keys.emplace_back(key_codec_->read(cursor.key().value()));
      }));
      return keys;
    }

    /// Values in the byte order of their keys' encodings
    outcome::result<std::vector<V>> getAllValues() const {
      std::vector<V> values;
      OUTCOME_TRY(forEach([&](const BufferStorageCursor &cursor) {
        values.emplace_back(value_codec_->read(cursor.value().value()));
      }));
      return values;
    }

    outcome::result<size_t> count() const {
      size_t count = 0;
      OUTCOME_TRY(forEach([&](const BufferStorageCursor &) { ++count; }));
      return count;
    }

    /// Removes all entries, keeping the merge operator of the column family
    outcome::result<void> clear() {
      return storage_->clear();
    }

   protected:
    std::shared_ptr<BufferStorage> storage_;
    std::shared_ptr<const codec::Codec<K>> key_codec_;
    std::shared_ptr<const codec::Codec<V>> value_codec_;
    std::shared_ptr<BufferPool> pool_;
    log::Logger logger_;

   private:
    outcome::result<void> addToBatch(BufferBatch &batch,
                                     const K &key,
                                     const V &value) const {
      EncodedBytes<K> key_bytes{*key_codec_, key, *pool_};
      EncodedBytes<V> value_bytes{*value_codec_, value, *pool_};
      return batch.put(key_bytes.view(), value_bytes.view());
    }

    template <typename F>
    outcome::result<void> forEach(const F &visit) const {
      auto cursor = storage_->cursor();
      OUTCOME_TRY(cursor->seekFirst());
      while (cursor->isValid()) {
        visit(*cursor);
        OUTCOME_TRY(cursor->next());
      }
      return outcome::success();
    }
  };

}  // namespace kvext::storage
