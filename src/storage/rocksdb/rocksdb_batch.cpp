/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "storage/rocksdb/rocksdb_batch.hpp"

#include "storage/rocksdb/rocksdb_util.hpp"
#include "storage/storage_error.hpp"

namespace kvext::storage {

  RocksDbBatch::RocksDbBatch(RocksDbSpace &db, log::Logger logger)
      : db_(db), logger_(std::move(logger)) {}

  outcome::result<void> RocksDbBatch::put(const BytesIn &key,
                                          const BytesIn &value) {
    auto handle = db_.column_->acquire();
    if (handle.get() == nullptr) {
      return StorageError::COLUMN_FAMILY_NOT_FOUND;
    }
    auto status = batch_.Put(handle.get(), make_slice(key), make_slice(value));
    if (status.ok()) {
      return outcome::success();
    }
    return status_as_error(status, logger_);
  }

  outcome::result<void> RocksDbBatch::remove(const BytesIn &key) {
    auto handle = db_.column_->acquire();
    if (handle.get() == nullptr) {
      return StorageError::COLUMN_FAMILY_NOT_FOUND;
    }
    auto status = batch_.Delete(handle.get(), make_slice(key));
    if (status.ok()) {
      return outcome::success();
    }
    return status_as_error(status, logger_);
  }

  outcome::result<void> RocksDbBatch::commit() {
    auto rocks = db_.storage_.lock();
    if (!rocks) {
      return StorageError::STORAGE_GONE;
    }
    auto status = rocks->db_->Write(rocks->wo_, &batch_);
    if (status.ok()) {
      return outcome::success();
    }

    return status_as_error(status, logger_);
  }

  void RocksDbBatch::clear() {
    batch_.Clear();
  }
}  // namespace kvext::storage
