/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "storage/rocksdb/column_family.hpp"

#include "storage/rocksdb/rocksdb_util.hpp"

namespace kvext::storage {

  ColumnFamily::ColumnFamily(std::string name,
                             rocksdb::ColumnFamilyOptions options,
                             rocksdb::ColumnFamilyHandle *handle)
      : name_{std::move(name)}, options_{std::move(options)}, handle_{handle} {}

  ColumnFamily::SharedHandle ColumnFamily::acquire() const {
    return SharedHandle{mutex_, handle_};
  }

  outcome::result<void> ColumnFamily::recreate(rocksdb::DB &db,
                                               const log::Logger &logger) {
    std::unique_lock lock{mutex_};

    if (handle_ != nullptr) {
      auto status = db.DropColumnFamily(handle_);
      if (not status.ok()) {
        SL_ERROR(logger,
                 "Can't drop column family '{}': {}",
                 name_,
                 status.ToString());
        return status_as_error(status, logger);
      }
      status = db.DestroyColumnFamilyHandle(handle_);
      handle_ = nullptr;
      if (not status.ok()) {
        SL_ERROR(logger,
                 "Can't destroy handle of column family '{}': {}",
                 name_,
                 status.ToString());
        return status_as_error(status, logger);
      }
    }

    auto status = db.CreateColumnFamily(options_, name_, &handle_);
    if (not status.ok()) {
      SL_ERROR(logger,
               "Can't create column family '{}': {}",
               name_,
               status.ToString());
      handle_ = nullptr;
      return status_as_error(status, logger);
    }
    SL_DEBUG(logger, "Column family '{}' recreated", name_);
    return outcome::success();
  }

  void ColumnFamily::close(rocksdb::DB &db, const log::Logger &logger) {
    std::unique_lock lock{mutex_};
    if (handle_ == nullptr) {
      return;
    }
    auto status = db.DestroyColumnFamilyHandle(handle_);
    if (not status.ok()) {
      SL_ERROR(logger,
               "Can't destroy handle of column family '{}': {}",
               name_,
               status.ToString());
    }
    handle_ = nullptr;
  }

}  // namespace kvext::storage
