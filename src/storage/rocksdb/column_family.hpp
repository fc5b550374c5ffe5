/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>

#include <qtils/outcome.hpp>
#include <rocksdb/db.h>
#include <rocksdb/options.h>

#include "log/logger.hpp"
#include "merge/merge_operator_config.hpp"
#include "utils/ctor_limiters.hpp"

namespace kvext::storage {

  /// Column family requested by a registered store
  struct ColumnFamilyConfig {
    std::string name;
    std::optional<merge::MergeOperatorConfig> merge_operator;
  };

  /**
   * @class ColumnFamily
   * @brief Owner of the live RocksDB handle of one column family.
   *
   * The handle is replaced when the column family is recreated. Users take
   * a SharedHandle for the duration of each engine call; recreation waits
   * for all of them and holds new ones off until it is done. Each column
   * family has its own lock, so clearing one does not stall the others.
   */
  class ColumnFamily : NonCopyable, NonMovable {
   public:
    /// Handle usable while this object lives
    class SharedHandle {
     public:
      SharedHandle(std::shared_mutex &mutex, rocksdb::ColumnFamilyHandle *handle)
          : lock_{mutex}, handle_{handle} {}

      /// nullptr if the column family is gone after a failed recreation
      rocksdb::ColumnFamilyHandle *get() const {
        return handle_;
      }

     private:
      std::shared_lock<std::shared_mutex> lock_;
      rocksdb::ColumnFamilyHandle *handle_;
    };

    ColumnFamily(std::string name,
                 rocksdb::ColumnFamilyOptions options,
                 rocksdb::ColumnFamilyHandle *handle);

    const std::string &name() const {
      return name_;
    }

    const rocksdb::ColumnFamilyOptions &options() const {
      return options_;
    }

    SharedHandle acquire() const;

    /**
     * Drops the column family with all its data and creates an empty one
     * with the same name and options (merge operator included)
     */
    outcome::result<void> recreate(rocksdb::DB &db, const log::Logger &logger);

    /// Releases the handle on database shutdown
    void close(rocksdb::DB &db, const log::Logger &logger);

   private:
    std::string name_;
    rocksdb::ColumnFamilyOptions options_;
    mutable std::shared_mutex mutex_;
    rocksdb::ColumnFamilyHandle *handle_;
  };

}  // namespace kvext::storage
