/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <memory>
#include <typeindex>

#include <boost/container/flat_map.hpp>
#include <qtils/outcome.hpp>

#include "storage/builder_error.hpp"
#include "storage/rocksdb/rocksdb.hpp"

namespace kvext::storage {

  /**
   * @class RocksDbContext
   * @brief Opened database together with the stores registered for it.
   *
   * Stores stay usable while the context lives; afterwards their
   * operations fail with StorageError::STORAGE_GONE.
   */
  class RocksDbContext {
   public:
    using Stores =
        boost::container::flat_map<std::type_index, std::shared_ptr<void>>;

    RocksDbContext(std::shared_ptr<RocksDb> db, Stores stores);

    /// @return store registered as @tparam Store
    template <typename Store>
    outcome::result<std::shared_ptr<Store>> store() const {
      auto it = stores_.find(std::type_index(typeid(Store)));
      if (it == stores_.end()) {
        return BuilderError::STORE_NOT_REGISTERED;
      }
      return std::static_pointer_cast<Store>(it->second);
    }

    RocksDb &db() const {
      return *db_;
    }

   private:
    std::shared_ptr<RocksDb> db_;
    Stores stores_;
  };

}  // namespace kvext::storage
