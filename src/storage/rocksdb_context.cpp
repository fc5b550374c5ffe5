/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "storage/rocksdb_context.hpp"

namespace kvext::storage {

  RocksDbContext::RocksDbContext(std::shared_ptr<RocksDb> db, Stores stores)
      : db_{std::move(db)}, stores_{std::move(stores)} {}

}  // namespace kvext::storage
