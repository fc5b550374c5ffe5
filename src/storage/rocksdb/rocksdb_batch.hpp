/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <rocksdb/write_batch.h>

#include "storage/rocksdb/rocksdb.hpp"

namespace kvext::storage {

  /**
   * Write batch over one column family. Writes recorded before the column
   * family was cleared make commit() fail.
   */
  class RocksDbBatch : public BufferBatch {
   public:
    ~RocksDbBatch() override = default;

    RocksDbBatch(RocksDbSpace &db, log::Logger logger);

    outcome::result<void> commit() override;

    void clear() override;

    outcome::result<void> put(const BytesIn &key,
                              const BytesIn &value) override;

    outcome::result<void> remove(const BytesIn &key) override;

   private:
    // NOLINTNEXTLINE(cppcoreguidelines-avoid-const-or-ref-data-members)
    RocksDbSpace &db_;
    log::Logger logger_;
    rocksdb::WriteBatch batch_;
  };
}  // namespace kvext::storage
