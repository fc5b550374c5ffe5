/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <rocksdb/iterator.h>

#include "storage/rocksdb/rocksdb.hpp"

namespace kvext::storage {

  class RocksDBCursor : public BufferStorageCursor {
   public:
    ~RocksDBCursor() override = default;

    RocksDBCursor(std::shared_ptr<RocksDb> rocks,
                  std::unique_ptr<rocksdb::Iterator> it,
                  log::Logger logger);

    outcome::result<bool> seekFirst() override;

    outcome::result<bool> seek(const BytesIn &key) override;

    outcome::result<bool> seekLast() override;

    bool isValid() const override;

    outcome::result<void> next() override;

    outcome::result<void> prev() override;

    std::optional<ByteVec> key() const override;

    std::optional<ByteVec> value() const override;

   private:
    outcome::result<bool> positioned() const;

    // iterator must go before the database
    std::shared_ptr<RocksDb> rocks_;
    std::unique_ptr<rocksdb::Iterator> i_;
    log::Logger logger_;
  };

}  // namespace kvext::storage
