/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <filesystem>
#include <memory>
#include <mutex>
#include <string_view>
#include <vector>

#include <boost/container/flat_map.hpp>
#include <qtils/shared_ref.hpp>
#include <rocksdb/db.h>
#include <rocksdb/table.h>

#include "log/logger.hpp"
#include "storage/buffer_map_types.hpp"
#include "storage/rocksdb/column_family.hpp"
#include "utils/ctor_limiters.hpp"

namespace kvext::app {
  class Configuration;
}

namespace kvext::storage {

  class RocksDbSpace;

  /**
   * @class RocksDb
   * @brief RocksDB database with one column family per registered store.
   *
   * Column families are opened together with the database; merge operators
   * are bound to them at that moment and stay for the database lifetime.
   * Column families found on disk but not requested are opened with default
   * options and reported as probably obsolete.
   */
  class RocksDb : public std::enable_shared_from_this<RocksDb>,
                  NonCopyable,
                  NonMovable {
   public:
    RocksDb(qtils::SharedRef<log::LoggingSystem> logsys,
            qtils::SharedRef<app::Configuration> app_config,
            std::vector<ColumnFamilyConfig> column_families);

    ~RocksDb();

    static constexpr uint32_t kDefaultLruCacheSizeMiB = 512;
    static constexpr uint32_t kDefaultBlockSizeKiB = 32;

    /**
     * @return storage of the column family @param name
     * @throws StorageError::COLUMN_FAMILY_NOT_FOUND if it was not opened
     */
    std::shared_ptr<BufferStorage> getSpace(std::string_view name);

    /// Flushes memtables of all column families
    outcome::result<void> flush();

    /**
     * Prepare configuration structure
     * @param lru_cache_size_mib - LRU rocksdb cache in MiB
     * @param block_size_kib - internal rocksdb block size in KiB
     * @return options structure
     */
    static rocksdb::BlockBasedTableOptions tableOptionsConfiguration(
        uint32_t lru_cache_size_mib = kDefaultLruCacheSizeMiB,
        uint32_t block_size_kib = kDefaultBlockSizeKiB);

    friend class RocksDbSpace;
    friend class RocksDbBatch;

   private:
    static outcome::result<void> createDirectory(
        const std::filesystem::path &absolute_path, log::Logger &log);

    static outcome::result<void> destroyDatabase(
        const rocksdb::Options &options,
        const std::filesystem::path &path,
        log::Logger &log);

    outcome::result<void> openDatabase(
        const rocksdb::Options &options,
        const std::filesystem::path &path,
        const std::vector<rocksdb::ColumnFamilyDescriptor>
            &column_family_descriptors);

    rocksdb::DB *db_{};
    boost::container::flat_map<std::string,
                               std::shared_ptr<ColumnFamily>,
                               std::less<>>
        column_families_;
    std::mutex spaces_mutex_;
    boost::container::
        flat_map<std::string, std::shared_ptr<RocksDbSpace>, std::less<>>
            spaces_;
    rocksdb::ReadOptions ro_;
    rocksdb::WriteOptions wo_;
    rocksdb::FlushOptions fo_;
    log::Logger logger_;
  };

  /**
   * @class RocksDbSpace
   * @brief Byte-level storage over one column family.
   *
   * Every operation holds the column family shared for the duration of the
   * engine call; clear() holds it exclusively.
   */
  class RocksDbSpace : public BufferStorage {
   public:
    ~RocksDbSpace() override = default;

    RocksDbSpace(std::weak_ptr<RocksDb> storage,
                 std::shared_ptr<ColumnFamily> column,
                 log::Logger logger);

    const std::string &name() const {
      return column_->name();
    }

    std::unique_ptr<BufferBatch> batch() override;

    std::unique_ptr<Cursor> cursor() override;

    outcome::result<bool> contains(const BytesIn &key) const override;

    outcome::result<ByteVec> get(const BytesIn &key) const override;

    outcome::result<std::optional<ByteVec>> tryGet(
        const BytesIn &key) const override;

    outcome::result<void> put(const BytesIn &key,
                              const BytesIn &value) override;

    outcome::result<void> remove(const BytesIn &key) override;

    outcome::result<void> merge(const BytesIn &key,
                                const BytesIn &operand) override;

    outcome::result<void> clear() override;

    friend class RocksDbBatch;

   private:
    // gather storage instance from weak ptr
    outcome::result<std::shared_ptr<RocksDb>> use() const;

    // value of the key, std::nullopt if absent or if its merge failed
    outcome::result<std::optional<std::string>> read(const BytesIn &key) const;

    std::weak_ptr<RocksDb> storage_;
    std::shared_ptr<ColumnFamily> column_;
    log::Logger logger_;
  };
}  // namespace kvext::storage
