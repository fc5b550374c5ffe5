/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "storage/rocksdb/rocksdb.hpp"

#include <algorithm>
#include <limits>
#include <unordered_set>

#include <qtils/error_throw.hpp>
#include <rocksdb/filter_policy.h>
#include <rocksdb/table.h>
#include <soralog/macro.hpp>

#include "app/configuration.hpp"
#include "storage/rocksdb/rocksdb_batch.hpp"
#include "storage/rocksdb/rocksdb_cursor.hpp"
#include "storage/rocksdb/rocksdb_util.hpp"
#include "storage/storage_error.hpp"
#include "utils/fd_limit.hpp"

namespace kvext::storage {
  namespace fs = std::filesystem;

  namespace {
    rocksdb::ColumnFamilyOptions configureColumn(
        uint64_t memory_budget,
        const std::shared_ptr<rocksdb::TableFactory> &table_factory) {
      rocksdb::ColumnFamilyOptions options;
      options.OptimizeLevelStyleCompaction(memory_budget);
      options.table_factory = table_factory;
      return options;
    }
  }  // namespace

  RocksDb::RocksDb(qtils::SharedRef<log::LoggingSystem> logsys,
                   qtils::SharedRef<app::Configuration> app_config,
                   std::vector<ColumnFamilyConfig> column_families)
      : logger_(logsys->getLogger("RocksDB", "storage")) {
    ro_.fill_cache = false;

    const auto &config = app_config->database();
    const auto &path = config.directory;

    wo_.disableWAL = config.disable_wal;
    fo_.wait = config.wait_for_flush;

    std::shared_ptr<rocksdb::TableFactory> table_factory{
        rocksdb::NewBlockBasedTableFactory(tableOptionsConfiguration())};

    auto options = rocksdb::Options{};
    options.create_if_missing = true;
    options.create_missing_column_families = true;
    options.optimize_filters_for_hits = true;
    options.use_direct_reads = config.use_direct_reads;
    options.use_direct_io_for_flush_and_compaction =
        config.use_direct_io_for_flush_and_compaction;
    options.table_factory = table_factory;

    // Setting limit for open rocksdb files to a half of system soft limit
    auto soft_limit = getFdLimit(logger_);
    if (!soft_limit) {
      SL_CRITICAL(logger_, "Call getrlimit(RLIMIT_NOFILE) was failed");
      qtils::raise(StorageError::UNKNOWN);
    }
    options.max_open_files = static_cast<int>(std::min<size_t>(
        soft_limit.value() / 2, std::numeric_limits<int>::max()));

    if (config.delete_existing_on_startup) {
      qtils::raise_on_err(destroyDatabase(options, path, logger_));
    }

    std::error_code ec;
    create_directories(path, ec);
    if (ec) {
      SL_CRITICAL(logger_, "Can't create DB directory: {}", ec.message());
      qtils::raise(ec);
    }

    if (auto res = createDirectory(path, logger_); res.has_error()) {
      SL_CRITICAL(logger_,
                  "Can't create DB directory ({}): {}",
                  path.native(),
                  res.error());
      qtils::raise(res.error());
    }

    std::vector<std::string> existing_families;
    auto res = rocksdb::DB::ListColumnFamilies(
        options, path.native(), &existing_families);
    if (not res.ok() and not res.IsPathNotFound()) {
      SL_ERROR(logger_,
               "Can't list column families in {}: {}",
               path.native(),
               res.ToString());
      qtils::raise(status_as_error(res, logger_));
    }

    std::unordered_set<std::string> requested_families{
        rocksdb::kDefaultColumnFamilyName};
    for (const auto &family : column_families) {
      requested_families.insert(family.name);
    }

    std::vector<std::string> obsolete_families;
    for (auto &existing_family : existing_families) {
      if (not requested_families.contains(existing_family)) {
        SL_WARN(logger_,
                "Column family '{}' present in database but not used; "
                "Probably obsolete.",
                existing_family);
        obsolete_families.emplace_back(existing_family);
      }
    }

    if (not std::ranges::any_of(column_families, [](const auto &family) {
          return family.name == rocksdb::kDefaultColumnFamilyName;
        })) {
      column_families.insert(
          column_families.begin(),
          ColumnFamilyConfig{.name = rocksdb::kDefaultColumnFamilyName});
    }

    const auto memory_budget = config.cache_size;
    const auto families_count =
        column_families.size() + obsolete_families.size();
    const uint64_t family_budget = memory_budget / families_count;

    std::vector<rocksdb::ColumnFamilyDescriptor> column_family_descriptors;
    for (const auto &family : column_families) {
      auto column_options = configureColumn(family_budget, table_factory);
      if (family.merge_operator.has_value()) {
        column_options.merge_operator = family.merge_operator->merge_operator;
      }
      column_family_descriptors.emplace_back(family.name, column_options);
      SL_DEBUG(logger_,
               "Column family '{}' configured with cache_size={:.0f}Mb, "
               "merge_operator={}",
               family.name,
               static_cast<double>(family_budget) / 1024.0 / 1024.0,
               family.merge_operator.has_value()
                   ? family.merge_operator->name
                   : std::string{"none"});
    }
    for (const auto &family : obsolete_families) {
      column_family_descriptors.emplace_back(
          family, configureColumn(family_budget, table_factory));
    }

    qtils::raise_on_err(openDatabase(options, path, column_family_descriptors));

    // Print size of each column family
    SL_VERBOSE(logger_, "Current column family sizes:");
    for (const auto &[name, column] : column_families_) {
      auto handle = column->acquire();
      std::string size_str;
      if (db_->GetProperty(
              handle.get(), "rocksdb.estimate-live-data-size", &size_str)) {
        uint64_t size_bytes = std::stoull(size_str);
        double size_mb = static_cast<double>(size_bytes) / 1024.0 / 1024.0;
        SL_VERBOSE(logger_, "  - {}: {:.2f} Mb", name, size_mb);
      } else {
        SL_WARN(logger_, "Failed to get size of column family '{}'", name);
      }
    }
  }

  RocksDb::~RocksDb() {
    if (db_ == nullptr) {
      return;
    }
    for (auto &[_, column] : column_families_) {
      column->close(*db_, logger_);
    }
    auto status = db_->Close();
    if (not status.ok()) {
      SL_ERROR(logger_, "Can't close database: {}", status.ToString());
    }
    delete db_;
  }

  outcome::result<void> RocksDb::createDirectory(
      const std::filesystem::path &absolute_path, log::Logger &log) {
    std::error_code ec;
    if (not fs::create_directory(absolute_path.native(), ec) and ec.value()) {
      SL_ERROR(log,
               "Can't create directory {} for database: {}",
               absolute_path.native(),
               ec.message());
      return StorageError::IO_ERROR;
    }
    if (not fs::is_directory(absolute_path.native())) {
      SL_ERROR(log,
               "Can't open {} for database: is not a directory",
               absolute_path.native());
      return StorageError::IO_ERROR;
    }
    return outcome::success();
  }

  outcome::result<void> RocksDb::destroyDatabase(
      const rocksdb::Options &options,
      const std::filesystem::path &path,
      log::Logger &log) {
    if (not fs::exists(path)) {
      return outcome::success();
    }
    SL_INFO(log, "Deleting existing database in {}", path.native());
    const auto status = rocksdb::DestroyDB(path.native(), options);
    if (not status.ok()) {
      SL_ERROR(log,
               "Can't delete database in {}: {}",
               path.native(),
               status.ToString());
      return status_as_error(status, log);
    }
    return outcome::success();
  }

  outcome::result<void> RocksDb::openDatabase(
      const rocksdb::Options &options,
      const std::filesystem::path &path,
      const std::vector<rocksdb::ColumnFamilyDescriptor>
          &column_family_descriptors) {
    std::vector<rocksdb::ColumnFamilyHandle *> handles;
    const auto status = rocksdb::DB::Open(options,
                                          path.native(),
                                          column_family_descriptors,
                                          &handles,
                                          &db_);
    if (not status.ok()) {
      SL_ERROR(logger_,
               "Can't open database in {}: {}",
               path.native(),
               status.ToString());
      return status_as_error(status, logger_);
    }

    for (size_t i = 0; i < handles.size(); ++i) {
      const auto &descriptor = column_family_descriptors[i];
      column_families_.emplace(
          descriptor.name,
          std::make_shared<ColumnFamily>(
              descriptor.name, descriptor.options, handles[i]));
    }
    return outcome::success();
  }

  std::shared_ptr<BufferStorage> RocksDb::getSpace(std::string_view name) {
    std::lock_guard lock{spaces_mutex_};
    if (auto it = spaces_.find(name); it != spaces_.end()) {
      return it->second;
    }
    auto column = column_families_.find(name);
    if (column == column_families_.end()) {
      SL_ERROR(logger_, "Column family '{}' is not opened", name);
      qtils::raise(StorageError::COLUMN_FAMILY_NOT_FOUND);
    }
    auto space_ptr = std::make_shared<RocksDbSpace>(
        weak_from_this(), column->second, logger_);
    spaces_.emplace(std::string{name}, space_ptr);
    return space_ptr;
  }

  outcome::result<void> RocksDb::flush() {
    for (const auto &[name, column] : column_families_) {
      auto handle = column->acquire();
      if (handle.get() == nullptr) {
        continue;
      }
      auto status = db_->Flush(fo_, handle.get());
      if (not status.ok()) {
        SL_ERROR(logger_,
                 "Can't flush column family '{}': {}",
                 name,
                 status.ToString());
        return status_as_error(status, logger_);
      }
    }
    return outcome::success();
  }

  rocksdb::BlockBasedTableOptions RocksDb::tableOptionsConfiguration(
      uint32_t lru_cache_size_mib, uint32_t block_size_kib) {
    rocksdb::BlockBasedTableOptions table_options;
    table_options.format_version = 5;
    table_options.block_cache = rocksdb::NewLRUCache(
        static_cast<uint64_t>(lru_cache_size_mib) * 1024 * 1024);
    table_options.block_size = static_cast<size_t>(block_size_kib) * 1024;
    table_options.cache_index_and_filter_blocks = true;
    table_options.filter_policy.reset(rocksdb::NewBloomFilterPolicy(10, false));
    return table_options;
  }

  RocksDbSpace::RocksDbSpace(std::weak_ptr<RocksDb> storage,
                             std::shared_ptr<ColumnFamily> column,
                             log::Logger logger)
      : storage_{std::move(storage)},
        column_{std::move(column)},
        logger_{std::move(logger)} {}

  std::unique_ptr<BufferBatch> RocksDbSpace::batch() {
    return std::make_unique<RocksDbBatch>(*this, logger_);
  }

  std::unique_ptr<RocksDbSpace::Cursor> RocksDbSpace::cursor() {
    auto rocks = storage_.lock();
    if (!rocks) {
      qtils::raise(StorageError::STORAGE_GONE);
    }
    auto handle = column_->acquire();
    if (handle.get() == nullptr) {
      qtils::raise(StorageError::COLUMN_FAMILY_NOT_FOUND);
    }
    auto it = std::unique_ptr<rocksdb::Iterator>(
        rocks->db_->NewIterator(rocks->ro_, handle.get()));
    return std::make_unique<RocksDBCursor>(
        std::move(rocks), std::move(it), logger_);
  }

  outcome::result<std::optional<std::string>> RocksDbSpace::read(
      const BytesIn &key) const {
    OUTCOME_TRY(rocks, use());
    auto handle = column_->acquire();
    if (handle.get() == nullptr) {
      return StorageError::COLUMN_FAMILY_NOT_FOUND;
    }
    std::string value;
    auto status =
        rocks->db_->Get(rocks->ro_, handle.get(), make_slice(key), &value);
    if (status.ok()) {
      return std::make_optional(std::move(value));
    }

    if (status.IsNotFound()) {
      return std::nullopt;
    }

    if (is_merge_failure(status)) {
      SL_WARN(logger_,
              "Merge of key {} in '{}' failed; key is treated as absent",
              toHex(make_slice(key)),
              name());
      return std::nullopt;
    }

    return status_as_error(status, logger_);
  }

  outcome::result<bool> RocksDbSpace::contains(const BytesIn &key) const {
    OUTCOME_TRY(value, read(key));
    return value.has_value();
  }

  outcome::result<ByteVec> RocksDbSpace::get(const BytesIn &key) const {
    OUTCOME_TRY(value, read(key));
    if (not value.has_value()) {
      return StorageError::NOT_FOUND;
    }
    return make_buffer(value.value());
  }

  outcome::result<std::optional<ByteVec>> RocksDbSpace::tryGet(
      const BytesIn &key) const {
    OUTCOME_TRY(value, read(key));
    if (not value.has_value()) {
      return std::nullopt;
    }
    return std::make_optional(make_buffer(value.value()));
  }

  outcome::result<void> RocksDbSpace::put(const BytesIn &key,
                                          const BytesIn &value) {
    OUTCOME_TRY(rocks, use());
    auto handle = column_->acquire();
    if (handle.get() == nullptr) {
      return StorageError::COLUMN_FAMILY_NOT_FOUND;
    }
    auto status = rocks->db_->Put(
        rocks->wo_, handle.get(), make_slice(key), make_slice(value));
    if (status.ok()) {
      return outcome::success();
    }

    return status_as_error(status, logger_);
  }

  outcome::result<void> RocksDbSpace::remove(const BytesIn &key) {
    OUTCOME_TRY(rocks, use());
    auto handle = column_->acquire();
    if (handle.get() == nullptr) {
      return StorageError::COLUMN_FAMILY_NOT_FOUND;
    }
    auto status =
        rocks->db_->Delete(rocks->wo_, handle.get(), make_slice(key));
    if (status.ok()) {
      return outcome::success();
    }

    return status_as_error(status, logger_);
  }

  outcome::result<void> RocksDbSpace::merge(const BytesIn &key,
                                            const BytesIn &operand) {
    OUTCOME_TRY(rocks, use());
    auto handle = column_->acquire();
    if (handle.get() == nullptr) {
      return StorageError::COLUMN_FAMILY_NOT_FOUND;
    }
    auto status = rocks->db_->Merge(
        rocks->wo_, handle.get(), make_slice(key), make_slice(operand));
    if (status.ok()) {
      return outcome::success();
    }

    return status_as_error(status, logger_);
  }

  outcome::result<void> RocksDbSpace::clear() {
    OUTCOME_TRY(rocks, use());
    return column_->recreate(*rocks->db_, logger_);
  }

  outcome::result<std::shared_ptr<RocksDb>> RocksDbSpace::use() const {
    auto rocks = storage_.lock();
    if (!rocks) {
      return StorageError::STORAGE_GONE;
    }
    return rocks;
  }

}  // namespace kvext::storage
