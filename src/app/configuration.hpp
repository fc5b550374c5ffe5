/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <cstdint>
#include <filesystem>

namespace kvext::app {

  /// Resolved settings of the process; filled by Configurator
  class Configuration {
   public:
    struct DatabaseConfig {
      std::filesystem::path directory = "db";
      /// memory budget split between column families
      uint64_t cache_size = 512ull << 20;  // 512MiB
      /// destroy the database found at directory before opening
      bool delete_existing_on_startup = false;
      bool use_direct_reads = false;
      bool use_direct_io_for_flush_and_compaction = false;
      bool disable_wal = false;
      /// flush() blocks until memtables are written
      bool wait_for_flush = true;
    };

    Configuration() = default;
    virtual ~Configuration() = default;

    [[nodiscard]] virtual const DatabaseConfig &database() const;

   private:
    friend class Configurator;  // for external configure

    DatabaseConfig database_;
  };

}  // namespace kvext::app
