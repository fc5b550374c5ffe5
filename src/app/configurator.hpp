/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <filesystem>
#include <optional>
#include <sstream>

#include <qtils/enum_error_code.hpp>
#include <qtils/outcome.hpp>
#include <qtils/shared_ref.hpp>
#include <yaml-cpp/yaml.h>

namespace soralog {
  class Logger;
}  // namespace soralog

namespace kvext::app {
  class Configuration;
}  // namespace kvext::app

namespace kvext::app {

  /**
   * Builds Configuration out of an optional YAML file. Without a file every
   * setting keeps its default.
   *
   * Expected layout:
   * @code
   * database:
   *   path: /var/lib/app/db
   *   cache_size: 512Mb
   *   delete_existing_on_startup: false
   *   use_direct_reads: true
   *   use_direct_io_for_flush_and_compaction: true
   *   disable_wal: false
   *   wait_for_flush: true
   * logging:
   *   # soralog configuration
   * @endcode
   */
  class Configurator final {
   public:
    enum class Error : uint8_t {
      ConfigFileParseFailed = 1,
      InvalidValue,
    };

    Configurator() = delete;
    Configurator(Configurator &&) noexcept = delete;
    Configurator(const Configurator &) = delete;
    ~Configurator() = default;
    Configurator &operator=(Configurator &&) noexcept = delete;
    Configurator &operator=(const Configurator &) = delete;

    explicit Configurator(std::optional<std::filesystem::path> config_path);

    /// Reads and parses the config file, if any
    outcome::result<void> loadConfigFile();

    /// 'logging' section of the file, or the built-in default
    outcome::result<YAML::Node> getLoggingConfig();

    outcome::result<std::shared_ptr<Configuration>> calculateConfig(
        qtils::SharedRef<soralog::Logger> logger);

   private:
    outcome::result<void> initDatabaseConfig();

    std::optional<std::filesystem::path> config_path_;

    std::shared_ptr<Configuration> config_;
    std::shared_ptr<soralog::Logger> logger_;

    std::optional<YAML::Node> config_file_;
    bool file_has_error_ = false;
    std::ostringstream file_errors_;
  };

}  // namespace kvext::app

OUTCOME_HPP_DECLARE_ERROR(kvext::app, Configurator::Error);
