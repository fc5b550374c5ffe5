/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "app/configurator.hpp"

#include <filesystem>
#include <iostream>
#include <string>
#include <string_view>

#include <boost/assert.hpp>
#include <soralog/macro.hpp>

#include "app/configuration.hpp"
#include "utils/parsers.hpp"

OUTCOME_CPP_DEFINE_CATEGORY(kvext::app, Configurator::Error, e) {
  using E = kvext::app::Configurator::Error;
  switch (e) {
    case E::ConfigFileParseFailed:
      return "Config file parse failed";
    case E::InvalidValue:
      return "Result config has invalid values";
  }
  BOOST_UNREACHABLE_RETURN("Unknown Configurator::Error");
}

namespace kvext::app {

  namespace {
    constexpr std::string_view default_logging_yaml = R"yaml(
sinks:
  - name: console
    type: console
    stream: stdout
    thread: name
    color: true
    latency: 0
groups:
  - name: main
    sink: console
    level: info
    is_fallback: true
    children:
      - name: kvext
        children:
          - name: storage
)yaml";
  }  // namespace

  Configurator::Configurator(std::optional<std::filesystem::path> config_path)
      : config_path_(std::move(config_path)),
        config_(std::make_shared<Configuration>()) {}

  outcome::result<void> Configurator::loadConfigFile() {
    if (not config_path_.has_value()) {
      return outcome::success();
    }
    const auto &path = config_path_.value();
    if (not std::filesystem::is_regular_file(path)) {
      std::cerr << "Error: Config file " << path << " does not exist\n";
      return Error::ConfigFileParseFailed;
    }
    try {
      config_file_ = YAML::LoadFile(path.native());
    } catch (const std::exception &exception) {
      std::cerr << "Error: Can't parse file "
                << std::filesystem::weakly_canonical(path) << ": "
                << exception.what() << "\n";
      return Error::ConfigFileParseFailed;
    }
    return outcome::success();
  }

  outcome::result<YAML::Node> Configurator::getLoggingConfig() {
    auto load_default = [&]() -> outcome::result<YAML::Node> {
      try {
        return YAML::Load(std::string(default_logging_yaml));
      } catch (const std::exception &e) {
        file_errors_ << "E: Failed to load default logging config: " << e.what()
                     << "\n";
        return Error::ConfigFileParseFailed;
      }
    };

    if (not config_file_.has_value()) {
      return load_default();
    }
    auto logging = (*config_file_)["logging"];
    if (logging.IsDefined()) {
      return logging;
    }
    return load_default();
  }

  outcome::result<std::shared_ptr<Configuration>> Configurator::calculateConfig(
      qtils::SharedRef<soralog::Logger> logger) {
    logger_ = std::move(logger);
    OUTCOME_TRY(initDatabaseConfig());

    return config_;
  }

  outcome::result<void> Configurator::initDatabaseConfig() {
    auto read_flag = [&](const YAML::Node &section,
                         const char *name,
                         bool &target) {
      auto node = section[name];
      if (not node.IsDefined()) {
        return;
      }
      if (not node.IsScalar()) {
        file_errors_ << "E: Value 'database." << name << "' must be scalar\n";
        file_has_error_ = true;
        return;
      }
      try {
        target = node.as<bool>();
      } catch (const YAML::BadConversion &) {
        file_errors_ << "E: Bad 'database." << name
                     << "' value; Expected: true or false\n";
        file_has_error_ = true;
      }
    };

    // Init by config-file
    if (config_file_.has_value()) {
      auto section = (*config_file_)["database"];
      if (section.IsDefined()) {
        if (section.IsMap()) {
          auto path = section["path"];
          if (path.IsDefined()) {
            if (path.IsScalar()) {
              auto value = path.as<std::string>();
              config_->database_.directory = value;
            } else {
              file_errors_ << "E: Value 'database.path' must be scalar\n";
              file_has_error_ = true;
            }
          }
          auto cache_size = section["cache_size"];
          if (cache_size.IsDefined()) {
            if (cache_size.IsScalar()) {
              auto value =
                  util::parseByteQuantity(cache_size.as<std::string>());
              if (value.has_value()) {
                config_->database_.cache_size = value.value();
              } else {
                file_errors_ << "E: Bad 'cache_size' value; "
                                "Expected: 4096, 512Mb, 1G, etc.\n";
                file_has_error_ = true;
              }
            } else {
              file_errors_ << "E: Value 'database.cache_size' must be scalar\n";
              file_has_error_ = true;
            }
          }
          read_flag(section,
                    "delete_existing_on_startup",
                    config_->database_.delete_existing_on_startup);
          read_flag(section,
                    "use_direct_reads",
                    config_->database_.use_direct_reads);
          read_flag(section,
                    "use_direct_io_for_flush_and_compaction",
                    config_->database_.use_direct_io_for_flush_and_compaction);
          read_flag(section, "disable_wal", config_->database_.disable_wal);
          read_flag(
              section, "wait_for_flush", config_->database_.wait_for_flush);
        } else {
          file_errors_ << "E: Section 'database' defined, but is not map\n";
          file_has_error_ = true;
        }
      }
    }

    if (file_has_error_) {
      SL_ERROR(logger_,
               "Config file `{}` has some problems:",
               config_path_.value_or("").native());
      std::istringstream iss(file_errors_.str());
      std::string line;
      while (std::getline(iss, line)) {
        SL_ERROR(logger_, "  {}", std::string_view(line).substr(3));
      }
      return Error::ConfigFileParseFailed;
    }

    // Check values
    if (config_->database_.directory.empty()) {
      SL_ERROR(logger_, "Database path must not be empty");
      return Error::InvalidValue;
    }
    if (config_->database_.cache_size == 0) {
      SL_ERROR(logger_, "Database cache size must be positive");
      return Error::InvalidValue;
    }

    config_->database_.directory =
        std::filesystem::weakly_canonical(
            std::filesystem::absolute(config_->database_.directory));

    return outcome::success();
  }

}  // namespace kvext::app
