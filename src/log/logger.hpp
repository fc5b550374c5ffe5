/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <memory>
#include <string>

#include <qtils/enum_error_code.hpp>
#include <qtils/outcome.hpp>
#include <qtils/shared_ref.hpp>
#include <soralog/level.hpp>
#include <soralog/logger.hpp>
#include <soralog/logging_system.hpp>
#include <soralog/macro.hpp>
#include <yaml-cpp/yaml.h>

#include "utils/ctor_limiters.hpp"

namespace kvext::log {
  using soralog::Level;

  using Logger = qtils::SharedRef<soralog::Logger>;

  enum class Error : uint8_t { CONFIGURATION_FAILED = 1 };

  inline static std::string defaultGroupName{"kvext"};

  /**
   * Wrapper over soralog. Components take their loggers from here by name
   * and group; groups form the tree described by the logging config.
   */
  class LoggingSystem : NonCopyable, NonMovable {
   public:
    explicit LoggingSystem(
        std::shared_ptr<soralog::LoggingSystem> logging_system);

    /**
     * Builds and configures soralog from the YAML @param config (sinks and
     * groups). Configuration messages go to stdout, or to stderr on failure.
     */
    static outcome::result<std::shared_ptr<LoggingSystem>> fromYaml(
        const YAML::Node &config);

    [[nodiscard]]  //
    auto
    getLogger(const std::string &logger_name,
              const std::string &group_name) const {
      return logging_system_->getLogger(logger_name, group_name);
    }

    [[nodiscard]] bool setLevelOfGroup(const std::string &group_name,
                                       Level level) const {
      return logging_system_->setLevelOfGroup(group_name, level);
    }

   private:
    std::shared_ptr<soralog::LoggingSystem> logging_system_;
  };

}  // namespace kvext::log

OUTCOME_HPP_DECLARE_ERROR(kvext::log, Error);
