/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "log/logger.hpp"

#include <iostream>

#include <boost/assert.hpp>
#include <soralog/impl/configurator_from_yaml.hpp>

OUTCOME_CPP_DEFINE_CATEGORY(kvext::log, Error, e) {
  using E = kvext::log::Error;
  switch (e) {
    case E::CONFIGURATION_FAILED:
      return "Logging system can't be configured";
  }
  BOOST_UNREACHABLE_RETURN("Unknown log::Error");
}

namespace kvext::log {

  LoggingSystem::LoggingSystem(
      std::shared_ptr<soralog::LoggingSystem> logging_system)
      : logging_system_(std::move(logging_system)) {}

  outcome::result<std::shared_ptr<LoggingSystem>> LoggingSystem::fromYaml(
      const YAML::Node &config) {
    if (not config.IsDefined()) {
      std::cerr << "Logging config is not defined\n";
      return Error::CONFIGURATION_FAILED;
    }

    auto configurator = std::make_shared<soralog::ConfiguratorFromYAML>(
        std::shared_ptr<soralog::Configurator>(nullptr), config);

    auto logging_system =
        std::make_shared<soralog::LoggingSystem>(std::move(configurator));

    auto result = logging_system->configure();
    if (not result.message.empty()) {
      (result.has_error ? std::cerr : std::cout) << result.message << '\n';
    }
    if (result.has_error) {
      return Error::CONFIGURATION_FAILED;
    }

    return std::make_shared<LoggingSystem>(std::move(logging_system));
  }

}  // namespace kvext::log
