/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <stdexcept>

#include <log/logger.hpp>

namespace testutil {

  /**
   * Logging system shared by all tests of the binary: console sink, group
   * "testing" for the tests themselves and the kvext groups at @param level.
   * Supposed to be called in SetUpTestCase.
   */
  inline qtils::SharedRef<kvext::log::LoggingSystem> prepareLoggers(
      soralog::Level level = soralog::Level::INFO) {
    static qtils::SharedRef<kvext::log::LoggingSystem> logging_system = [] {
      auto res = kvext::log::LoggingSystem::fromYaml(YAML::Load(R"(
sinks:
  - name: console
    type: console
    capacity: 4
    latency: 0
groups:
  - name: main
    sink: console
    level: info
    is_fallback: true
    children:
      - name: testing
        level: trace
      - name: kvext
        children:
          - name: storage
)"));
      if (res.has_error()) {
        throw std::runtime_error("Cannot configure logging");
      }
      return res.value();
    }();

    std::ignore =
        logging_system->setLevelOfGroup(kvext::log::defaultGroupName, level);

    return logging_system;
  }

}  // namespace testutil
