/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "app/configuration.hpp"

namespace kvext::app {

  const Configuration::DatabaseConfig &Configuration::database() const {
    return database_;
  }

}  // namespace kvext::app
