/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <qtils/enum_error_code.hpp>

namespace kvext::storage {

  enum class BuilderError : uint8_t {
    COLUMN_FAMILY_ALREADY_REGISTERED = 1,
    STORE_ALREADY_REGISTERED,
    STORE_NOT_REGISTERED,
  };

}  // namespace kvext::storage

OUTCOME_HPP_DECLARE_ERROR(kvext::storage, BuilderError);
