/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <qtils/enum_error_code.hpp>

namespace kvext::merge {

  /**
   * @brief Failures of a merge callback.
   *
   * They never reach the caller of a store operation: the callback reports
   * them to RocksDB as an unsuccessful merge.
   */
  enum class MergeError : uint8_t {
    OPERAND_DECODE_FAILED = 1,
    ALGEBRA_FAILED,
  };

}  // namespace kvext::merge

OUTCOME_HPP_DECLARE_ERROR(kvext::merge, MergeError);
