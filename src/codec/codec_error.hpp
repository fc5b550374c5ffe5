/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <qtils/enum_error_code.hpp>

namespace kvext::codec {

  /**
   * @brief Errors of codec resolution.
   *
   * All of them are configuration errors and are reported when a store is
   * registered, never on a read or write path.
   */
  enum class CodecError : uint8_t {
    NOT_REGISTERED = 1,    ///< no codec registered for the requested type
    NOT_FIXED_WIDTH,       ///< scalar element codec is not fixed-width
  };

}  // namespace kvext::codec

OUTCOME_HPP_DECLARE_ERROR(kvext::codec, CodecError);
