/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <qtils/enum_error_code.hpp>

namespace kvext::storage {

  /// Failures of database operations; most mirror rocksdb::Status codes
  enum class StorageError : int {  // NOLINT(performance-enum-size)
    OK = 0,

    NOT_SUPPORTED = 1,
    CORRUPTION = 2,
    INVALID_ARGUMENT = 3,  ///< also: batch refers to a cleared column family
    IO_ERROR = 4,
    NOT_FOUND = 5,         ///< get() of an absent key
    DB_PATH_NOT_CREATED = 6,
    STORAGE_GONE = 7,      ///< database closed while its spaces are in use
    COLUMN_FAMILY_NOT_FOUND = 8,

    UNKNOWN = 1000,
  };
}  // namespace kvext::storage

OUTCOME_HPP_DECLARE_ERROR(kvext::storage, StorageError);
