/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "storage/storage_error.hpp"

OUTCOME_CPP_DEFINE_CATEGORY(kvext::storage, StorageError, e) {
  using E = StorageError;
  switch (e) {
    case E::OK:
      return "success";
    case E::NOT_SUPPORTED:
      return "Operation is not supported by the database";
    case E::CORRUPTION:
      return "Database data is corrupted";
    case E::INVALID_ARGUMENT:
      return "Invalid argument of database operation";
    case E::IO_ERROR:
      return "Database I/O error";
    case E::NOT_FOUND:
      return "Key not found";
    case E::DB_PATH_NOT_CREATED:
      return "Database directory can't be created";
    case E::STORAGE_GONE:
      return "Database is already closed";
    case E::COLUMN_FAMILY_NOT_FOUND:
      return "Column family is not open";
    case E::UNKNOWN:
      break;
  }
  return "Unknown database error";
}
