/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "storage/builder_error.hpp"

OUTCOME_CPP_DEFINE_CATEGORY(kvext::storage, BuilderError, e) {
  using E = kvext::storage::BuilderError;
  switch (e) {
    case E::COLUMN_FAMILY_ALREADY_REGISTERED:
      return "column family is already registered";
    case E::STORE_ALREADY_REGISTERED:
      return "store type is already registered";
    case E::STORE_NOT_REGISTERED:
      return "store type is not registered";
  }
  return "unknown BuilderError";
}
