/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "merge/merge_error.hpp"

OUTCOME_CPP_DEFINE_CATEGORY(kvext::merge, MergeError, e) {
  using E = kvext::merge::MergeError;
  switch (e) {
    case E::OPERAND_DECODE_FAILED:
      return "merge operand or existing value could not be decoded";
    case E::ALGEBRA_FAILED:
      return "merge operator failed";
  }
  return "unknown MergeError";
}
