/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "merge/operators/int64_add_merge_operator.hpp"

namespace kvext::merge {

  namespace {
    int64_t sum(int64_t initial, std::span<const int64_t> operands) {
      // unsigned arithmetic: wrapping is defined there
      auto result = static_cast<uint64_t>(initial);
      for (auto operand : operands) {
        result += static_cast<uint64_t>(operand);
      }
      return static_cast<int64_t>(result);
    }
  }  // namespace

  Int64AddMergeOperator::Int64AddMergeOperator(std::string name)
      : name_{std::move(name)} {}

  const std::string &Int64AddMergeOperator::name() const {
    return name_;
  }

  outcome::result<int64_t> Int64AddMergeOperator::fullMerge(
      const std::optional<int64_t> &existing,
      std::span<const int64_t> operands) const {
    return sum(existing.value_or(0), operands);
  }

  outcome::result<PartialMergeResult<int64_t>>
  Int64AddMergeOperator::partialMerge(std::span<const int64_t> operands) const {
    return PartialMergeResult<int64_t>{Combined<int64_t>{sum(0, operands)}};
  }

}  // namespace kvext::merge
