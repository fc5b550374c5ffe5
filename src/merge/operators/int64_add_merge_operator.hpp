/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <cstdint>
#include <string_view>

#include "merge/merge_operator.hpp"

namespace kvext::merge {

  /**
   * Counter: stored value and operands are deltas that are summed.
   * Overflow wraps around in two's complement.
   */
  class Int64AddMergeOperator final : public MergeOperator<int64_t, int64_t> {
   public:
    static constexpr std::string_view kDefaultName = "Int64AddMergeOperator";

    explicit Int64AddMergeOperator(
        std::string name = std::string{kDefaultName});

    const std::string &name() const override;

    outcome::result<int64_t> fullMerge(
        const std::optional<int64_t> &existing,
        std::span<const int64_t> operands) const override;

    outcome::result<PartialMergeResult<int64_t>> partialMerge(
        std::span<const int64_t> operands) const override;

   private:
    std::string name_;
  };

}  // namespace kvext::merge
