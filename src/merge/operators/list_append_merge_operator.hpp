/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <vector>

#include "codec/type_name.hpp"
#include "merge/merge_operator.hpp"

namespace kvext::merge {

  /**
   * Append-only list: every operand is a list of items appended to the
   * stored list. Concatenation is associative, so any batch can be combined.
   */
  template <typename T>
  class ListAppendMergeOperator final
      : public MergeOperator<std::vector<T>, std::vector<T>> {
   public:
    using List = std::vector<T>;

    static constexpr std::string_view kBaseName = "ListAppendMergeOperator";

    ListAppendMergeOperator()
        : name_{codec::nameWithElement<T>(kBaseName)} {}

    explicit ListAppendMergeOperator(std::string name)
        : name_{std::move(name)} {}

    const std::string &name() const override {
      return name_;
    }

    outcome::result<List> fullMerge(
        const std::optional<List> &existing,
        std::span<const List> operands) const override {
      List result = existing.value_or(List{});
      for (const auto &operand : operands) {
        result.insert(result.end(), operand.begin(), operand.end());
      }
      return result;
    }

    outcome::result<PartialMergeResult<List>> partialMerge(
        std::span<const List> operands) const override {
      List combined;
      for (const auto &operand : operands) {
        combined.insert(combined.end(), operand.begin(), operand.end());
      }
      return PartialMergeResult<List>{Combined<List>{std::move(combined)}};
    }

   private:
    std::string name_;
  };

}  // namespace kvext::merge
