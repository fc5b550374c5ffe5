/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <algorithm>
#include <vector>

#include "codec/type_name.hpp"
#include "merge/collection_operation.hpp"
#include "merge/merge_operator.hpp"

namespace kvext::merge {

  /**
   * @class ListMergeOperator
   * @brief List with add and remove operations.
   *
   * Add appends its items. Remove erases the first occurrence of each of its
   * items and ignores items that are not in the list, so duplicates behave
   * like a multiset rather than a set.
   *
   * Batches with a Remove are never combined: a removed item might be added
   * by an operand of another compaction input, and the relative order of the
   * two is not visible from here.
   */
  template <typename T>
  class ListMergeOperator final
      : public MergeOperator<std::vector<T>, CollectionOperation<T>> {
   public:
    using List = std::vector<T>;
    using Operation = CollectionOperation<T>;

    static constexpr std::string_view kBaseName = "ListMergeOperator";

    /// Named after the element type, e.g. `ListMergeOperator<string>`
    ListMergeOperator() : name_{codec::nameWithElement<T>(kBaseName)} {}

    explicit ListMergeOperator(std::string name) : name_{std::move(name)} {}

    const std::string &name() const override {
      return name_;
    }

    outcome::result<List> fullMerge(
        const std::optional<List> &existing,
        std::span<const Operation> operands) const override {
      List result = existing.value_or(List{});
      for (const auto &operation : operands) {
        apply(result, operation);
      }
      return result;
    }

    outcome::result<PartialMergeResult<Operation>> partialMerge(
        std::span<const Operation> operands) const override {
      List added;
      for (const auto &operation : operands) {
        if (operation.type != OperationType::Add) {
          return PartialMergeResult<Operation>{KeepOperands{}};
        }
        added.insert(
            added.end(), operation.items.begin(), operation.items.end());
      }
      return PartialMergeResult<Operation>{
          Combined<Operation>{Operation::add(std::move(added))}};
    }

   private:
    static void apply(List &list, const Operation &operation) {
      switch (operation.type) {
        case OperationType::Add:
          list.insert(
              list.end(), operation.items.begin(), operation.items.end());
          break;
        case OperationType::Remove:
          for (const auto &item : operation.items) {
            if (auto it = std::ranges::find(list, item); it != list.end()) {
              list.erase(it);
            }
          }
          break;
      }
    }

    std::string name_;
  };

}  // namespace kvext::merge
