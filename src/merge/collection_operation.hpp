/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <cstdint>
#include <vector>

namespace kvext::merge {

  /// Tag byte of an encoded collection operation
  enum class OperationType : uint8_t {
    Add = 0,
    Remove = 1,
  };

  /**
   * @brief Merge operand that adds items to or removes items from a stored
   * list.
   *
   * Operations only exist between the merge call and the merge callback;
   * the stored value is always the plain list.
   */
  template <typename T>
  struct CollectionOperation {
    OperationType type = OperationType::Add;
    std::vector<T> items;

    static CollectionOperation add(std::vector<T> items) {
      return {OperationType::Add, std::move(items)};
    }

    static CollectionOperation remove(std::vector<T> items) {
      return {OperationType::Remove, std::move(items)};
    }

    bool operator==(const CollectionOperation &) const = default;
  };

}  // namespace kvext::merge
