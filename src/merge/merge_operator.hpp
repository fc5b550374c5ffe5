/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

/**
 * @brief Typed merge operator interface.
 *
 * A merge operator resolves a chain of operands submitted with merge() into
 * a stored value. RocksDB calls it at two points:
 *  - full merge, on read and during compaction when the chain reaches the
 *    base value (or the bottom of the key history);
 *  - partial merge, during compaction, when only a slice of operands is
 *    visible and the base value is unknown.
 */

#pragma once

#include <optional>
#include <span>
#include <string>
#include <variant>

#include <qtils/outcome.hpp>

namespace kvext::merge {

  /// Operands cannot be combined without the existing value; RocksDB keeps
  /// them as they are until the next full merge
  struct KeepOperands {
    bool operator==(const KeepOperands &) const = default;
  };

  /// Single operand equivalent to the whole batch
  template <typename O>
  struct Combined {
    O operand;

    bool operator==(const Combined &) const = default;
  };

  template <typename O>
  using PartialMergeResult = std::variant<KeepOperands, Combined<O>>;

  /**
   * @class MergeOperator
   * @tparam V stored value type
   * @tparam O operand type, may be the same as V
   */
  template <typename V, typename O>
  class MergeOperator {
   public:
    using Value = V;
    using Operand = O;

    virtual ~MergeOperator() = default;

    /**
     * Name under which RocksDB records the operator. Must not change between
     * runs over the same database.
     */
    [[nodiscard]] virtual const std::string &name() const = 0;

    /**
     * Applies @param operands in the given order to @param existing value
     * (or to the empty value when there is none)
     */
    virtual outcome::result<V> fullMerge(
        const std::optional<V> &existing,
        std::span<const O> operands) const = 0;

    /**
     * Tries to fold @param operands into one operand. Must return
     * KeepOperands whenever the result would depend on the existing value or
     * on operands outside the batch.
     */
    virtual outcome::result<PartialMergeResult<O>> partialMerge(
        std::span<const O> operands) const = 0;
  };

}  // namespace kvext::merge
