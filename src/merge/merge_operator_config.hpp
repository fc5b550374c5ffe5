/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <memory>
#include <string>

#include "merge/merge_operator_bridge.hpp"

namespace kvext::merge {

  /**
   * Merge operator bound to one column family. Created when the store is
   * registered and installed into the column family options on open.
   */
  struct MergeOperatorConfig {
    std::string name;
    std::shared_ptr<rocksdb::MergeOperator> merge_operator;
  };

  template <typename V, typename O>
  MergeOperatorConfig makeMergeOperatorConfig(
      std::shared_ptr<const MergeOperator<V, O>> op,
      std::shared_ptr<const codec::Codec<V>> value_codec,
      std::shared_ptr<const codec::Codec<O>> operand_codec,
      log::Logger logger) {
    auto name = op->name();
    return MergeOperatorConfig{
        .name = std::move(name),
        .merge_operator = std::make_shared<MergeOperatorBridge<V, O>>(
            std::move(op),
            std::move(value_codec),
            std::move(operand_codec),
            std::move(logger)),
    };
  }

}  // namespace kvext::merge
