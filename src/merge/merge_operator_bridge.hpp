/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <deque>
#include <memory>
#include <string>
#include <vector>

#include <rocksdb/merge_operator.h>
#include <rocksdb/slice.h>

#include "codec/codec.hpp"
#include "codec/encode.hpp"
#include "log/logger.hpp"
#include "merge/merge_error.hpp"
#include "merge/merge_operator.hpp"
#include "storage/rocksdb/rocksdb_util.hpp"

namespace kvext::merge {

  /**
   * @class MergeOperatorBridge
   * @brief Runs a typed MergeOperator inside RocksDB merge callbacks.
   *
   * Operands and existing values arrive as raw bytes, are decoded with the
   * codecs of the column family, merged, and the result is encoded back.
   * Nothing thrown or returned by the operator escapes the callback: it is
   * logged and reported to RocksDB as an unsuccessful merge.
   */
  template <typename V, typename O>
  class MergeOperatorBridge final : public rocksdb::MergeOperator {
   public:
    MergeOperatorBridge(std::shared_ptr<const merge::MergeOperator<V, O>> op,
                        std::shared_ptr<const codec::Codec<V>> value_codec,
                        std::shared_ptr<const codec::Codec<O>> operand_codec,
                        log::Logger logger)
        : op_{std::move(op)},
          value_codec_{std::move(value_codec)},
          operand_codec_{std::move(operand_codec)},
          logger_{std::move(logger)} {}

    /**
     * Read-time (and bottom-level compaction) resolution of the operand
     * chain against an optional existing value
     * @return false if the merge failed, which makes the read of the key
     * fail with Status::Corruption
     */
    bool FullMergeV2(const MergeOperationInput &merge_in,
                     MergeOperationOutput *merge_out) const override {
      auto res = fullMerge(merge_in.existing_value,
                           merge_in.operand_list,
                           merge_out->new_value);
      if (res.has_error()) {
        SL_WARN(logger_,
                "{}: full merge of key {} failed: {}",
                op_->name(),
                storage::toHex(merge_in.key),
                res.error());
        return false;
      }
      return true;
    }

    /**
     * Compaction-time folding of operands
     * @return false if operands must be kept as they are
     */
    bool PartialMergeMulti(const rocksdb::Slice &key,
                           const std::deque<rocksdb::Slice> &operand_list,
                           std::string *new_value,
                           rocksdb::Logger *) const override {
      auto res = partialMerge(operand_list, *new_value);
      if (res.has_error()) {
        SL_DEBUG(logger_,
                 "{}: partial merge of key {} failed: {}",
                 op_->name(),
                 storage::toHex(key),
                 res.error());
        return false;
      }
      return res.value();
    }

    const char *Name() const override {
      return op_->name().c_str();
    }

    // single Add operand may still be normalized during compaction
    bool AllowSingleOperand() const override {
      return true;
    }

   private:
    template <typename Slices>
    outcome::result<std::vector<O>> decodeOperands(
        const Slices &operand_list) const {
      std::vector<O> operands;
      operands.reserve(operand_list.size());
      try {
        for (const auto &operand : operand_list) {
          operands.emplace_back(
              operand_codec_->read(storage::make_span(operand)));
        }
      } catch (const std::exception &e) {
        SL_ERROR(logger_, "{}: can't decode operand: {}", op_->name(), e.what());
        return MergeError::OPERAND_DECODE_FAILED;
      }
      return operands;
    }

    outcome::result<void> fullMerge(
        const rocksdb::Slice *existing_value,
        const std::vector<rocksdb::Slice> &operand_list,
        std::string &new_value) const {
      std::optional<V> existing;
      if (existing_value != nullptr) {
        try {
          existing.emplace(
              value_codec_->read(storage::make_span(*existing_value)));
        } catch (const std::exception &e) {
          SL_ERROR(logger_,
                   "{}: can't decode existing value: {}",
                   op_->name(),
                   e.what());
          return MergeError::OPERAND_DECODE_FAILED;
        }
      }
      OUTCOME_TRY(operands, decodeOperands(operand_list));

      try {
        OUTCOME_TRY(merged,
                    op_->fullMerge(existing, std::span<const O>{operands}));
        codec::encodeInto(*value_codec_, merged, new_value);
      } catch (const std::exception &e) {
        SL_ERROR(logger_, "{}: full merge threw: {}", op_->name(), e.what());
        return MergeError::ALGEBRA_FAILED;
      }
      return outcome::success();
    }

    // true if operands were combined into new_value
    outcome::result<bool> partialMerge(
        const std::deque<rocksdb::Slice> &operand_list,
        std::string &new_value) const {
      OUTCOME_TRY(operands, decodeOperands(operand_list));

      try {
        OUTCOME_TRY(partial, op_->partialMerge(std::span<const O>{operands}));
        if (std::holds_alternative<KeepOperands>(partial)) {
          return false;
        }
        codec::encodeInto(
            *operand_codec_, std::get<Combined<O>>(partial).operand, new_value);
      } catch (const std::exception &e) {
        SL_ERROR(logger_, "{}: partial merge threw: {}", op_->name(), e.what());
        return MergeError::ALGEBRA_FAILED;
      }
      return true;
    }

    std::shared_ptr<const merge::MergeOperator<V, O>> op_;
    std::shared_ptr<const codec::Codec<V>> value_codec_;
    std::shared_ptr<const codec::Codec<O>> operand_codec_;
    log::Logger logger_;
  };

}  // namespace kvext::merge
