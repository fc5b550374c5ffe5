/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "merge/merge_operator_bridge.hpp"

#include <gtest/gtest.h>

#include "codec/codec_registry.hpp"
#include "merge/collection_operation_codec.hpp"
#include "merge/merge_error.hpp"
#include "merge/operators/int64_add_merge_operator.hpp"
#include "merge/operators/list_merge_operator.hpp"
#include "testutil/prepare_loggers.hpp"

using kvext::codec::Codec;
using kvext::codec::CodecRegistry;
using kvext::merge::Int64AddMergeOperator;
using kvext::merge::ListMergeOperator;
using kvext::merge::MergeOperatorBridge;
using kvext::merge::PartialMergeResult;
using kvext::merge::MergeError;

using Operation = kvext::merge::CollectionOperation<std::string>;
using Strings = std::vector<std::string>;

namespace {
  /// Fails every merge, optionally by throwing
  class FailingOperator final
      : public kvext::merge::MergeOperator<int64_t, int64_t> {
   public:
    explicit FailingOperator(bool throws) : throws_{throws} {}

    const std::string &name() const override {
      return name_;
    }

    outcome::result<int64_t> fullMerge(
        const std::optional<int64_t> &,
        std::span<const int64_t>) const override {
      if (throws_) {
        throw std::runtime_error("broken");
      }
      return MergeError::ALGEBRA_FAILED;
    }

    outcome::result<PartialMergeResult<int64_t>> partialMerge(
        std::span<const int64_t>) const override {
      if (throws_) {
        throw std::runtime_error("broken");
      }
      return MergeError::ALGEBRA_FAILED;
    }

   private:
    bool throws_;
    std::string name_ = "Failing";
  };

  rocksdb::Slice slice(const std::string &s) {
    return rocksdb::Slice{s};
  }
}  // namespace

class MergeOperatorBridgeTest : public ::testing::Test {
 public:
  void SetUp() override {
    registry = CodecRegistry::withDefaults();
    int_codec = registry.get<int64_t>().value();
  }

  template <typename T>
  std::string encoded(const Codec<T> &codec, const T &value) {
    std::string out;
    kvext::codec::encodeInto(codec, value, out);
    return out;
  }

  std::optional<std::string> fullMerge(const rocksdb::MergeOperator &op,
                                       const std::string *existing,
                                       const std::vector<std::string> &ops) {
    std::vector<rocksdb::Slice> operands;
    for (const auto &operand : ops) {
      operands.emplace_back(slice(operand));
    }
    std::optional<rocksdb::Slice> existing_slice;
    if (existing != nullptr) {
      existing_slice.emplace(slice(*existing));
    }
    rocksdb::MergeOperator::MergeOperationInput in(
        rocksdb::Slice{"key"},
        existing_slice ? &*existing_slice : nullptr,
        operands,
        nullptr);
    std::string new_value;
    rocksdb::Slice existing_operand;
    rocksdb::MergeOperator::MergeOperationOutput out(new_value,
                                                     existing_operand);
    if (not op.FullMergeV2(in, &out)) {
      return std::nullopt;
    }
    return new_value;
  }

  std::optional<std::string> partialMerge(const rocksdb::MergeOperator &op,
                                          const std::vector<std::string> &ops) {
    std::deque<rocksdb::Slice> operands;
    for (const auto &operand : ops) {
      operands.emplace_back(slice(operand));
    }
    std::string new_value;
    if (not op.PartialMergeMulti(
            rocksdb::Slice{"key"}, operands, &new_value, nullptr)) {
      return std::nullopt;
    }
    return new_value;
  }

  kvext::log::Logger logger = testutil::prepareLoggers()->getLogger(
      "MergeOperatorBridgeTest", "testing");
  CodecRegistry registry;
  std::shared_ptr<const Codec<int64_t>> int_codec;
};

/**
 * @given counter bridge
 * @when existing value and operands are merged
 * @then encoded sum is produced
 */
TEST_F(MergeOperatorBridgeTest, FullMergeDecodesAndEncodes) {
  MergeOperatorBridge<int64_t, int64_t> bridge{
      std::make_shared<Int64AddMergeOperator>(), int_codec, int_codec, logger};

  auto existing = encoded<int64_t>(*int_codec, 3);
  auto result = fullMerge(bridge,
                          &existing,
                          {encoded<int64_t>(*int_codec, 4),
                           encoded<int64_t>(*int_codec, 6)});

  ASSERT_TRUE(result.has_value());
  EXPECT_EQ(*result, encoded<int64_t>(*int_codec, 13));
  EXPECT_STREQ(bridge.Name(), "Int64AddMergeOperator");
}

TEST_F(MergeOperatorBridgeTest, FullMergeWithoutExistingValue) {
  MergeOperatorBridge<int64_t, int64_t> bridge{
      std::make_shared<Int64AddMergeOperator>(), int_codec, int_codec, logger};

  auto result =
      fullMerge(bridge, nullptr, {encoded<int64_t>(*int_codec, -5)});

  ASSERT_TRUE(result.has_value());
  EXPECT_EQ(*result, encoded<int64_t>(*int_codec, -5));
}

TEST_F(MergeOperatorBridgeTest, PartialMergeOfListOperands) {
  auto value_codec = registry.get<Strings>().value();
  auto operand_codec = registry.get<Operation>().value();
  MergeOperatorBridge<Strings, Operation> bridge{
      std::make_shared<ListMergeOperator<std::string>>(),
      value_codec,
      operand_codec,
      logger};

  auto combined = partialMerge(bridge,
                               {encoded(*operand_codec, Operation::add({"a"})),
                                encoded(*operand_codec, Operation::add({"b"}))});
  ASSERT_TRUE(combined.has_value());
  EXPECT_EQ(*combined, encoded(*operand_codec, Operation::add({"a", "b"})));

  auto kept = partialMerge(bridge,
                           {encoded(*operand_codec, Operation::add({"a"})),
                            encoded(*operand_codec, Operation::remove({"a"}))});
  EXPECT_FALSE(kept.has_value());
}

/**
 * @given bridge over an operator that returns errors or throws
 * @when merge callbacks run
 * @then they report failure instead of propagating
 */
TEST_F(MergeOperatorBridgeTest, OperatorFailureIsReported) {
  for (auto throws : {false, true}) {
    MergeOperatorBridge<int64_t, int64_t> bridge{
        std::make_shared<FailingOperator>(throws), int_codec, int_codec, logger};
    auto operand = encoded<int64_t>(*int_codec, 1);

    EXPECT_FALSE(fullMerge(bridge, nullptr, {operand}).has_value());
    EXPECT_FALSE(partialMerge(bridge, {operand, operand}).has_value());
  }
}
