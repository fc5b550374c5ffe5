/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include <limits>

#include <gtest/gtest.h>
#include <qtils/test/outcome.hpp>

#include "merge/operators/int64_add_merge_operator.hpp"
#include "merge/operators/list_append_merge_operator.hpp"
#include "merge/operators/list_merge_operator.hpp"

using kvext::merge::Combined;
using kvext::merge::Int64AddMergeOperator;
using kvext::merge::KeepOperands;
using kvext::merge::ListAppendMergeOperator;
using kvext::merge::ListMergeOperator;

using Operation = kvext::merge::CollectionOperation<std::string>;
using Strings = std::vector<std::string>;

/**
 * @given no stored list and operands Add{a, b}, Remove{a}, Add{c}
 * @when they are merged in order
 * @then the list is [b, c]
 */
TEST(ListMergeOperatorTest, AppliesOperationsInOrder) {
  ListMergeOperator<std::string> op;
  std::vector<Operation> operands{
      Operation::add({"a", "b"}),
      Operation::remove({"a"}),
      Operation::add({"c"}),
  };

  ASSERT_OUTCOME_SUCCESS(merged, op.fullMerge(std::nullopt, operands));
  EXPECT_EQ(merged, (Strings{"b", "c"}));
}

TEST(ListMergeOperatorTest, RemovesOneOccurrencePerItem) {
  ListMergeOperator<std::string> op;
  std::vector<Operation> operands{Operation::remove({"x", "missing"})};

  ASSERT_OUTCOME_SUCCESS(merged,
                         op.fullMerge(Strings{"x", "y", "x", "x"}, operands));
  EXPECT_EQ(merged, (Strings{"y", "x", "x"}));
}

TEST(ListMergeOperatorTest, NoOperandsKeepsExisting) {
  ListMergeOperator<std::string> op;

  ASSERT_OUTCOME_SUCCESS(merged,
                         op.fullMerge(Strings{"a"}, std::span<const Operation>{}));
  EXPECT_EQ(merged, Strings{"a"});

  ASSERT_OUTCOME_SUCCESS(empty,
                         op.fullMerge(std::nullopt, std::span<const Operation>{}));
  EXPECT_TRUE(empty.empty());
}

/**
 * @given batch of Add operands
 * @when it is partially merged
 * @then a single Add with all items in order is produced
 */
TEST(ListMergeOperatorTest, PartialMergeCombinesAdds) {
  ListMergeOperator<std::string> op;
  std::vector<Operation> operands{Operation::add({"a"}),
                                  Operation::add({"b", "c"})};

  ASSERT_OUTCOME_SUCCESS(partial, op.partialMerge(operands));
  ASSERT_TRUE(std::holds_alternative<Combined<Operation>>(partial));
  EXPECT_EQ(std::get<Combined<Operation>>(partial).operand,
            Operation::add({"a", "b", "c"}));
}

TEST(ListMergeOperatorTest, PartialMergeKeepsBatchWithRemove) {
  ListMergeOperator<std::string> op;
  std::vector<Operation> operands{Operation::add({"a"}),
                                  Operation::remove({"a"})};

  ASSERT_OUTCOME_SUCCESS(partial, op.partialMerge(operands));
  EXPECT_TRUE(std::holds_alternative<KeepOperands>(partial));
}

/**
 * @given list operators over different element types
 * @when they are created without an explicit name
 * @then their names differ by element type
 */
TEST(ListMergeOperatorTest, NameIncludesElementType) {
  EXPECT_EQ(ListMergeOperator<std::string>{}.name(),
            "ListMergeOperator<string>");
  EXPECT_EQ(ListMergeOperator<int64_t>{}.name(), "ListMergeOperator<int64>");
  EXPECT_EQ(ListAppendMergeOperator<int32_t>{}.name(),
            "ListAppendMergeOperator<int32>");
  EXPECT_EQ(ListAppendMergeOperator<std::vector<bool>>{}.name(),
            "ListAppendMergeOperator<list<bool>>");
  EXPECT_NE(ListMergeOperator<int32_t>{}.name(),
            ListMergeOperator<uint32_t>{}.name());

  EXPECT_EQ(ListMergeOperator<std::string>{"tags"}.name(), "tags");
}

TEST(Int64AddMergeOperatorTest, SumsOperands) {
  Int64AddMergeOperator op;
  std::vector<int64_t> operands{5, -2, 7};

  ASSERT_OUTCOME_SUCCESS(from_empty, op.fullMerge(std::nullopt, operands));
  EXPECT_EQ(from_empty, 10);

  ASSERT_OUTCOME_SUCCESS(from_existing, op.fullMerge(3, operands));
  EXPECT_EQ(from_existing, 13);

  ASSERT_OUTCOME_SUCCESS(partial, op.partialMerge(operands));
  ASSERT_TRUE(std::holds_alternative<Combined<int64_t>>(partial));
  EXPECT_EQ(std::get<Combined<int64_t>>(partial).operand, 10);
}

TEST(Int64AddMergeOperatorTest, OverflowWraps) {
  Int64AddMergeOperator op;
  std::vector<int64_t> operands{1};

  ASSERT_OUTCOME_SUCCESS(
      merged, op.fullMerge(std::numeric_limits<int64_t>::max(), operands));
  EXPECT_EQ(merged, std::numeric_limits<int64_t>::min());
}

TEST(ListAppendMergeOperatorTest, Concatenates) {
  ListAppendMergeOperator<int32_t> op;
  std::vector<std::vector<int32_t>> operands{{2, 3}, {}, {4}};

  ASSERT_OUTCOME_SUCCESS(merged,
                         op.fullMerge(std::vector<int32_t>{1}, operands));
  EXPECT_EQ(merged, (std::vector<int32_t>{1, 2, 3, 4}));

  ASSERT_OUTCOME_SUCCESS(partial, op.partialMerge(operands));
  ASSERT_TRUE(std::holds_alternative<Combined<std::vector<int32_t>>>(partial));
  EXPECT_EQ(std::get<Combined<std::vector<int32_t>>>(partial).operand,
            (std::vector<int32_t>{2, 3, 4}));
}
