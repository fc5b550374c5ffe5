/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "merge/collection_operation_codec.hpp"

#include <gtest/gtest.h>

#include "codec/encode.hpp"
#include "testutil/codec/streamed_string_codec.hpp"

using kvext::codec::FixedSizeCollectionCodec;
using kvext::codec::ScalarCodec;
using kvext::codec::StringCodec;
using kvext::codec::VariableSizeCollectionCodec;
using kvext::merge::CollectionOperation;
using kvext::merge::CollectionOperationCodec;
using kvext::merge::OperationType;
using qtils::ByteVec;

/**
 * @given operand codec over fixed-size int32 payload
 * @when Add and Remove operands are encoded
 * @then first byte is the tag and the rest is the payload
 */
TEST(CollectionOperationCodecTest, TagPrecedesPayload) {
  auto payload = std::make_shared<FixedSizeCollectionCodec<std::vector<int32_t>>>(
      std::make_shared<ScalarCodec<int32_t>>());
  CollectionOperationCodec<int32_t> codec{payload};

  auto add = CollectionOperation<int32_t>::add({7});
  auto remove = CollectionOperation<int32_t>::remove({7});

  EXPECT_EQ(codec.trySize(add), 1u + 4 + 4);
  auto add_bytes = kvext::codec::encode(codec, add);
  auto remove_bytes = kvext::codec::encode(codec, remove);

  ASSERT_EQ(add_bytes.size(), 9u);
  EXPECT_EQ(add_bytes[0], 0);
  EXPECT_EQ(remove_bytes[0], 1);
  EXPECT_EQ(ByteVec(add_bytes.begin() + 1, add_bytes.end()),
            kvext::codec::encode(*payload, std::vector<int32_t>{7}));

  EXPECT_EQ(codec.read(add_bytes), add);
  EXPECT_EQ(codec.read(remove_bytes), remove);
}

TEST(CollectionOperationCodecTest, EmptyPayload) {
  CollectionOperationCodec<std::string> codec{
      std::make_shared<VariableSizeCollectionCodec<std::vector<std::string>>>(
          std::make_shared<StringCodec>())};

  auto operation = CollectionOperation<std::string>::remove({});
  auto bytes = kvext::codec::encode(codec, operation);

  EXPECT_EQ(bytes.size(), 5u);
  EXPECT_EQ(codec.read(bytes).type, OperationType::Remove);
  EXPECT_TRUE(codec.read(bytes).items.empty());
}

/**
 * @given operand codec whose payload size is unknown
 * @when operand is encoded
 * @then whole operand including the tag goes through the sink and matches
 * the sized encoding
 */
TEST(CollectionOperationCodecTest, UnknownPayloadSizeUsesSink) {
  CollectionOperationCodec<std::string> streamed{
      std::make_shared<VariableSizeCollectionCodec<std::vector<std::string>>>(
          std::make_shared<testutil::StreamedStringCodec>())};
  CollectionOperationCodec<std::string> sized{
      std::make_shared<VariableSizeCollectionCodec<std::vector<std::string>>>(
          std::make_shared<StringCodec>())};

  auto operation = CollectionOperation<std::string>::add({"a", "bb"});

  EXPECT_FALSE(streamed.trySize(operation).has_value());
  auto bytes = kvext::codec::encode(streamed, operation);
  EXPECT_EQ(bytes, kvext::codec::encode(sized, operation));
  EXPECT_EQ(streamed.read(bytes), operation);
}
