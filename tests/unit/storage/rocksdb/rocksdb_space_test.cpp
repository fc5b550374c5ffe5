/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include <gtest/gtest.h>

#include <qtils/test/outcome.hpp>

#include "storage/storage_error.hpp"
#include "testutil/storage/base_rocksdb_test.hpp"

using kvext::storage::StorageError;
using qtils::ByteVec;

struct RocksDbSpaceTest : public test::BaseRocksDB_Test {
  RocksDbSpaceTest()
      : test::BaseRocksDB_Test("/tmp/kvext-test-rocksdb-space") {
    column_families = {{.name = "test"}, {.name = "second"}};
  }

  ByteVec key_{1, 3, 3, 7};
  ByteVec value_{1, 2, 3};
};

/**
 * @given empty column family
 * @when put an entry
 * @then it can be read back and is reported present
 */
TEST_F(RocksDbSpaceTest, PutGet) {
  EXPECT_OUTCOME_SUCCESS(db_->put(key_, value_));

  ASSERT_OUTCOME_SUCCESS(contains, db_->contains(key_));
  EXPECT_TRUE(contains);

  ASSERT_OUTCOME_SUCCESS(value, db_->get(key_));
  EXPECT_EQ(value, value_);
}

TEST_F(RocksDbSpaceTest, GetNonExistent) {
  ASSERT_OUTCOME_SUCCESS(contains, db_->contains(key_));
  EXPECT_FALSE(contains);

  ASSERT_OUTCOME_ERROR(db_->get(key_), StorageError::NOT_FOUND);

  ASSERT_OUTCOME_SUCCESS(value, db_->tryGet(key_));
  EXPECT_FALSE(value.has_value());
}

TEST_F(RocksDbSpaceTest, Remove) {
  EXPECT_OUTCOME_SUCCESS(db_->put(key_, value_));
  EXPECT_OUTCOME_SUCCESS(db_->remove(key_));

  ASSERT_OUTCOME_SUCCESS(contains, db_->contains(key_));
  EXPECT_FALSE(contains);

  // removing an absent key is not an error
  EXPECT_OUTCOME_SUCCESS(db_->remove(key_));
}

/**
 * @given two column families
 * @when an entry is put into one of them
 * @then the other one does not see it
 */
TEST_F(RocksDbSpaceTest, ColumnFamiliesAreIsolated) {
  auto second = rocks_->getSpace("second");
  EXPECT_OUTCOME_SUCCESS(db_->put(key_, value_));

  ASSERT_OUTCOME_SUCCESS(contains, second->contains(key_));
  EXPECT_FALSE(contains);
}

TEST_F(RocksDbSpaceTest, UnknownColumnFamily) {
  ASSERT_THROW_OUTCOME(rocks_->getSpace("missing"),
                       StorageError::COLUMN_FAMILY_NOT_FOUND);
  EXPECT_EQ(rocks_->getSpace("test"), db_);
}

/**
 * @given batch with several puts and a remove
 * @when it is committed
 * @then all of its changes are visible, and none before commit
 */
TEST_F(RocksDbSpaceTest, BatchIsAtomic) {
  const ByteVec other{9};
  EXPECT_OUTCOME_SUCCESS(db_->put(other, value_));

  {
    auto batch = db_->batch();
    EXPECT_OUTCOME_SUCCESS(batch->put(key_, value_));
    EXPECT_OUTCOME_SUCCESS(batch->remove(other));

    ASSERT_OUTCOME_SUCCESS(before, db_->contains(key_));
    EXPECT_FALSE(before);

    EXPECT_OUTCOME_SUCCESS(batch->commit());
  }

  ASSERT_OUTCOME_SUCCESS(added, db_->contains(key_));
  EXPECT_TRUE(added);
  ASSERT_OUTCOME_SUCCESS(removed, db_->contains(other));
  EXPECT_FALSE(removed);
}

TEST_F(RocksDbSpaceTest, ClearedBatchWritesNothing) {
  {
    auto batch = db_->batch();
    EXPECT_OUTCOME_SUCCESS(batch->put(key_, value_));
    batch->clear();
    EXPECT_OUTCOME_SUCCESS(batch->commit());
  }
  ASSERT_OUTCOME_SUCCESS(contains, db_->contains(key_));
  EXPECT_FALSE(contains);
}

/**
 * @given entries with keys 1..5
 * @when iterate with cursor forwards, backwards and from a sought key
 * @then keys come in byte order
 */
TEST_F(RocksDbSpaceTest, Iterate) {
  for (uint8_t i = 1; i <= 5; ++i) {
    EXPECT_OUTCOME_SUCCESS(db_->put(ByteVec{i}, ByteVec{uint8_t(i * 10)}));
  }

  {
    auto cursor = db_->cursor();
    std::vector<ByteVec> keys;
    ASSERT_OUTCOME_SUCCESS(positioned, cursor->seekFirst());
    EXPECT_TRUE(positioned);
    while (cursor->isValid()) {
      keys.emplace_back(cursor->key().value());
      EXPECT_OUTCOME_SUCCESS(cursor->next());
    }
    EXPECT_EQ(keys.size(), 5u);
    EXPECT_EQ(keys.front(), ByteVec{1});
    EXPECT_EQ(keys.back(), ByteVec{5});
  }

  {
    auto cursor = db_->cursor();
    ASSERT_OUTCOME_SUCCESS(positioned, cursor->seek(ByteVec{3}));
    EXPECT_TRUE(positioned);
    EXPECT_EQ(cursor->value(), ByteVec{30});

    ASSERT_OUTCOME_SUCCESS(last, cursor->seekLast());
    EXPECT_TRUE(last);
    EXPECT_EQ(cursor->key(), ByteVec{5});
    EXPECT_OUTCOME_SUCCESS(cursor->prev());
    EXPECT_EQ(cursor->key(), ByteVec{4});
  }
}

TEST_F(RocksDbSpaceTest, EmptyColumnFamilyCursor) {
  auto cursor = db_->cursor();
  ASSERT_OUTCOME_SUCCESS(positioned, cursor->seekFirst());
  EXPECT_FALSE(positioned);
  EXPECT_FALSE(cursor->isValid());
  EXPECT_FALSE(cursor->key().has_value());
}

/**
 * @given column family with entries
 * @when it is cleared
 * @then it is empty and still writable
 */
TEST_F(RocksDbSpaceTest, Clear) {
  EXPECT_OUTCOME_SUCCESS(db_->put(key_, value_));
  EXPECT_OUTCOME_SUCCESS(db_->clear());

  ASSERT_OUTCOME_SUCCESS(contains, db_->contains(key_));
  EXPECT_FALSE(contains);

  EXPECT_OUTCOME_SUCCESS(db_->put(key_, value_));
  ASSERT_OUTCOME_SUCCESS(value, db_->get(key_));
  EXPECT_EQ(value, value_);
}

TEST_F(RocksDbSpaceTest, SurvivesReopen) {
  EXPECT_OUTCOME_SUCCESS(db_->put(key_, value_));
  EXPECT_OUTCOME_SUCCESS(rocks_->flush());

  open();

  ASSERT_OUTCOME_SUCCESS(value, db_->get(key_));
  EXPECT_EQ(value, value_);
}

/**
 * @given space whose database has been closed
 * @when it is used
 * @then STORAGE_GONE is returned
 */
TEST_F(RocksDbSpaceTest, UseAfterClose) {
  auto space = db_;
  close();

  ASSERT_OUTCOME_ERROR(space->contains(key_), StorageError::STORAGE_GONE);
  ASSERT_OUTCOME_ERROR(space->put(key_, value_), StorageError::STORAGE_GONE);
}
