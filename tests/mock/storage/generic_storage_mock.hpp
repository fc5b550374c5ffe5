/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <gmock/gmock.h>

#include "storage/buffer_map_types.hpp"

namespace kvext::storage::face {

  template <typename K, typename V>
  struct GenericStorageMock : public GenericStorage<K, V> {
    MOCK_METHOD(std::unique_ptr<WriteBatch<K, V>>, batch, (), (override));

    MOCK_METHOD(std::unique_ptr<MapCursor<K, V>>, cursor, (), (override));

    MOCK_METHOD(outcome::result<OwnedOrView<V>>,
                get,
                (const View<K> &),
                (const, override));

    MOCK_METHOD(outcome::result<std::optional<OwnedOrView<V>>>,
                tryGet,
                (const View<K> &),
                (const, override));

    MOCK_METHOD(outcome::result<bool>,
                contains,
                (const View<K> &),
                (const, override));

    MOCK_METHOD(outcome::result<void>,
                put,
                (const View<K> &, const View<V> &),
                (override));

    MOCK_METHOD(outcome::result<void>, remove, (const View<K> &), (override));

    MOCK_METHOD(outcome::result<void>,
                merge,
                (const View<K> &, const View<V> &),
                (override));

    MOCK_METHOD(outcome::result<void>, clear, (), (override));

  };

  template <typename K, typename V>
  struct WriteBatchMock : public WriteBatch<K, V> {
    MOCK_METHOD(outcome::result<void>, commit, (), (override));

    MOCK_METHOD(void, clear, (), (override));

    MOCK_METHOD(outcome::result<void>,
                put,
                (const View<K> &, const View<V> &),
                (override));

    MOCK_METHOD(outcome::result<void>, remove, (const View<K> &), (override));
  };

}  // namespace kvext::storage::face

namespace kvext::storage {
  using BufferStorageMock = face::GenericStorageMock<ByteVec, ByteVec>;
  using BufferBatchMock = face::WriteBatchMock<ByteVec, ByteVec>;
}  // namespace kvext::storage
