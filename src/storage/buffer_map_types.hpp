/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <qtils/byte_vec.hpp>
#include <qtils/bytes.hpp>

#include "storage/face/generic_maps.hpp"

namespace kvext::storage::face {

  /// Encoded keys and values come from stack, pooled or sink buffers alike
  template <>
  struct ViewTrait<qtils::ByteVec> {
    using type = qtils::BytesIn;
  };

  /// Values are copied out of the engine's buffers
  template <>
  struct OwnedOrViewTrait<qtils::ByteVec> {
    using type = qtils::ByteVec;
  };

}  // namespace kvext::storage::face

namespace kvext::storage {

  using qtils::ByteVec;
  using qtils::BytesIn;

  /// Byte map of one column family
  using BufferStorage = face::GenericStorage<ByteVec, ByteVec>;
  using BufferBatch = face::WriteBatch<ByteVec, ByteVec>;
  using BufferStorageCursor = face::MapCursor<ByteVec, ByteVec>;

}  // namespace kvext::storage
