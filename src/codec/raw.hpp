/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <cstdint>
#include <cstring>
#include <type_traits>

#include <boost/assert.hpp>
#include <qtils/bytes.hpp>

namespace kvext::codec {

  /// Length and count prefixes of collections are native-endian int32
  using LengthPrefix = int32_t;
  constexpr size_t kLengthPrefixSize = sizeof(LengthPrefix);

  // Native-endian helpers; memcpy keeps unaligned access well-defined
  template <typename T>
    requires std::is_trivially_copyable_v<T>
  inline void storeRaw(qtils::BytesOut out, T value) {
    BOOST_ASSERT(out.size() >= sizeof(T));
    std::memcpy(out.data(), &value, sizeof(T));
  }

  template <typename T>
    requires std::is_trivially_copyable_v<T>
  inline T loadRaw(qtils::BytesIn in) {
    BOOST_ASSERT(in.size() >= sizeof(T));
    T value;
    std::memcpy(&value, in.data(), sizeof(T));
    return value;
  }

}  // namespace kvext::codec
