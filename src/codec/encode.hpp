/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <string>

#include <qtils/byte_vec.hpp>

#include "codec/codec.hpp"

namespace kvext::codec {

  /// Encodes @param value into a fresh byte vector
  template <typename T>
  qtils::ByteVec encode(const Codec<T> &codec, const T &value) {
    qtils::ByteVec out;
    if (auto size = codec.trySize(value)) {
      out.resize(size.value());
      codec.write(value, out);
      return out;
    }
    ByteSink sink{out};
    codec.append(value, sink);
    return out;
  }

  /**
   * Encodes @param value into @param out, replacing its content.
   * Storage engine callbacks hand results back as std::string.
   */
  template <typename T>
  void encodeInto(const Codec<T> &codec, const T &value, std::string &out) {
    if (auto size = codec.trySize(value)) {
      out.resize(size.value());
      // NOLINTNEXTLINE(cppcoreguidelines-pro-type-reinterpret-cast)
      codec.write(value, {reinterpret_cast<uint8_t *>(out.data()), out.size()});
      return;
    }
    qtils::ByteVec buffer;
    ByteSink sink{buffer};
    codec.append(value, sink);
    // NOLINTNEXTLINE(cppcoreguidelines-pro-type-reinterpret-cast)
    out.assign(reinterpret_cast<const char *>(buffer.data()), buffer.size());
  }

}  // namespace kvext::codec
