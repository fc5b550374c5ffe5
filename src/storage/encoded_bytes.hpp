/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <array>
#include <optional>

#include <qtils/bytes.hpp>

#include "codec/codec.hpp"
#include "storage/buffer_pool.hpp"
#include "utils/ctor_limiters.hpp"

namespace kvext::storage {

  /// Where the bytes of an EncodedBytes live
  enum class EncodePath : uint8_t {
    Stack,  ///< inline array, size known and small
    Pool,   ///< rented buffer of the exact known size
    Sink,   ///< rented buffer grown by the codec, size unknown upfront
  };

  /// Encodings shorter than this many bytes stay inline
  inline constexpr size_t kMaxStackSize = 256;

  /**
   * @class EncodedBytes
   * @brief Encoded form of one key, value or operand for a single engine
   * call.
   *
   * Meant to be a local variable: the view points into the object itself
   * or into a buffer it rents, so it can be neither copied nor moved. The
   * rented buffer goes back to the pool when the object is destroyed.
   */
  template <typename T>
  class EncodedBytes : NonCopyable, NonMovable {
   public:
    EncodedBytes(const codec::Codec<T> &codec, const T &value, BufferPool &pool) {
      if (auto size = codec.trySize(value)) {
        if (size.value() < kMaxStackSize) {
          qtils::BytesOut out{stack_.data(), size.value()};
          codec.write(value, out);
          view_ = out;
          path_ = EncodePath::Stack;
          return;
        }
        auto &buffer = pooled_.emplace(pool.acquire(size.value())).get();
        buffer.resize(size.value());
        codec.write(value, buffer);
        view_ = buffer;
        path_ = EncodePath::Pool;
        return;
      }
      auto &buffer = pooled_.emplace(pool.acquire(kMaxStackSize)).get();
      codec::ByteSink sink{buffer};
      codec.append(value, sink);
      view_ = sink.written();
      path_ = EncodePath::Sink;
    }

    qtils::BytesIn view() const {
      return view_;
    }

    EncodePath path() const {
      return path_;
    }

   private:
    std::array<uint8_t, kMaxStackSize> stack_;  // NOLINT
    std::optional<PooledBuffer> pooled_;
    qtils::BytesIn view_;
    EncodePath path_{EncodePath::Stack};
  };

}  // namespace kvext::storage
