/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <string>
#include <type_traits>

#include <qtils/byte_vec.hpp>

#include "codec/codec.hpp"
#include "codec/raw.hpp"

namespace kvext::codec {

  /// Types encoded as their native in-memory representation
  template <typename T>
  concept Scalar = std::is_arithmetic_v<T>;

  /**
   * Native-endian fixed-width codec for integers, floating point and bool.
   * bool is one byte; any non-zero byte reads back as true.
   */
  template <Scalar T>
  class ScalarCodec final : public FixedWidthCodec<T> {
   public:
    [[nodiscard]] size_t width() const override {
      return sizeof(T);
    }

    void write(const T &value, qtils::BytesOut out) const override {
      BOOST_ASSERT(out.size() == sizeof(T));
      storeRaw(out, value);
    }

    [[nodiscard]] T read(qtils::BytesIn in) const override {
      if constexpr (std::is_same_v<T, bool>) {
        BOOST_ASSERT(not in.empty());
        return in[0] != 0;
      } else {
        return loadRaw<T>(in);
      }
    }
  };

  /// UTF-8 text without length prefix; length comes from the enclosing slice
  class StringCodec final : public Codec<std::string> {
   public:
    [[nodiscard]] std::optional<size_t> trySize(
        const std::string &value) const override {
      return value.size();
    }

    void write(const std::string &value, qtils::BytesOut out) const override {
      BOOST_ASSERT(out.size() == value.size());
      if (not value.empty()) {
        std::memcpy(out.data(), value.data(), value.size());
      }
    }

    void append(const std::string &value, ByteSink &sink) const override {
      // NOLINTNEXTLINE(cppcoreguidelines-pro-type-reinterpret-cast)
      sink.put({reinterpret_cast<const uint8_t *>(value.data()), value.size()});
    }

    [[nodiscard]] std::string read(qtils::BytesIn in) const override {
      // NOLINTNEXTLINE(cppcoreguidelines-pro-type-reinterpret-cast)
      return {reinterpret_cast<const char *>(in.data()), in.size()};
    }
  };

  /// Raw bytes, copied as is
  class ByteVecCodec final : public Codec<qtils::ByteVec> {
   public:
    [[nodiscard]] std::optional<size_t> trySize(
        const qtils::ByteVec &value) const override {
      return value.size();
    }

    void write(const qtils::ByteVec &value,
               qtils::BytesOut out) const override {
      BOOST_ASSERT(out.size() == value.size());
      if (not value.empty()) {
        std::memcpy(out.data(), value.data(), value.size());
      }
    }

    void append(const qtils::ByteVec &value, ByteSink &sink) const override {
      sink.put(value);
    }

    [[nodiscard]] qtils::ByteVec read(qtils::BytesIn in) const override {
      return qtils::ByteVec(in.begin(), in.end());
    }
  };

}  // namespace kvext::codec
