/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

/**
 * @brief Declares the Codec interface: the size/write/read contract through
 * which every typed key, value and merge operand is turned into bytes.
 */

#pragma once

#include <optional>

#include <qtils/bytes.hpp>

#include "codec/byte_sink.hpp"

namespace kvext::codec {

  /**
   * @class Codec
   * @brief Binary encoding strategy for values of type T.
   *
   * Codecs are stateless (or configuration-only) and safe to share between
   * threads. No type tag is stored with encoded values: bytes must be read
   * by the same codec that wrote them. Reading anything else is undefined.
   *
   * @tparam T encoded type
   */
  template <typename T>
  class Codec {
   public:
    using Type = T;

    virtual ~Codec() = default;

    /**
     * Computes the exact encoded size of @param value without writing
     * @return size in bytes, or std::nullopt if it can only be discovered
     * by streaming the value into a ByteSink
     */
    [[nodiscard]] virtual std::optional<size_t> trySize(
        const T &value) const = 0;

    /**
     * Writes @param value into @param out.
     * Precondition: out.size() equals trySize(value), which has a value.
     * Exactly out.size() bytes are written.
     */
    virtual void write(const T &value, qtils::BytesOut out) const = 0;

    /**
     * Appends encoded @param value to @param sink. Must be usable for any
     * value, including those whose size is unknown.
     */
    virtual void append(const T &value, ByteSink &sink) const = 0;

    /**
     * Decodes a value from @param in, which must be the exact output of
     * write() or append() of this codec
     */
    [[nodiscard]] virtual T read(qtils::BytesIn in) const = 0;
  };

  /**
   * @class FixedWidthCodec
   * @brief Codec whose every value encodes to the same number of bytes.
   *
   * Only codecs of this kind may be used as elements of fixed-width
   * collections, which derive element boundaries from the width alone.
   */
  template <typename T>
  class FixedWidthCodec : public Codec<T> {
   public:
    [[nodiscard]] virtual size_t width() const = 0;

    [[nodiscard]] std::optional<size_t> trySize(const T &) const final {
      return width();
    }

    void append(const T &value, ByteSink &sink) const final {
      this->write(value, sink.grow(width()));
    }
  };

}  // namespace kvext::codec
