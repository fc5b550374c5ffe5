/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

/**
 * @brief Codecs for collections built on top of a single element codec.
 *
 * Two layouts are supported:
 *
 *   fixed-width:     [count:int32][element]*count
 *   variable-width:  [count:int32]{[size:int32][element]}*count
 *
 * Both count and size are native-endian. An empty collection of either
 * layout is just a zero count. The layouts are not interchangeable: bytes
 * written by one strategy must be read by the same strategy.
 */

#pragma once

#include <memory>

#include <qtils/outcome.hpp>

#include "codec/codec.hpp"
#include "codec/codec_error.hpp"
#include "codec/collection_traits.hpp"
#include "codec/raw.hpp"
#include "codec/scalar_codecs.hpp"

namespace kvext::codec {

  /**
   * @class FixedSizeCollectionCodec
   * @brief Collection of elements that all encode to the same width.
   *
   * Element boundaries are not stored: they are derived by dividing the
   * payload evenly by the element count.
   */
  template <Collection C>
  class FixedSizeCollectionCodec final : public Codec<C> {
    using Element = ElementOf<C>;
    using Traits = CollectionTraits<C>;

   public:
    explicit FixedSizeCollectionCodec(
        std::shared_ptr<const FixedWidthCodec<Element>> element_codec)
        : element_codec_{std::move(element_codec)} {}

    [[nodiscard]] std::optional<size_t> trySize(const C &value) const override {
      return kLengthPrefixSize + value.size() * element_codec_->width();
    }

    void write(const C &value, qtils::BytesOut out) const override {
      BOOST_ASSERT(out.size()
                   == kLengthPrefixSize
                          + value.size() * element_codec_->width());
      storeRaw(out, static_cast<LengthPrefix>(value.size()));
      if (value.empty()) {
        return;
      }

      auto offset = kLengthPrefixSize;
      const auto element_size = (out.size() - offset) / value.size();
      for (const auto &element : value) {
        element_codec_->write(element, out.subspan(offset, element_size));
        offset += element_size;
      }
    }

    void append(const C &value, ByteSink &sink) const override {
      write(value, sink.grow(*trySize(value)));
    }

    [[nodiscard]] C read(qtils::BytesIn in) const override {
      const auto count = static_cast<size_t>(loadRaw<LengthPrefix>(in));
      auto collection = Traits::create(count);
      if (count == 0) {
        return collection;
      }

      auto offset = kLengthPrefixSize;
      const auto element_size = (in.size() - offset) / count;
      for (size_t i = 0; i < count; ++i) {
        Traits::add(collection,
                    element_codec_->read(in.subspan(offset, element_size)));
        offset += element_size;
      }
      return collection;
    }

   private:
    std::shared_ptr<const FixedWidthCodec<Element>> element_codec_;
  };

  /**
   * @class VariableSizeCollectionCodec
   * @brief Collection of elements of arbitrary encoded size, each prefixed
   * with its length.
   *
   * If the size of any element is unknown, the size of the whole collection
   * is unknown and the collection is streamed through a ByteSink.
   */
  template <Collection C>
  class VariableSizeCollectionCodec final : public Codec<C> {
    using Element = ElementOf<C>;
    using Traits = CollectionTraits<C>;

   public:
    explicit VariableSizeCollectionCodec(
        std::shared_ptr<const Codec<Element>> element_codec)
        : element_codec_{std::move(element_codec)} {}

    [[nodiscard]] std::optional<size_t> trySize(const C &value) const override {
      size_t size = kLengthPrefixSize;
      for (const auto &element : value) {
        auto element_size = element_codec_->trySize(element);
        if (not element_size.has_value()) {
          return std::nullopt;
        }
        size += kLengthPrefixSize + element_size.value();
      }
      return size;
    }

    void write(const C &value, qtils::BytesOut out) const override {
      storeRaw(out, static_cast<LengthPrefix>(value.size()));

      auto offset = kLengthPrefixSize;
      for (const auto &element : value) {
        const auto element_size = element_codec_->trySize(element).value();
        storeRaw(out.subspan(offset, kLengthPrefixSize),
                 static_cast<LengthPrefix>(element_size));
        offset += kLengthPrefixSize;

        element_codec_->write(element, out.subspan(offset, element_size));
        offset += element_size;
      }
      BOOST_ASSERT(offset == out.size());
    }

    void append(const C &value, ByteSink &sink) const override {
      storeRaw(sink.grow(kLengthPrefixSize),
               static_cast<LengthPrefix>(value.size()));

      for (const auto &element : value) {
        if (auto element_size = element_codec_->trySize(element)) {
          storeRaw(sink.grow(kLengthPrefixSize),
                   static_cast<LengthPrefix>(element_size.value()));
          element_codec_->write(element, sink.grow(element_size.value()));
          continue;
        }

        // length is back-filled once the element has been streamed
        const auto prefix_offset = sink.size();
        sink.grow(kLengthPrefixSize);
        element_codec_->append(element, sink);
        const auto written = static_cast<LengthPrefix>(
            sink.size() - prefix_offset - kLengthPrefixSize);
        uint8_t prefix[kLengthPrefixSize];
        storeRaw(qtils::BytesOut{prefix}, written);
        sink.patch(prefix_offset, prefix);
      }
    }

    [[nodiscard]] C read(qtils::BytesIn in) const override {
      const auto count = static_cast<size_t>(loadRaw<LengthPrefix>(in));
      auto collection = Traits::create(count);

      auto offset = kLengthPrefixSize;
      for (size_t i = 0; i < count; ++i) {
        const auto element_size = static_cast<size_t>(
            loadRaw<LengthPrefix>(in.subspan(offset, kLengthPrefixSize)));
        offset += kLengthPrefixSize;

        Traits::add(collection,
                    element_codec_->read(in.subspan(offset, element_size)));
        offset += element_size;
      }
      return collection;
    }

   private:
    std::shared_ptr<const Codec<Element>> element_codec_;
  };

  /**
   * Builds the collection codec for C from its element codec.
   *
   * The strategy is chosen once, by element type: scalar elements use the
   * fixed-width layout (their codec must then be a FixedWidthCodec), any
   * other element type uses the variable-width layout.
   */
  template <Collection C>
  outcome::result<std::shared_ptr<const Codec<C>>> makeCollectionCodec(
      std::shared_ptr<const Codec<ElementOf<C>>> element_codec) {
    using Element = ElementOf<C>;
    if constexpr (Scalar<Element>) {
      auto fixed_width = std::dynamic_pointer_cast<const FixedWidthCodec<Element>>(
          std::move(element_codec));
      if (not fixed_width) {
        return CodecError::NOT_FIXED_WIDTH;
      }
      return std::make_shared<FixedSizeCollectionCodec<C>>(
          std::move(fixed_width));
    } else {
      return std::make_shared<VariableSizeCollectionCodec<C>>(
          std::move(element_codec));
    }
  }

}  // namespace kvext::codec
