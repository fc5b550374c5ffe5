/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

/**
 * @brief Codec of CollectionOperation: [tag:1][collection payload].
 *
 * The payload layout is the one of std::vector<T>, so scalar items are
 * packed and all other items are length-prefixed.
 */

#pragma once

#include "codec/codec_registry.hpp"
#include "merge/collection_operation.hpp"

namespace kvext::merge {

  template <typename T>
  class CollectionOperationCodec final
      : public codec::Codec<CollectionOperation<T>> {
    using Operation = CollectionOperation<T>;
    using Payload = std::vector<T>;

    static constexpr size_t kTagSize = 1;

   public:
    explicit CollectionOperationCodec(
        std::shared_ptr<const codec::Codec<Payload>> payload_codec)
        : payload_codec_{std::move(payload_codec)} {}

    [[nodiscard]] std::optional<size_t> trySize(
        const Operation &value) const override {
      auto payload_size = payload_codec_->trySize(value.items);
      if (not payload_size.has_value()) {
        return std::nullopt;
      }
      return kTagSize + payload_size.value();
    }

    void write(const Operation &value, qtils::BytesOut out) const override {
      BOOST_ASSERT(out.size() >= kTagSize);
      out[0] = static_cast<uint8_t>(value.type);
      payload_codec_->write(value.items, out.subspan(kTagSize));
    }

    // tag goes to the sink too, so both paths give identical bytes
    void append(const Operation &value,
                codec::ByteSink &sink) const override {
      sink.putByte(static_cast<uint8_t>(value.type));
      payload_codec_->append(value.items, sink);
    }

    [[nodiscard]] Operation read(qtils::BytesIn in) const override {
      BOOST_ASSERT(in.size() >= kTagSize);
      return Operation{
          .type = static_cast<OperationType>(in[0]),
          .items = payload_codec_->read(in.subspan(kTagSize)),
      };
    }

   private:
    std::shared_ptr<const codec::Codec<Payload>> payload_codec_;
  };

}  // namespace kvext::merge

namespace kvext::codec {

  template <typename T>
  struct CodecComposer<merge::CollectionOperation<T>> {
    static outcome::result<
        std::shared_ptr<const Codec<merge::CollectionOperation<T>>>>
    compose(const CodecRegistry &registry) {
      OUTCOME_TRY(payload_codec, registry.get<std::vector<T>>());
      return std::make_shared<merge::CollectionOperationCodec<T>>(
          std::move(payload_codec));
    }
  };

}  // namespace kvext::codec
