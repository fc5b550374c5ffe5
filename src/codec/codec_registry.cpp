/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "codec/codec_registry.hpp"

#include "codec/scalar_codecs.hpp"

namespace kvext::codec {

  namespace {
    template <Scalar T>
    void registerScalar(CodecRegistry &registry) {
      registry.registerCodec<T>(std::make_shared<ScalarCodec<T>>());
    }
  }  // namespace

  CodecRegistry CodecRegistry::withDefaults() {
    CodecRegistry registry;
    registerScalar<int32_t>(registry);
    registerScalar<int64_t>(registry);
    registerScalar<uint32_t>(registry);
    registerScalar<uint64_t>(registry);
    registerScalar<double>(registry);
    registerScalar<bool>(registry);
    registry.registerCodec<std::string>(std::make_shared<StringCodec>());
    registry.registerCodec<qtils::ByteVec>(std::make_shared<ByteVecCodec>());
    return registry;
  }

}  // namespace kvext::codec
