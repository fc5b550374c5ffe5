/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

/**
 * @brief Declares CodecRegistry, the table from C++ type to codec used when
 * stores are registered.
 */

#pragma once

#include <memory>
#include <set>
#include <typeindex>
#include <vector>

#include <boost/container/flat_map.hpp>
#include <qtils/outcome.hpp>

#include "codec/codec.hpp"
#include "codec/codec_error.hpp"
#include "codec/collection_codec.hpp"

namespace kvext::codec {

  class CodecRegistry;

  /**
   * Builds a codec for T out of codecs already known to the registry.
   * The primary template knows nothing; specializations exist for
   * collections and merge operands.
   */
  template <typename T>
  struct CodecComposer {
    static outcome::result<std::shared_ptr<const Codec<T>>> compose(
        const CodecRegistry &) {
      return CodecError::NOT_REGISTERED;
    }
  };

  /**
   * @class CodecRegistry
   * @brief Type-indexed set of codecs.
   *
   * Lookups happen once per store registration. An explicitly registered
   * codec always wins; otherwise the codec is composed from element codecs
   * (std::vector<T>, std::set<T> and merge operands over T).
   */
  class CodecRegistry {
   public:
    /// Registry with codecs for the built-in scalar types, std::string and
    /// qtils::ByteVec
    static CodecRegistry withDefaults();

    /// Adds or replaces the codec for T
    template <typename T>
    CodecRegistry &registerCodec(std::shared_ptr<const Codec<T>> codec) {
      codecs_[std::type_index(typeid(T))] = std::move(codec);
      return *this;
    }

    template <typename T>
    [[nodiscard]] bool contains() const {
      return codecs_.count(std::type_index(typeid(T))) != 0;
    }

    /**
     * Resolves the codec for T
     * @return codec or CodecError::NOT_REGISTERED when neither T nor the
     * parts it is composed of have codecs
     */
    template <typename T>
    outcome::result<std::shared_ptr<const Codec<T>>> get() const {
      if (auto it = codecs_.find(std::type_index(typeid(T)));
          it != codecs_.end()) {
        return std::static_pointer_cast<const Codec<T>>(it->second);
      }
      return CodecComposer<T>::compose(*this);
    }

   private:
    boost::container::flat_map<std::type_index, std::shared_ptr<const void>>
        codecs_;
  };

  template <typename T>
  struct CodecComposer<std::vector<T>> {
    static outcome::result<std::shared_ptr<const Codec<std::vector<T>>>>
    compose(const CodecRegistry &registry) {
      OUTCOME_TRY(element_codec, registry.get<T>());
      return makeCollectionCodec<std::vector<T>>(std::move(element_codec));
    }
  };

  template <typename T>
  struct CodecComposer<std::set<T>> {
    static outcome::result<std::shared_ptr<const Codec<std::set<T>>>> compose(
        const CodecRegistry &registry) {
      OUTCOME_TRY(element_codec, registry.get<T>());
      return makeCollectionCodec<std::set<T>>(std::move(element_codec));
    }
  };

}  // namespace kvext::codec
