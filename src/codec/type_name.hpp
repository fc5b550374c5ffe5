/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <type_traits>
#include <typeinfo>

#include <fmt/format.h>
#include <qtils/byte_vec.hpp>

#include "codec/collection_traits.hpp"

namespace kvext::codec {

  /**
   * Stable name of a stored type, part of default merge operator names.
   * Types without a fixed name fall back to the implementation-defined
   * typeid name.
   */
  template <typename T>
  std::string typeName() {
    if constexpr (std::is_same_v<T, bool>) {
      return "bool";
    } else if constexpr (std::is_same_v<T, int32_t>) {
      return "int32";
    } else if constexpr (std::is_same_v<T, int64_t>) {
      return "int64";
    } else if constexpr (std::is_same_v<T, uint32_t>) {
      return "uint32";
    } else if constexpr (std::is_same_v<T, uint64_t>) {
      return "uint64";
    } else if constexpr (std::is_same_v<T, double>) {
      return "double";
    } else if constexpr (std::is_same_v<T, std::string>) {
      return "string";
    } else if constexpr (std::is_same_v<T, qtils::ByteVec>) {
      return "bytes";
    } else if constexpr (Collection<T>) {
      return fmt::format(
          "{}<{}>", CollectionTraits<T>::kKind, typeName<ElementOf<T>>());
    } else {
      return typeid(T).name();
    }
  }

  /// `base<element>`, e.g. `ListMergeOperator<string>`
  template <typename T>
  std::string nameWithElement(std::string_view base) {
    return fmt::format("{}<{}>", base, typeName<T>());
  }

}  // namespace kvext::codec
