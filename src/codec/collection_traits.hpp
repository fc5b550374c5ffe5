/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <set>
#include <string_view>
#include <vector>

namespace kvext::codec {

  /**
   * @brief Describes how a decoded collection is built.
   *
   * Specializations provide the element type, the kind name, creation with a known element
   * count and insertion of one decoded element.
   */
  template <typename C>
  struct CollectionTraits;

  template <typename T>
  struct CollectionTraits<std::vector<T>> {
    using Element = T;
    static constexpr std::string_view kKind = "list";

    static std::vector<T> create(size_t capacity) {
      std::vector<T> collection;
      collection.reserve(capacity);
      return collection;
    }

    static void add(std::vector<T> &collection, T &&element) {
      collection.emplace_back(std::move(element));
    }
  };

  template <typename T>
  struct CollectionTraits<std::set<T>> {
    using Element = T;
    static constexpr std::string_view kKind = "set";

    static std::set<T> create(size_t) {
      return {};
    }

    static void add(std::set<T> &collection, T &&element) {
      collection.emplace(std::move(element));
    }
  };

  template <typename C>
  concept Collection = requires { typename CollectionTraits<C>::Element; };

  template <Collection C>
  using ElementOf = typename CollectionTraits<C>::Element;

}  // namespace kvext::codec
