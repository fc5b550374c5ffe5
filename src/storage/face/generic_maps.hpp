/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

/**
 * @brief Interfaces of an ordered key-value map with merge support, as
 * implemented by one column family of the storage engine.
 */

#pragma once

#include <memory>
#include <optional>

#include <qtils/outcome.hpp>

namespace kvext::storage::face {

  /// Type in which keys and values are passed into the map
  template <typename T>
  struct ViewTrait;

  template <typename T>
  using View = typename ViewTrait<T>::type;

  /// Type in which values are returned from the map
  template <typename T>
  struct OwnedOrViewTrait;

  template <typename T>
  using OwnedOrView = typename OwnedOrViewTrait<T>::type;

  template <typename K, typename V>
  struct Readable {
    virtual ~Readable() = default;

    [[nodiscard]] virtual outcome::result<bool> contains(
        const View<K> &key) const = 0;

    /// @return value, or an error if the key is absent
    [[nodiscard]] virtual outcome::result<OwnedOrView<V>> get(
        const View<K> &key) const = 0;

    [[nodiscard]] virtual outcome::result<std::optional<OwnedOrView<V>>> tryGet(
        const View<K> &key) const = 0;
  };

  template <typename K, typename V>
  struct Writeable {
    virtual ~Writeable() = default;

    virtual outcome::result<void> put(const View<K> &key,
                                      const View<V> &value) = 0;

    /// Removing an absent key is not an error
    virtual outcome::result<void> remove(const View<K> &key) = 0;
  };

  /**
   * Merge operands are resolved into the stored value by the merge operator
   * of the map, lazily, on read or during compaction
   */
  template <typename K, typename O>
  struct Mergeable {
    virtual ~Mergeable() = default;

    virtual outcome::result<void> merge(const View<K> &key,
                                        const View<O> &operand) = 0;
  };

  /// Writes that become visible together on commit()
  template <typename K, typename V>
  struct WriteBatch : public Writeable<K, V> {
    virtual outcome::result<void> commit() = 0;

    /// Drops the writes recorded so far
    virtual void clear() = 0;
  };

  /// Position in the map ordered by key bytes
  template <typename K, typename V>
  struct MapCursor {
    virtual ~MapCursor() = default;

    /// @return true if the cursor points to an entry afterwards
    virtual outcome::result<bool> seekFirst() = 0;

    /// Moves to the first entry with key not less than @param key
    virtual outcome::result<bool> seek(const View<K> &key) = 0;

    virtual outcome::result<bool> seekLast() = 0;

    [[nodiscard]] virtual bool isValid() const = 0;

    virtual outcome::result<void> next() = 0;

    virtual outcome::result<void> prev() = 0;

    [[nodiscard]] virtual std::optional<K> key() const = 0;

    [[nodiscard]] virtual std::optional<OwnedOrView<V>> value() const = 0;
  };

  template <typename K, typename V>
  struct GenericStorage : Readable<K, V>, Writeable<K, V>, Mergeable<K, V> {
    using Cursor = MapCursor<K, V>;

    virtual std::unique_ptr<WriteBatch<K, V>> batch() = 0;

    virtual std::unique_ptr<Cursor> cursor() = 0;

    /// Removes every entry
    virtual outcome::result<void> clear() = 0;
  };

}  // namespace kvext::storage::face
