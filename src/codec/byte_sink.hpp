/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

/**
 * @brief Append-only byte destination used when the encoded size of a value
 * cannot be computed before writing.
 */

#pragma once

#include <cstdint>
#include <cstring>

#include <boost/assert.hpp>
#include <qtils/byte_vec.hpp>
#include <qtils/bytes.hpp>

namespace kvext::codec {

  /**
   * @class ByteSink
   * @brief Growable sink over an externally owned byte vector.
   *
   * The sink never shrinks the underlying vector: bytes are only appended.
   * Storage is borrowed, so the vector may come from a buffer pool and keep
   * its capacity between uses.
   */
  class ByteSink {
   public:
    /// Starts writing at the beginning of @param storage, discarding its
    /// previous contents
    explicit ByteSink(qtils::ByteVec &storage) : storage_{storage} {
      storage_.clear();
    }

    /**
     * Extends the sink by @param n bytes
     * @return writable span over exactly the appended region
     */
    qtils::BytesOut grow(size_t n) {
      const auto offset = storage_.size();
      storage_.resize(offset + n);
      return qtils::BytesOut{storage_.data() + offset, n};
    }

    void put(qtils::BytesIn bytes) {
      storage_.insert(storage_.end(), bytes.begin(), bytes.end());
    }

    void putByte(uint8_t byte) {
      storage_.push_back(byte);
    }

    /**
     * Overwrites already written bytes at @param offset.
     * Used to back-fill length prefixes whose value is known only after the
     * payload has been appended.
     */
    void patch(size_t offset, qtils::BytesIn bytes) {
      BOOST_ASSERT(offset + bytes.size() <= storage_.size());
      std::memcpy(storage_.data() + offset, bytes.data(), bytes.size());
    }

    size_t size() const {
      return storage_.size();
    }

    qtils::BytesIn written() const {
      return qtils::BytesIn{storage_.data(), storage_.size()};
    }

   private:
    // NOLINTNEXTLINE(cppcoreguidelines-avoid-const-or-ref-data-members)
    qtils::ByteVec &storage_;
  };

}  // namespace kvext::codec
