/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

/**
 * @brief Reusable byte buffers for encoding keys and values that don't fit
 * on the stack.
 */

#pragma once

#include <memory>
#include <mutex>
#include <vector>

#include <qtils/byte_vec.hpp>

#include "utils/ctor_limiters.hpp"

namespace kvext::storage {

  class PooledBuffer;

  /**
   * @class BufferPool
   * @brief Thread-safe free list of byte vectors.
   *
   * Buffers keep their capacity between uses. The pool retains at most
   * max_pooled buffers, and never one whose capacity exceeds
   * max_retained_capacity; such buffers are freed on release.
   */
  class BufferPool : NonCopyable, NonMovable {
   public:
    struct Stats {
      uint64_t acquired{0};     ///< total buffers handed out
      uint64_t released{0};     ///< total buffers given back
      uint64_t allocations{0};  ///< acquisitions not served by the free list
      size_t pooled{0};         ///< buffers currently in the free list
    };

    static constexpr size_t kDefaultMaxPooled = 64;
    static constexpr size_t kDefaultMaxRetainedCapacity = 1 << 20;

    explicit BufferPool(
        size_t max_pooled = kDefaultMaxPooled,
        size_t max_retained_capacity = kDefaultMaxRetainedCapacity);

    /// Pool shared by all accessors of the process
    static std::shared_ptr<BufferPool> shared();

    /**
     * Rents an empty buffer with capacity of at least @param min_capacity.
     * The pool must outlive the returned buffer.
     */
    [[nodiscard]] PooledBuffer acquire(size_t min_capacity);

    [[nodiscard]] Stats stats() const;

   private:
    friend class PooledBuffer;

    void release(qtils::ByteVec &&buffer) noexcept;

    const size_t max_pooled_;
    const size_t max_retained_capacity_;
    mutable std::mutex mutex_;
    std::vector<qtils::ByteVec> free_;
    Stats stats_;
  };

  /**
   * @class PooledBuffer
   * @brief Move-only owner of a rented buffer; gives it back to the pool
   * on destruction.
   */
  class PooledBuffer {
   public:
    PooledBuffer(BufferPool &pool, qtils::ByteVec buffer)
        : pool_{&pool}, buffer_{std::move(buffer)} {}

    PooledBuffer(PooledBuffer &&other) noexcept
        : pool_{other.pool_}, buffer_{std::move(other.buffer_)} {
      other.pool_ = nullptr;
    }

    PooledBuffer &operator=(PooledBuffer &&other) noexcept {
      if (this != &other) {
        giveBack();
        pool_ = other.pool_;
        buffer_ = std::move(other.buffer_);
        other.pool_ = nullptr;
      }
      return *this;
    }

    PooledBuffer(const PooledBuffer &) = delete;
    PooledBuffer &operator=(const PooledBuffer &) = delete;

    ~PooledBuffer() {
      giveBack();
    }

    qtils::ByteVec &get() {
      return buffer_;
    }

    const qtils::ByteVec &get() const {
      return buffer_;
    }

   private:
    void giveBack() noexcept {
      if (pool_ != nullptr) {
        pool_->release(std::move(buffer_));
        pool_ = nullptr;
      }
    }

    BufferPool *pool_;
    qtils::ByteVec buffer_;
  };

}  // namespace kvext::storage
