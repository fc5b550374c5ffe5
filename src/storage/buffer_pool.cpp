/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "storage/buffer_pool.hpp"

namespace kvext::storage {

  BufferPool::BufferPool(size_t max_pooled, size_t max_retained_capacity)
      : max_pooled_{max_pooled},
        max_retained_capacity_{max_retained_capacity} {
    // release() must not allocate
    free_.reserve(max_pooled_);
  }

  std::shared_ptr<BufferPool> BufferPool::shared() {
    static auto pool = std::make_shared<BufferPool>();
    return pool;
  }

  PooledBuffer BufferPool::acquire(size_t min_capacity) {
    qtils::ByteVec buffer;
    {
      std::lock_guard lock{mutex_};
      ++stats_.acquired;
      if (free_.empty()) {
        ++stats_.allocations;
      } else {
        buffer = std::move(free_.back());
        free_.pop_back();
        stats_.pooled = free_.size();
      }
    }
    buffer.clear();
    buffer.reserve(min_capacity);
    return PooledBuffer{*this, std::move(buffer)};
  }

  BufferPool::Stats BufferPool::stats() const {
    std::lock_guard lock{mutex_};
    return stats_;
  }

  void BufferPool::release(qtils::ByteVec &&buffer) noexcept {
    std::lock_guard lock{mutex_};
    ++stats_.released;
    if (free_.size() < max_pooled_
        and buffer.capacity() <= max_retained_capacity_) {
      free_.emplace_back(std::move(buffer));
      stats_.pooled = free_.size();
    }
  }

}  // namespace kvext::storage
