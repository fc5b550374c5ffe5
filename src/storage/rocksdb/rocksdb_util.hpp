/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <string>

#include <fmt/format.h>
#include <fmt/ranges.h>
#include <qtils/byte_vec.hpp>
#include <qtils/bytes.hpp>
#include <rocksdb/slice.h>
#include <rocksdb/status.h>

#include "log/logger.hpp"
#include "storage/storage_error.hpp"

namespace kvext::storage {
  /// Maps a failed @param s to StorageError, logging everything but NotFound
  inline StorageError status_as_error(const rocksdb::Status &s,
                                      const log::Logger &log) {
    using Code = rocksdb::Status::Code;
    switch (s.code()) {
      case Code::kNotFound:
        return StorageError::NOT_FOUND;
      case Code::kIOError:
        SL_ERROR(log, "I/O error: {}", s.ToString());
        return StorageError::IO_ERROR;
      case Code::kInvalidArgument:
        SL_DEBUG(log, "Invalid argument: {}", s.ToString());
        return StorageError::INVALID_ARGUMENT;
      case Code::kCorruption:
        SL_ERROR(log, "Corruption: {}", s.ToString());
        return StorageError::CORRUPTION;
      case Code::kNotSupported:
        SL_DEBUG(log, "Not supported: {}", s.ToString());
        return StorageError::NOT_SUPPORTED;
      default:
        SL_ERROR(log, "Unexpected status: {}", s.ToString());
        return StorageError::UNKNOWN;
    }
  }

  /// Status of a read whose merge callback returned false
  inline bool is_merge_failure(const rocksdb::Status &s) {
    return s.IsCorruption()
       and s.subcode() == rocksdb::Status::SubCode::kMergeOperatorFailed;
  }

  inline rocksdb::Slice make_slice(qtils::BytesIn buf) {
    // NOLINTNEXTLINE(cppcoreguidelines-pro-type-reinterpret-cast)
    const auto *ptr = reinterpret_cast<const char *>(buf.data());
    size_t n = buf.size();
    return rocksdb::Slice{ptr, n};
  }

  inline qtils::BytesIn make_span(const rocksdb::Slice &s) {
    // NOLINTNEXTLINE(cppcoreguidelines-pro-type-reinterpret-cast)
    return {reinterpret_cast<const uint8_t *>(s.data()), s.size()};
  }

  inline qtils::ByteVec make_buffer(const rocksdb::Slice &s) {
    // NOLINTNEXTLINE(cppcoreguidelines-pro-type-reinterpret-cast)
    const auto *ptr = reinterpret_cast<const uint8_t *>(s.data());
    // NOLINTNEXTLINE(cppcoreguidelines-pro-bounds-pointer-arithmetic)
    return {ptr, ptr + s.size()};
  }

  inline qtils::ByteVec make_buffer(const std::string &s) {
    return make_buffer(rocksdb::Slice{s});
  }

  /// Hex form of a key, for logs
  inline std::string toHex(const rocksdb::Slice &s) {
    return fmt::format("0x{:02x}", fmt::join(make_span(s), ""));
  }
}  // namespace kvext::storage
