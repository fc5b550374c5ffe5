/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <algorithm>
#include <cctype>
#include <charconv>
#include <cstdint>
#include <limits>
#include <optional>
#include <string_view>
#include <utility>

namespace kvext::util {

  /// ASCII case-insensitive equality, used for column family names
  inline bool iequals(std::string_view lhs, std::string_view rhs) {
    return std::ranges::equal(lhs, rhs, [](unsigned char l, unsigned char r) {
      return std::tolower(l) == std::tolower(r);
    });
  }

  namespace detail {
    inline std::string_view trim(std::string_view text) {
      auto is_space = [](unsigned char c) { return std::isspace(c) != 0; };
      while (not text.empty() and is_space(text.front())) {
        text.remove_prefix(1);
      }
      while (not text.empty() and is_space(text.back())) {
        text.remove_suffix(1);
      }
      return text;
    }
  }  // namespace detail

  /**
   * Byte quantity of the `cache_size` option: a decimal number followed by
   * an optional unit. Single letters and `KiB`-style units are binary,
   * `KB`-style units are decimal; units are case-insensitive.
   * @return nullopt for malformed input or on overflow
   */
  inline std::optional<uint64_t> parseByteQuantity(std::string_view input) {
    input = detail::trim(input);

    uint64_t number = 0;
    auto [end, ec] =
        std::from_chars(input.data(), input.data() + input.size(), number);
    if (ec != std::errc{}) {
      return std::nullopt;
    }
    auto unit = detail::trim(input.substr(end - input.data()));

    static constexpr std::pair<std::string_view, uint64_t> kUnits[] = {
        {"", 1},
        {"b", 1},
        {"k", 1ull << 10},
        {"kib", 1ull << 10},
        {"kb", 1'000ull},
        {"m", 1ull << 20},
        {"mib", 1ull << 20},
        {"mb", 1'000'000ull},
        {"g", 1ull << 30},
        {"gib", 1ull << 30},
        {"gb", 1'000'000'000ull},
        {"t", 1ull << 40},
        {"tib", 1ull << 40},
        {"tb", 1'000'000'000'000ull},
    };
    for (const auto &[name, multiplier] : kUnits) {
      if (not iequals(name, unit)) {
        continue;
      }
      if (number > std::numeric_limits<uint64_t>::max() / multiplier) {
        return std::nullopt;
      }
      return number * multiplier;
    }
    return std::nullopt;
  }

}  // namespace kvext::util
