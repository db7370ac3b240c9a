// Copyright (c) 2025 Renata Hodovan, Akos Kiss.
//
// Licensed under the BSD 3-Clause License
// <LICENSE.rst or https://opensource.org/licenses/BSD-3-Clause>.
// This file may not be copied, modified, or distributed except
// according to those terms.

#ifndef WORDINATOR_RUNTIME_COUNTER_HPP
#define WORDINATOR_RUNTIME_COUNTER_HPP

#include "../util/checked.hpp"
#include "Config.hpp"
#include "Pattern.hpp"

#include <algorithm>
#include <array>
#include <cstddef>
#include <cstdint>
#include <format>
#include <optional>
#include <string_view>

namespace wordinator {
namespace runtime {

inline std::uint64_t counted(std::optional<std::uint64_t> value) {
  if (!value) {
    throw ConfigError("number of combinations exceeds the 64-bit counter");
  }
  return *value;
}

// Words of one length without duplicate suppression: |charset|^length.
inline std::uint64_t count_length(std::string_view charset, std::size_t length) {
  return counted(util::checked_pow(charset.size(), length));
}

/*
 * Words of one length that survive duplicate suppression. Charset symbols
 * fall into two classes: digits, which may repeat, and the rest, which may
 * not follow themselves. Tracking how many surviving prefixes end in each
 * class gives
 *
 *   digit'    = (digit + other) * D
 *   other'    = digit * N + other * (N - 1)
 *
 * with D digits and N other symbols in the charset. Without digits this is
 * |charset| * (|charset| - 1)^(length - 1).
 */
inline std::uint64_t count_length_no_duplicates(std::string_view charset, std::size_t length) {
  if (length == 0) {
    return 1;
  }

  std::uint64_t digits = std::count_if(charset.begin(), charset.end(), is_digit);
  std::uint64_t others = charset.size() - digits;

  std::uint64_t ending_digit = digits;
  std::uint64_t ending_other = others;
  for (std::size_t i = 1; i < length; ++i) {
    std::uint64_t total = counted(util::checked_add(ending_digit, ending_other));
    std::uint64_t next_digit = counted(util::checked_mul(total, digits));
    std::uint64_t next_other = counted(util::checked_add(counted(util::checked_mul(ending_digit, others)),
                                                         counted(util::checked_mul(ending_other, others > 0 ? others - 1 : 0))));
    // A fixed point repeats for every longer length.
    if (next_digit == ending_digit && next_other == ending_other) {
      break;
    }
    ending_digit = next_digit;
    ending_other = next_other;
  }
  return counted(util::checked_add(ending_digit, ending_other));
}

// Candidates of a pattern before filtering: the product of its alphabet sizes.
inline std::uint64_t count_pattern(const Pattern& pattern) {
  std::uint64_t total = 1;
  for (std::size_t pos = 0; pos < pattern.size(); ++pos) {
    total = counted(util::checked_mul(total, pattern.alphabet(pos).size()));
  }
  return total;
}

/*
 * Rendered words of a pattern that survive duplicate suppression. Literal
 * positions take part, so "a@" over "ab" yields only "ab". ending[c] is the
 * number of surviving prefixes whose last character is c; a non-digit c may
 * extend every prefix except those already ending in c.
 */
inline std::uint64_t count_pattern_no_duplicates(const Pattern& pattern) {
  std::array<std::uint64_t, 256> ending{};
  std::uint64_t total = 1;

  for (std::size_t pos = 0; pos < pattern.size(); ++pos) {
    std::array<std::uint64_t, 256> next{};
    std::uint64_t next_total = 0;
    for (char c : pattern.alphabet(pos)) {
      auto idx = static_cast<unsigned char>(c);
      next[idx] = is_digit(c) ? total : total - ending[idx];
      next_total = counted(util::checked_add(next_total, next[idx]));
    }
    ending = next;
    total = next_total;
  }
  return total;
}

// Number of candidates the generator will consider, i.e. progress units.
inline std::uint64_t count_candidates(const Config& config) {
  validate(config);

  if (config.tmpl) {
    return count_pattern(Pattern::from_template(*config.tmpl, config.charset));
  }

  std::uint64_t total = 0;
  for (std::size_t length = config.min_len; length <= config.max_len; ++length) {
    total = counted(util::checked_add(total, count_length(config.charset, length)));
  }
  return total;
}

// Number of words the generator will write.
inline std::uint64_t count(const Config& config) {
  validate(config);

  if (config.tmpl) {
    Pattern pattern = Pattern::from_template(*config.tmpl, config.charset);
    return config.no_duplicates ? count_pattern_no_duplicates(pattern) : count_pattern(pattern);
  }

  std::uint64_t total = 0;
  for (std::size_t length = config.min_len; length <= config.max_len; ++length) {
    std::uint64_t words = config.no_duplicates ? count_length_no_duplicates(config.charset, length)
                                               : count_length(config.charset, length);
    total = counted(util::checked_add(total, words));
  }
  return total;
}

} // namespace runtime
} // namespace wordinator

#endif // WORDINATOR_RUNTIME_COUNTER_HPP
