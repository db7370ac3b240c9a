// Copyright (c) 2025 Renata Hodovan, Akos Kiss.
//
// Licensed under the BSD 3-Clause License
// <LICENSE.rst or https://opensource.org/licenses/BSD-3-Clause>.
// This file may not be copied, modified, or distributed except
// according to those terms.

#ifndef WORDINATOR_UTIL_CHECKED_HPP
#define WORDINATOR_UTIL_CHECKED_HPP

#include <cstdint>
#include <limits>
#include <optional>

namespace wordinator {
namespace util {

// Overflow-checked 64-bit arithmetic. An empty optional means the exact
// result is not representable.

inline std::optional<std::uint64_t> checked_add(std::uint64_t a, std::uint64_t b) {
  std::uint64_t result;
  if (__builtin_add_overflow(a, b, &result)) {
    return std::nullopt;
  }
  return result;
}

inline std::optional<std::uint64_t> checked_mul(std::uint64_t a, std::uint64_t b) {
  std::uint64_t result;
  if (__builtin_mul_overflow(a, b, &result)) {
    return std::nullopt;
  }
  return result;
}

// Terminates within 64 multiplications: any base above 1 overflows by then.
inline std::optional<std::uint64_t> checked_pow(std::uint64_t base, std::uint64_t exp) {
  if (base <= 1) {
    return exp == 0 ? 1 : base;
  }
  std::uint64_t result = 1;
  for (std::uint64_t i = 0; i < exp; ++i) {
    auto next = checked_mul(result, base);
    if (!next) {
      return std::nullopt;
    }
    result = *next;
  }
  return result;
}

inline std::uint64_t saturating_mul(std::uint64_t a, std::uint64_t b) {
  return checked_mul(a, b).value_or(std::numeric_limits<std::uint64_t>::max());
}

} // namespace util
} // namespace wordinator

#endif  // WORDINATOR_UTIL_CHECKED_HPP
