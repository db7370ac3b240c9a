// Copyright (c) 2025 Renata Hodovan, Akos Kiss.
//
// Licensed under the BSD 3-Clause License
// <LICENSE.rst or https://opensource.org/licenses/BSD-3-Clause>.
// This file may not be copied, modified, or distributed except
// according to those terms.

#ifndef WORDINATOR_UTIL_SIZE_HPP
#define WORDINATOR_UTIL_SIZE_HPP

#include "checked.hpp"

#include <cstdint>
#include <format>
#include <string>

namespace wordinator {
namespace util {

// Rough output size of `lines` words, assuming 8 bytes per line.
inline std::string human_size(std::uint64_t lines) {
  constexpr std::uint64_t KB = 1024;
  constexpr std::uint64_t MB = KB * 1024;
  constexpr std::uint64_t GB = MB * 1024;

  std::uint64_t bytes = saturating_mul(lines, 8);
  if (bytes >= GB) {
    return std::format("{:.2f} GB", static_cast<double>(bytes) / GB);
  }
  if (bytes >= MB) {
    return std::format("{:.2f} MB", static_cast<double>(bytes) / MB);
  }
  if (bytes >= KB) {
    return std::format("{:.2f} KB", static_cast<double>(bytes) / KB);
  }
  return std::format("{} B", bytes);
}

} // namespace util
} // namespace wordinator

#endif  // WORDINATOR_UTIL_SIZE_HPP
