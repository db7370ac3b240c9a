// Copyright (c) 2025 Renata Hodovan, Akos Kiss.
//
// Licensed under the BSD 3-Clause License
// <LICENSE.rst or https://opensource.org/licenses/BSD-3-Clause>.
// This file may not be copied, modified, or distributed except
// according to those terms.

#ifndef WORDINATOR_RUNTIME_DUPLICATES_HPP
#define WORDINATOR_RUNTIME_DUPLICATES_HPP

#include "Config.hpp"

#include <cstddef>
#include <string_view>

namespace wordinator {
namespace runtime {

// True if two neighbouring characters of the rendered word are equal and
// are not digits. Repeated digits never count.
inline bool has_adjacent_repeat(std::string_view word) {
  for (std::size_t i = 1; i < word.size(); ++i) {
    if (word[i] == word[i - 1] && !is_digit(word[i])) {
      return true;
    }
  }
  return false;
}

} // namespace runtime
} // namespace wordinator

#endif // WORDINATOR_RUNTIME_DUPLICATES_HPP
