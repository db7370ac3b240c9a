// Copyright (c) 2025 Renata Hodovan, Akos Kiss.
//
// Licensed under the BSD 3-Clause License
// <LICENSE.rst or https://opensource.org/licenses/BSD-3-Clause>.
// This file may not be copied, modified, or distributed except
// according to those terms.

#ifndef WORDINATOR_RUNTIME_ODOMETER_HPP
#define WORDINATOR_RUNTIME_ODOMETER_HPP

#include "Pattern.hpp"

#include <cstddef>
#include <string>
#include <vector>

namespace wordinator {
namespace runtime {

/*
 * Mixed-radix counter over the variable positions of a pattern, most
 * significant (leftmost) position first. The rendered word is kept in a
 * buffer with one slot per pattern position; an increment only rewrites
 * the slots whose digit changed.
 */
class Odometer {
private:
  const Pattern& pattern_;
  std::vector<std::size_t> positions_;  // variable positions, left to right
  std::vector<std::size_t> digits_;
  std::string buffer_;

public:
  explicit Odometer(const Pattern& pattern)
      : pattern_(pattern), buffer_(pattern.size(), '\0') {
    for (std::size_t pos = 0; pos < pattern.size(); ++pos) {
      buffer_[pos] = pattern.alphabet(pos).front();
      if (pattern.variable(pos)) {
        positions_.push_back(pos);
      }
    }
    digits_.assign(positions_.size(), 0);
  }

  Odometer(const Odometer& other) = delete;
  Odometer& operator=(const Odometer& other) = delete;
  Odometer(Odometer&& other) = delete;
  Odometer& operator=(Odometer&& other) = delete;

  const std::string& current() const { return buffer_; }

  // Steps to the next word. Returns false once the first digit overflows,
  // leaving the odometer wrapped around to the initial word.
  bool next() {
    for (std::size_t i = positions_.size(); i-- > 0;) {
      std::size_t pos = positions_[i];
      std::string_view alphabet = pattern_.alphabet(pos);
      if (++digits_[i] < alphabet.size()) {
        buffer_[pos] = alphabet[digits_[i]];
        return true;
      }
      digits_[i] = 0;
      buffer_[pos] = alphabet.front();
    }
    return false;
  }
};

} // namespace runtime
} // namespace wordinator

#endif // WORDINATOR_RUNTIME_ODOMETER_HPP
