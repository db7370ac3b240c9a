// Copyright (c) 2025 Renata Hodovan, Akos Kiss.
//
// Licensed under the BSD 3-Clause License
// <LICENSE.rst or https://opensource.org/licenses/BSD-3-Clause>.
// This file may not be copied, modified, or distributed except
// according to those terms.

#ifndef WORDINATOR_RUNTIME_PATTERN_HPP
#define WORDINATOR_RUNTIME_PATTERN_HPP

#include "Config.hpp"

#include <cstddef>
#include <string_view>
#include <vector>

namespace wordinator {
namespace runtime {

/*
 * One alphabet per output position. A plain length class is `length`
 * copies of the charset; a template maps '@' to the charset, '%' to the
 * digits and a literal to a one-character alphabet of itself.
 *
 * The alphabets are views: the charset and the template must outlive the
 * pattern.
 */
class Pattern {
private:
  std::vector<std::string_view> alphabets_;

  Pattern() = default;

public:
  static Pattern uniform(std::string_view charset, std::size_t length) {
    if (charset.empty()) {
      throw ConfigError("charset must not be empty");
    }
    Pattern pattern;
    pattern.alphabets_.assign(length, charset);
    return pattern;
  }

  static Pattern from_template(std::string_view tmpl, std::string_view charset) {
    if (charset.empty()) {
      throw ConfigError("charset must not be empty");
    }
    Pattern pattern;
    pattern.alphabets_.reserve(tmpl.size());
    for (std::size_t i = 0; i < tmpl.size(); ++i) {
      switch (tmpl[i]) {
        case CHARSET_SLOT:
          pattern.alphabets_.push_back(charset);
          break;
        case DIGIT_SLOT:
          pattern.alphabets_.push_back(DIGITS);
          break;
        default:
          pattern.alphabets_.push_back(tmpl.substr(i, 1));
      }
    }
    return pattern;
  }

  std::size_t size() const { return alphabets_.size(); }
  std::string_view alphabet(std::size_t pos) const { return alphabets_[pos]; }
  bool variable(std::size_t pos) const { return alphabets_[pos].size() > 1; }
};

} // namespace runtime
} // namespace wordinator

#endif // WORDINATOR_RUNTIME_PATTERN_HPP
