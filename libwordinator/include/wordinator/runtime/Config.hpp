// Copyright (c) 2025 Renata Hodovan, Akos Kiss.
//
// Licensed under the BSD 3-Clause License
// <LICENSE.rst or https://opensource.org/licenses/BSD-3-Clause>.
// This file may not be copied, modified, or distributed except
// according to those terms.

#ifndef WORDINATOR_RUNTIME_CONFIG_HPP
#define WORDINATOR_RUNTIME_CONFIG_HPP

#include <array>
#include <cstddef>
#include <format>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>

namespace wordinator {
namespace runtime {

inline constexpr std::string_view DIGITS = "0123456789";
inline constexpr char CHARSET_SLOT = '@';
inline constexpr char DIGIT_SLOT = '%';

// Longest word range mode will enumerate.
inline constexpr std::size_t MAX_LENGTH = 65536;

class ConfigError : public std::invalid_argument {
public:
  using std::invalid_argument::invalid_argument;
};

/*
 * Resolved generation settings. Without a template, every word of length
 * min_len..max_len over charset is enumerated. With a template, '@' slots
 * take a charset character, '%' slots a decimal digit, and everything else
 * is copied verbatim; min_len and max_len are ignored then.
 */
struct Config {
  std::size_t min_len{0};
  std::size_t max_len{0};
  std::string charset;
  std::optional<std::string> tmpl;
  bool no_duplicates{false};
};

inline bool is_digit(char c) {
  return c >= '0' && c <= '9';
}

inline bool is_slot(char c) {
  return c == CHARSET_SLOT || c == DIGIT_SLOT;
}

inline void validate(const Config& config) {
  if (config.charset.empty()) {
    throw ConfigError("charset must not be empty");
  }

  std::array<bool, 256> seen{};
  for (char c : config.charset) {
    auto idx = static_cast<unsigned char>(c);
    if (seen[idx]) {
      throw ConfigError(std::format("charset contains '{}' more than once", c));
    }
    seen[idx] = true;
  }

  if (config.tmpl) {
    const std::string& tmpl = *config.tmpl;
    if (tmpl.empty()) {
      throw ConfigError("template must not be empty");
    }
    if (tmpl.find_first_of("@%") == std::string::npos) {
      throw ConfigError(std::format("template '{}' has no '@' or '%' slot", tmpl));
    }
    return;
  }

  if (config.min_len == 0) {
    throw ConfigError("minimum length must be positive");
  }
  if (config.min_len > config.max_len) {
    throw ConfigError(std::format("minimum length {} exceeds maximum length {}", config.min_len, config.max_len));
  }
  if (config.max_len > MAX_LENGTH) {
    throw ConfigError(std::format("maximum length {} exceeds the limit of {}", config.max_len, MAX_LENGTH));
  }
}

} // namespace runtime
} // namespace wordinator

#endif // WORDINATOR_RUNTIME_CONFIG_HPP
