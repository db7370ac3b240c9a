// Copyright (c) 2025 Renata Hodovan, Akos Kiss.
//
// Licensed under the BSD 3-Clause License
// <LICENSE.rst or https://opensource.org/licenses/BSD-3-Clause>.
// This file may not be copied, modified, or distributed except
// according to those terms.

#ifndef WORDINATOR_UTIL_PRINT_HPP
#define WORDINATOR_UTIL_PRINT_HPP

#include <format>
#include <ostream>
#include <string_view>

namespace wordinator {
namespace util {

// Formatted line to an arbitrary stream. Flushes, since progress lines must
// show up while a long enumeration is still running.
template<typename... Args>
void printf_to(std::ostream& out, std::string_view fmt, Args&&... args) {
  out << std::vformat(fmt, std::make_format_args(args...)) << std::endl;
}

} // namespace util
} // namespace wordinator

#endif  // WORDINATOR_UTIL_PRINT_HPP
