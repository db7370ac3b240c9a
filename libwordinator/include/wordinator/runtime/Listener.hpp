// Copyright (c) 2025 Renata Hodovan, Akos Kiss.
//
// Licensed under the BSD 3-Clause License
// <LICENSE.rst or https://opensource.org/licenses/BSD-3-Clause>.
// This file may not be copied, modified, or distributed except
// according to those terms.

#ifndef WORDINATOR_RUNTIME_LISTENER_HPP
#define WORDINATOR_RUNTIME_LISTENER_HPP

#include "Pattern.hpp"

#include <string_view>

namespace wordinator {
namespace runtime {

class Listener {
public:
  Listener() = default;
  Listener(const Listener& other) = delete;
  Listener& operator=(const Listener& other) = delete;
  Listener(Listener&& other) = delete;
  Listener& operator=(Listener&& other) = delete;
  virtual ~Listener() = default;

  virtual void enter_pattern(const Pattern& pattern) {}
  virtual void exit_pattern(const Pattern& pattern) {}

  // Called once per candidate, in enumeration order, whether or not it was
  // written to the sink.
  virtual void candidate(std::string_view word, bool emitted) {}
};

} // namespace runtime
} // namespace wordinator

#endif // WORDINATOR_RUNTIME_LISTENER_HPP
