// Copyright (c) 2025 Renata Hodovan, Akos Kiss.
//
// Licensed under the BSD 3-Clause License
// <LICENSE.rst or https://opensource.org/licenses/BSD-3-Clause>.
// This file may not be copied, modified, or distributed except
// according to those terms.

#ifndef WORDINATOR_RUNTIME_GENERATOR_HPP
#define WORDINATOR_RUNTIME_GENERATOR_HPP

#include "../util/log.hpp"
#include "Config.hpp"
#include "Duplicates.hpp"
#include "Listener.hpp"
#include "Odometer.hpp"
#include "Pattern.hpp"
#include "Sink.hpp"

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace wordinator {
namespace runtime {

/*
 * Enumerates every candidate of a configuration in odometer order and
 * writes the ones passing the duplicate filter to the sink. Range mode runs
 * one uniform pattern per length, shortest first; template mode runs the
 * single template pattern. Listeners are borrowed, not owned.
 */
class Generator {
private:
  const Config& config_;
  Sink& sink_;
  std::vector<Listener*> listeners_;
  std::uint64_t emitted_{0};
  std::uint64_t considered_{0};

public:
  explicit Generator(const Config& config, Sink& sink, const std::vector<Listener*>& listeners = {})
      : config_(config), sink_(sink), listeners_(listeners) {
    validate(config_);
  }

  Generator(const Generator& other) = delete;
  Generator& operator=(const Generator& other) = delete;
  Generator(Generator&& other) = delete;
  Generator& operator=(Generator&& other) = delete;
  ~Generator() = default;

  // Returns the number of words written. Sink failures propagate as thrown.
  std::uint64_t run() {
    if (config_.tmpl) {
      generate(Pattern::from_template(*config_.tmpl, config_.charset));
    } else {
      for (std::size_t length = config_.min_len; length <= config_.max_len; ++length) {
        generate(Pattern::uniform(config_.charset, length));
      }
    }
    return emitted_;
  }

  std::uint64_t emitted() const { return emitted_; }
  std::uint64_t considered() const { return considered_; }

private:
  void generate(const Pattern& pattern) {
    WORDINATOR_LOG_TRACE("Enumerating pattern of length {}.", pattern.size());
    for (Listener* listener : listeners_) {
      listener->enter_pattern(pattern);
    }

    Odometer odometer(pattern);
    do {
      const std::string& word = odometer.current();
      bool emit = !config_.no_duplicates || !has_adjacent_repeat(word);
      if (emit) {
        sink_.write(word);
        ++emitted_;
      }
      ++considered_;
      for (Listener* listener : listeners_) {
        listener->candidate(word, emit);
      }
    } while (odometer.next());

    for (int i = static_cast<int>(listeners_.size()) - 1; i >= 0; i--) {
      listeners_[i]->exit_pattern(pattern);
    }
  }
};

} // namespace runtime
} // namespace wordinator

#endif // WORDINATOR_RUNTIME_GENERATOR_HPP
