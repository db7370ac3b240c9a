// Copyright (c) 2025 Renata Hodovan, Akos Kiss.
//
// Licensed under the BSD 3-Clause License
// <LICENSE.rst or https://opensource.org/licenses/BSD-3-Clause>.
// This file may not be copied, modified, or distributed except
// according to those terms.

#ifndef WORDINATOR_TOOL_PROGRESSREPORTER_HPP
#define WORDINATOR_TOOL_PROGRESSREPORTER_HPP

#include "../runtime/Listener.hpp"
#include "../util/checked.hpp"
#include "../util/print.hpp"

#include <cstdint>
#include <iostream>
#include <ostream>
#include <string_view>

namespace wordinator {
namespace tool {

/*
 * Prints "N% done" lines while the generator runs. A milestone is printed
 * whenever the percentage of candidates considered advanced by at least
 * STEP since the last printed one. Owns the running tally; create one per
 * run.
 */
class ProgressReporter : public runtime::Listener {
public:
  static constexpr std::uint64_t STEP = 5;

private:
  std::uint64_t total_;
  std::ostream& out_;
  std::uint64_t current_{0};
  std::uint64_t last_percentage_{0};

public:
  explicit ProgressReporter(std::uint64_t total, std::ostream& out = std::cerr)
      : total_(total), out_(out) { }

  ProgressReporter(const ProgressReporter& other) = delete;
  ProgressReporter& operator=(const ProgressReporter& other) = delete;
  ProgressReporter(ProgressReporter&& other) = delete;
  ProgressReporter& operator=(ProgressReporter&& other) = delete;
  ~ProgressReporter() override = default;

  void begin() {
    util::printf_to(out_, "0% done");
  }

  void candidate(std::string_view word, bool emitted) override {
    ++current_;
    if (total_ == 0) {
      return;
    }

    std::uint64_t percentage = percentage_done();
    if (percentage >= last_percentage_ + STEP) {
      last_percentage_ = percentage;
      util::printf_to(out_, "{}% done", percentage);
    }
  }

  void finish() {
    util::printf_to(out_, "100% done");
  }

  std::uint64_t current() const { return current_; }
  std::uint64_t total() const { return total_; }

private:
  std::uint64_t percentage_done() const {
    if (auto scaled = util::checked_mul(current_, 100)) {
      return *scaled / total_;
    }
    return static_cast<std::uint64_t>(static_cast<long double>(current_) / total_ * 100);
  }
};

} // namespace tool
} // namespace wordinator

#endif // WORDINATOR_TOOL_PROGRESSREPORTER_HPP
