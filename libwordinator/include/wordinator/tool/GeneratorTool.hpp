// Copyright (c) 2025 Renata Hodovan, Akos Kiss.
//
// Licensed under the BSD 3-Clause License
// <LICENSE.rst or https://opensource.org/licenses/BSD-3-Clause>.
// This file may not be copied, modified, or distributed except
// according to those terms.

#ifndef WORDINATOR_TOOL_GENERATORTOOL_HPP
#define WORDINATOR_TOOL_GENERATORTOOL_HPP

#include "../runtime/Config.hpp"
#include "../runtime/Counter.hpp"
#include "../runtime/Generator.hpp"
#include "../runtime/Listener.hpp"
#include "../runtime/Sink.hpp"
#include "../util/log.hpp"
#include "../util/print.hpp"
#include "../util/size.hpp"
#include "ProgressReporter.hpp"

#include <cstdint>
#include <iostream>
#include <ostream>
#include <vector>

namespace wordinator {
namespace tool {

class GeneratorTool {
private:
  runtime::Config config_;
  std::uint64_t total_;
  std::uint64_t candidates_;
  bool quiet_;
  std::ostream& info_;

public:
  // Validates the configuration and precomputes both counts, so that
  // ConfigError (including counter overflow) is raised before any output.
  explicit GeneratorTool(const runtime::Config& config, bool quiet = false, std::ostream& info = std::cerr)
      : config_(config), total_(runtime::count(config_)), candidates_(runtime::count_candidates(config_)),
        quiet_(quiet), info_(info) {
    WORDINATOR_LOG_DEBUG("charset='{}' template='{}' min_len={} max_len={} no_duplicates={}",
                         config_.charset, config_.tmpl.value_or(""), config_.min_len, config_.max_len,
                         config_.no_duplicates);
    WORDINATOR_LOG_DEBUG("{} words out of {} candidates", total_, candidates_);
  }

  GeneratorTool(const GeneratorTool& other) = delete;
  GeneratorTool& operator=(const GeneratorTool& other) = delete;
  GeneratorTool(GeneratorTool&& other) = delete;
  GeneratorTool& operator=(GeneratorTool&& other) = delete;
  ~GeneratorTool() = default;

  std::uint64_t total() const { return total_; }
  std::uint64_t candidates() const { return candidates_; }

  // Silent in quiet mode.
  void print_estimate() const {
    if (quiet_) {
      return;
    }
    util::printf_to(info_, "Will create approx: {} ({} combinations)", util::human_size(total_), total_);
  }

  // Writes the whole wordlist to the sink and returns the number of words.
  // Either completes or throws; nothing is retried.
  std::uint64_t run(runtime::Sink& sink) {
    std::uint64_t emitted;
    if (quiet_) {
      runtime::Generator generator(config_, sink);
      emitted = generator.run();
      sink.flush();
    } else {
      print_estimate();
      ProgressReporter reporter(candidates_, info_);
      reporter.begin();
      runtime::Generator generator(config_, sink, {&reporter});
      emitted = generator.run();
      sink.flush();
      reporter.finish();
    }

    if (emitted != total_) {
      WORDINATOR_LOG_ERROR("Wrote {} words but {} were counted.", emitted, total_);
    }
    return emitted;
  }
};

} // namespace tool
} // namespace wordinator

#endif // WORDINATOR_TOOL_GENERATORTOOL_HPP
