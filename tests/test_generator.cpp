// Copyright (c) 2025 Renata Hodovan, Akos Kiss.
//
// Licensed under the BSD 3-Clause License
// <LICENSE.rst or https://opensource.org/licenses/BSD-3-Clause>.
// This file may not be copied, modified, or distributed except
// according to those terms.

#include <wordinator/runtime/Config.hpp>
#include <wordinator/runtime/Counter.hpp>
#include <wordinator/runtime/Duplicates.hpp>
#include <wordinator/runtime/Generator.hpp>
#include <wordinator/runtime/Listener.hpp>
#include <wordinator/runtime/Odometer.hpp>
#include <wordinator/runtime/Pattern.hpp>

#include <gtest/gtest.h>

#include <cstdint>
#include <set>
#include <string>
#include <vector>

#include "CollectingSink.hpp"

using namespace wordinator::runtime;

namespace {

class RecordingListener : public Listener {
public:
  std::vector<std::size_t> entered;
  std::vector<std::size_t> exited;
  std::uint64_t considered{0};
  std::uint64_t emitted{0};

  void enter_pattern(const Pattern& pattern) override { entered.push_back(pattern.size()); }
  void exit_pattern(const Pattern& pattern) override { exited.push_back(pattern.size()); }

  void candidate(std::string_view word, bool was_emitted) override {
    ++considered;
    if (was_emitted) {
      ++emitted;
    }
  }
};

std::vector<Config> sample_configs() {
  std::vector<Config> configs;
  for (bool no_duplicates : {false, true}) {
    configs.push_back(range_config("ab", 1, 2, no_duplicates));
    configs.push_back(range_config("abc", 1, 4, no_duplicates));
    configs.push_back(range_config("a1", 1, 5, no_duplicates));
    configs.push_back(range_config("ab01", 2, 4, no_duplicates));
    configs.push_back(range_config("z", 1, 3, no_duplicates));
    configs.push_back(template_config("%%-@@", "xy", no_duplicates));
    configs.push_back(template_config("a@", "ab", no_duplicates));
    configs.push_back(template_config("@@%", "a1b", no_duplicates));
    configs.push_back(template_config("x@@x", "xyz", no_duplicates));
    configs.push_back(template_config("%@", "5q", no_duplicates));
    configs.push_back(template_config("--@", "-+", no_duplicates));
  }
  return configs;
}

}  // namespace

TEST(Generator, ScenarioRangeWithoutSuppression) {
  EXPECT_EQ(generate_all(range_config("ab", 1, 2)),
            (std::vector<std::string>{"a", "b", "aa", "ab", "ba", "bb"}));
}

TEST(Generator, ScenarioRangeWithSuppression) {
  EXPECT_EQ(generate_all(range_config("ab", 2, 2, true)), (std::vector<std::string>{"ab", "ba"}));
}

TEST(Generator, ScenarioDigitAndCharsetTemplate) {
  auto lines = generate_all(template_config("%%-@@", "xy"));
  ASSERT_EQ(lines.size(), 400u);
  EXPECT_EQ(lines.front(), "00-xx");
  EXPECT_EQ(lines[1], "00-xy");
  EXPECT_EQ(lines[4], "01-xx");
  EXPECT_EQ(lines.back(), "99-yy");
  for (const auto& line : lines) {
    ASSERT_EQ(line.size(), 5u);
    EXPECT_TRUE(is_digit(line[0]) && is_digit(line[1])) << line;
    EXPECT_EQ(line[2], '-');
    EXPECT_TRUE(line[3] == 'x' || line[3] == 'y') << line;
    EXPECT_TRUE(line[4] == 'x' || line[4] == 'y') << line;
  }
  EXPECT_EQ(std::set<std::string>(lines.begin(), lines.end()).size(), 400u);
}

TEST(Generator, RangeFollowsCharsetOrder) {
  EXPECT_EQ(generate_all(range_config("ba", 2, 2)), (std::vector<std::string>{"bb", "ba", "ab", "aa"}));
}

TEST(Generator, RangeLengthClassSizes) {
  auto lines = generate_all(range_config("abc", 1, 3));
  std::vector<std::size_t> by_length(4, 0);
  for (const auto& line : lines) {
    ++by_length[line.size()];
  }
  EXPECT_EQ(by_length[1], 3u);
  EXPECT_EQ(by_length[2], 9u);
  EXPECT_EQ(by_length[3], 27u);
}

TEST(Generator, SuppressionKeepsRepeatedDigits) {
  auto lines = generate_all(range_config("a1", 2, 2, true));
  EXPECT_EQ(lines, (std::vector<std::string>{"a1", "1a", "11"}));
}

TEST(Generator, SuppressionAppliesToRenderedTemplate) {
  EXPECT_EQ(generate_all(template_config("a@", "ab", true)), (std::vector<std::string>{"ab"}));
  EXPECT_EQ(generate_all(template_config("x@@x", "xyz", true)), (std::vector<std::string>{"xyzx", "xzyx"}));
}

TEST(Generator, CountMatchesEmittedLines) {
  for (const auto& config : sample_configs()) {
    CollectingSink sink;
    RecordingListener listener;
    Generator generator(config, sink, {&listener});
    std::uint64_t emitted = generator.run();

    std::string label = config.tmpl.value_or("range") + " over " + config.charset +
                        (config.no_duplicates ? " (no duplicates)" : "");
    EXPECT_EQ(emitted, count(config)) << label;
    EXPECT_EQ(sink.lines.size(), count(config)) << label;
    EXPECT_EQ(listener.considered, count_candidates(config)) << label;
    EXPECT_EQ(listener.emitted, emitted) << label;
    EXPECT_EQ(generator.considered(), listener.considered) << label;
  }
}

TEST(Generator, NoAdjacentRepeatsWhenSuppressed) {
  for (const auto& config : sample_configs()) {
    if (!config.no_duplicates) {
      continue;
    }
    for (const auto& line : generate_all(config)) {
      EXPECT_FALSE(has_adjacent_repeat(line)) << line;
    }
  }
}

TEST(Generator, TemplateKeepsLengthAndLiterals) {
  const std::string tmpl = "id-%@_@";
  for (const auto& line : generate_all(template_config(tmpl, "pq", true))) {
    ASSERT_EQ(line.size(), tmpl.size());
    for (std::size_t i = 0; i < tmpl.size(); ++i) {
      if (!is_slot(tmpl[i])) {
        EXPECT_EQ(line[i], tmpl[i]) << line;
      }
    }
  }
}

TEST(Generator, RepeatableOutput) {
  auto config = template_config("@%@", "k9m", true);
  EXPECT_EQ(generate_all(config), generate_all(config));
}

TEST(Generator, ListenersSeeEveryPattern) {
  CollectingSink sink;
  RecordingListener listener;
  Config config = range_config("ab", 2, 4);
  Generator generator(config, sink, {&listener});
  generator.run();
  EXPECT_EQ(listener.entered, (std::vector<std::size_t>{2, 3, 4}));
  EXPECT_EQ(listener.exited, (std::vector<std::size_t>{2, 3, 4}));
}

TEST(Generator, RejectsInvalidConfiguration) {
  CollectingSink sink;
  Config config = template_config("@@", "aaa");
  EXPECT_THROW({ Generator generator(config, sink); }, ConfigError);
  EXPECT_TRUE(sink.lines.empty());
}

TEST(Odometer, SkipsFixedPositions) {
  Pattern pattern = Pattern::from_template("@-%", "a");
  Odometer odometer(pattern);
  std::vector<std::string> words;
  do {
    words.push_back(odometer.current());
  } while (odometer.next());
  ASSERT_EQ(words.size(), 10u);
  EXPECT_EQ(words.front(), "a-0");
  EXPECT_EQ(words.back(), "a-9");
}

TEST(Odometer, WrapsToFirstWord) {
  Pattern pattern = Pattern::uniform("xy", 2);
  Odometer odometer(pattern);
  EXPECT_TRUE(odometer.next());
  EXPECT_TRUE(odometer.next());
  EXPECT_TRUE(odometer.next());
  EXPECT_EQ(odometer.current(), "yy");
  EXPECT_FALSE(odometer.next());
  EXPECT_EQ(odometer.current(), "xx");
}
