// Copyright (c) 2025 Renata Hodovan, Akos Kiss.
//
// Licensed under the BSD 3-Clause License
// <LICENSE.rst or https://opensource.org/licenses/BSD-3-Clause>.
// This file may not be copied, modified, or distributed except
// according to those terms.

#include <wordinator/util/checked.hpp>
#include <wordinator/util/size.hpp>

#include <gtest/gtest.h>

#include <cstdint>
#include <limits>

using namespace wordinator::util;

TEST(HumanSize, Bytes) {
  EXPECT_EQ(human_size(0), "0 B");
  EXPECT_EQ(human_size(6), "48 B");
  EXPECT_EQ(human_size(127), "1016 B");
}

TEST(HumanSize, BinaryUnits) {
  EXPECT_EQ(human_size(128), "1.00 KB");
  EXPECT_EQ(human_size(192), "1.50 KB");
  EXPECT_EQ(human_size(131072), "1.00 MB");
  EXPECT_EQ(human_size(134217728), "1.00 GB");
}

TEST(HumanSize, SaturatesInsteadOfWrapping) {
  EXPECT_EQ(human_size(std::numeric_limits<std::uint64_t>::max()), "17179869184.00 GB");
}

TEST(Checked, DetectsOverflow) {
  constexpr auto max = std::numeric_limits<std::uint64_t>::max();
  EXPECT_EQ(checked_add(1, 2), 3u);
  EXPECT_FALSE(checked_add(max, 1));
  EXPECT_EQ(checked_mul(1ull << 31, 1ull << 32), 1ull << 63);
  EXPECT_FALSE(checked_mul(1ull << 32, 1ull << 32));
  EXPECT_EQ(checked_pow(10, 19), 10000000000000000000ull);
  EXPECT_FALSE(checked_pow(10, 20));
  EXPECT_EQ(checked_pow(0, 0), 1u);
  EXPECT_EQ(saturating_mul(max, 2), max);
}

TEST(Checked, PowerOfZeroOrOneIsImmediate) {
  constexpr auto max = std::numeric_limits<std::uint64_t>::max();
  EXPECT_EQ(checked_pow(1, max), 1u);
  EXPECT_EQ(checked_pow(0, max), 0u);
  EXPECT_EQ(checked_pow(1, 0), 1u);
}
