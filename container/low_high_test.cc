// Copyright © 2017 by Donald King <chronos@chronos-tachyon.net>
// Available under the MIT License. See LICENSE for details.

#include "gtest/gtest.h"

#include <algorithm>
#include <functional>
#include <vector>

#include "container/low_high.h"
#include "math/rand/rand.h"

using Vec = std::vector<int>;

static void expect_low_high(const Vec& before, const Vec& after) {
  ASSERT_EQ(before.size(), after.size());
  if (before.empty()) return;
  EXPECT_EQ(*std::min_element(before.begin(), before.end()), after.front());
  EXPECT_EQ(*std::max_element(before.begin(), before.end()), after.back());
  EXPECT_TRUE(std::is_permutation(before.begin(), before.end(), after.begin()));
}

TEST(LowHigh, Basics) {
  Vec v{5, 3, 9, 1, 7};
  Vec orig = v;
  container::low_high(v.begin(), v.end());
  expect_low_high(orig, v);
  // 1 swaps with 5, then 9 swaps with 7.
  EXPECT_EQ((Vec{1, 3, 7, 5, 9}), v);
}

TEST(LowHigh, Trivial) {
  Vec empty;
  container::low_high(empty.begin(), empty.end());
  EXPECT_TRUE(empty.empty());

  Vec one{4};
  container::low_high(one.begin(), one.end());
  EXPECT_EQ(Vec{4}, one);

  Vec same{2, 2, 2, 2};
  container::low_high(same.begin(), same.end());
  EXPECT_EQ((Vec{2, 2, 2, 2}), same);
}

TEST(LowHigh, MaximumAtStart) {
  Vec v{9, 4, 1, 6};
  container::low_high(v.begin(), v.end());
  EXPECT_EQ((Vec{1, 4, 6, 9}), v);

  Vec w{9, 4, 6, 1};
  container::low_high(w.begin(), w.end());
  EXPECT_EQ((Vec{1, 4, 6, 9}), w);
}

TEST(LowHigh, CustomOrdering) {
  Vec v{5, 3, 9, 1, 7};
  container::low_high(v.begin(), v.end(), std::greater<int>());
  EXPECT_EQ(9, v.front());
  EXPECT_EQ(1, v.back());
}

TEST(LowHigh, SubRange) {
  Vec v{100, 5, 3, 9, 1, 7, -100};
  container::low_high(v, 1, 5, std::less<int>());
  EXPECT_EQ((Vec{100, 1, 3, 7, 5, 9, -100}), v);

  // A count that runs off the end is clamped.
  Vec w{100, 5, 3, 9};
  container::low_high(w, 1, 50, std::less<int>());
  EXPECT_EQ((Vec{100, 3, 5, 9}), w);

  Vec x{3, 2, 1};
  container::low_high(x, 3, 4, std::less<int>());
  EXPECT_EQ((Vec{3, 2, 1}), x);
}

TEST(LowHigh, Random) {
  math::rand::Random rng(7);
  for (int trial = 0; trial < 200; ++trial) {
    Vec v(std::size_t(rng.uniform_range(2, 20)));
    for (auto& x : v) x = int(rng.uniform_range(0, 10));
    Vec orig = v;
    container::low_high(v.begin(), v.end());
    SCOPED_TRACE(trial);
    expect_low_high(orig, v);
  }
}
