// Copyright © 2017 by Donald King <chronos@chronos-tachyon.net>
// Available under the MIT License. See LICENSE for details.

#include "gtest/gtest.h"

#include <atomic>
#include <cmath>
#include <cstdint>
#include <memory>
#include <string>
#include <thread>
#include <vector>

#include "base/logging.h"
#include "base/result_testing.h"
#include "container/pseudo_lru.h"
#include "math/rand/rand.h"
#include "math/rand/zipf.h"

using container::CacheEntry;
using container::PseudoLRUCache;
using container::PseudoLRUCachePtr;
using container::PseudoLRUOptions;

using Payload = std::shared_ptr<std::string>;
using Item = container::CacheItemPtr<std::string>;
using ItemVec = std::vector<Item>;

static Payload make(int n) {
  return std::make_shared<std::string>(std::to_string(n));
}

static PseudoLRUCachePtr make_cache(std::size_t capacity, uint64_t seed = 1) {
  PseudoLRUCachePtr cache;
  CHECK_OK(container::new_pseudo_lru_cache(
      &cache, PseudoLRUOptions(capacity, 10, seed)));
  return cache;
}

static std::size_t count_uncached(const ItemVec& items) {
  std::size_t n = 0;
  for (const auto& item : items) {
    if (!item->is_cached()) ++n;
  }
  return n;
}

TEST(PseudoLRUCache, NewCacheIsEmpty) {
  auto cache = container::new_pseudo_lru_cache(100);
  EXPECT_TRUE(cache->is_empty());
  EXPECT_FALSE(cache->is_full());
  EXPECT_EQ(0U, cache->size());
  EXPECT_EQ(100U, cache->capacity());
  EXPECT_EQ(10U, cache->sample_size());
}

TEST(PseudoLRUCache, SizeIncrements) {
  auto cache = make_cache(100);
  auto a = cache->admit(make(1));
  EXPECT_EQ(1U, cache->size());
  auto b = cache->admit(make(2));
  EXPECT_EQ(2U, cache->size());
  EXPECT_FALSE(cache->is_empty());
}

TEST(PseudoLRUCache, NoEvictionsBeforeFull) {
  auto cache = make_cache(100);
  ItemVec items;
  for (int i = 1; i <= 100; ++i) {
    items.push_back(cache->admit(make(i)));
    ASSERT_EQ(0U, count_uncached(items)) << "after admitting " << i;
    EXPECT_EQ(i == 100, cache->is_full());
  }
}

TEST(PseudoLRUCache, OneEvictionWhenFull) {
  auto cache = make_cache(40);
  ItemVec items;
  for (int i = 1; i <= 40; ++i) items.push_back(cache->admit(make(i)));
  EXPECT_TRUE(cache->is_full());
  EXPECT_EQ(0U, count_uncached(items));

  items.push_back(cache->admit(make(41)));
  EXPECT_EQ(40U, cache->size());
  EXPECT_EQ(1U, count_uncached(items));
  EXPECT_TRUE(items.back()->is_cached());

  for (int i = 42; i <= 240; ++i) {
    items.push_back(cache->admit(make(i)));
    ASSERT_EQ(40U, cache->size());
    ASSERT_EQ(std::size_t(i - 40), count_uncached(items));
  }
}

TEST(PseudoLRUCache, ReadIsIdempotent) {
  auto cache = make_cache(40);
  auto payload = make(7);
  auto item = cache->admit(payload);

  int64_t t0 = item->last_access();
  auto first = item->read();
  int64_t t1 = item->last_access();
  auto second = item->read();
  int64_t t2 = item->last_access();

  EXPECT_EQ(payload, first);
  EXPECT_EQ(payload, second);
  EXPECT_EQ("7", *second);
  EXPECT_LT(t0, t1);
  EXPECT_LT(t1, t2);
  EXPECT_EQ(0U, cache->hits());
  EXPECT_EQ(0U, cache->misses());
}

TEST(PseudoLRUCache, SetPayloadReplacesContent) {
  auto cache = make_cache(40);
  auto item = cache->admit(make(1));
  auto replacement = make(2);
  item->set_payload(replacement);
  EXPECT_EQ(replacement, item->read());
  EXPECT_EQ(1U, cache->size());
}

TEST(PseudoLRUCache, RecreateAfterEviction) {
  auto cache = make_cache(40);
  ItemVec items;
  for (int i = 0; i <= 40; ++i) items.push_back(cache->admit(make(i)));
  ASSERT_EQ(1U, count_uncached(items));

  std::size_t victim = 0;
  while (items[victim]->is_cached()) ++victim;
  EXPECT_EQ(nullptr, items[victim]->read());
  EXPECT_EQ(CacheEntry::kNotCached, items[victim]->last_access());

  int calls = 0;
  auto factory = [&calls, victim]() -> Payload {
    ++calls;
    return make(int(victim));
  };

  auto value = items[victim]->get_or_create(factory);
  EXPECT_EQ(1, calls);
  ASSERT_NE(nullptr, value);
  EXPECT_EQ(std::to_string(victim), *value);
  EXPECT_TRUE(items[victim]->is_cached());
  EXPECT_EQ(40U, cache->size());
  EXPECT_EQ(1U, count_uncached(items));
  EXPECT_EQ(0U, cache->hits());
  EXPECT_EQ(1U, cache->misses());
  EXPECT_DOUBLE_EQ(1.0, cache->miss_ratio());

  auto again = items[victim]->get_or_create(factory);
  EXPECT_EQ(1, calls);
  EXPECT_EQ(value, again);
  EXPECT_EQ(1U, cache->hits());
  EXPECT_DOUBLE_EQ(0.5, cache->miss_ratio());
}

TEST(PseudoLRUCache, ResizeKeepsMostRecent) {
  auto cache = make_cache(100);
  ItemVec items;
  for (int i = 0; i < 60; ++i) items.push_back(cache->admit(make(i)));
  for (int i = 0; i < 5; ++i) EXPECT_NE(nullptr, items[i]->read());

  cache->resize(50);
  EXPECT_EQ(50U, cache->capacity());
  EXPECT_EQ(50U, cache->size());
  EXPECT_TRUE(cache->is_full());
  for (int i = 0; i < 60; ++i) {
    bool dropped = (i >= 5 && i < 15);
    EXPECT_EQ(!dropped, items[i]->is_cached()) << "item " << i;
  }

  cache->resize(100);
  EXPECT_EQ(100U, cache->capacity());
  EXPECT_EQ(50U, cache->size());
  EXPECT_EQ(10U, count_uncached(items));

  for (int i = 60; i < 110; ++i) items.push_back(cache->admit(make(i)));
  EXPECT_EQ(100U, cache->size());
  EXPECT_EQ(10U, count_uncached(items));

  items.push_back(cache->admit(make(110)));
  EXPECT_EQ(100U, cache->size());
  EXPECT_EQ(11U, count_uncached(items));
}

TEST(PseudoLRUCache, ResizeClampsToMinimum) {
  auto cache = make_cache(100);
  ItemVec items;
  for (int i = 0; i < 100; ++i) items.push_back(cache->admit(make(i)));

  cache->resize(5);
  EXPECT_EQ(PseudoLRUCache::min_capacity(10), cache->capacity());
  EXPECT_EQ(36U, cache->capacity());
  EXPECT_EQ(36U, cache->size());
  EXPECT_EQ(64U, count_uncached(items));
  for (int i = 64; i < 100; ++i) EXPECT_TRUE(items[i]->is_cached());

  // The wrapped ring must keep working after the resize.
  for (int i = 100; i < 200; ++i) {
    items.push_back(cache->admit(make(i)));
    ASSERT_EQ(36U, cache->size());
  }
  EXPECT_EQ(164U, count_uncached(items));
}

TEST(PseudoLRUCache, EvictAll) {
  auto cache = make_cache(100);
  ItemVec items;
  for (int i = 0; i < 60; ++i) items.push_back(cache->admit(make(i)));

  cache->evict_all();
  EXPECT_TRUE(cache->is_empty());
  EXPECT_EQ(100U, cache->capacity());
  for (const auto& item : items) {
    EXPECT_FALSE(item->is_cached());
    EXPECT_EQ(nullptr, item->read());
  }

  items[3]->set_payload(make(3));
  EXPECT_EQ(1U, cache->size());
  EXPECT_EQ("3", *items[3]->read());
}

TEST(PseudoLRUCache, Ratios) {
  auto cache = make_cache(40);
  EXPECT_TRUE(std::isnan(cache->hit_ratio()));
  EXPECT_TRUE(std::isnan(cache->miss_ratio()));

  auto item = cache->admit(make(1));
  EXPECT_TRUE(std::isnan(cache->hit_ratio()));

  item->get_or_create([] { return make(1); });
  EXPECT_DOUBLE_EQ(1.0, cache->hit_ratio());
  EXPECT_DOUBLE_EQ(0.0, cache->miss_ratio());

  item->set_payload(nullptr);
  item->get_or_create([] { return make(1); });
  item->get_or_create([] { return make(1); });
  EXPECT_EQ(2U, cache->hits());
  EXPECT_EQ(1U, cache->misses());
  EXPECT_DOUBLE_EQ(1.0, cache->hit_ratio() + cache->miss_ratio());
}

// clear() forgets the slots but not the payloads, so handles remain readable
// while the cache reports itself empty.
TEST(PseudoLRUCache, ClearLeavesHandlesReadable) {
  auto cache = make_cache(40);
  ItemVec items;
  for (int i = 0; i < 10; ++i) items.push_back(cache->admit(make(i)));

  cache->clear();
  EXPECT_TRUE(cache->is_empty());
  EXPECT_EQ(40U, cache->capacity());
  for (int i = 0; i < 10; ++i) {
    auto value = items[i]->read();
    ASSERT_NE(nullptr, value);
    EXPECT_EQ(std::to_string(i), *value);
  }

  // A hit does not put the handle back into a slot.
  items[0]->get_or_create([] { return make(0); });
  EXPECT_EQ(1U, cache->hits());
  EXPECT_EQ(0U, cache->size());

  // A new payload does.
  items[1]->set_payload(make(100));
  EXPECT_EQ(1U, cache->size());
}

TEST(PseudoLRUCache, TombstoneIsNotDuplicated) {
  auto cache = make_cache(40);
  ItemVec items;
  for (int i = 0; i < 40; ++i) items.push_back(cache->admit(make(i)));

  items[5]->set_payload(nullptr);
  EXPECT_FALSE(items[5]->is_cached());
  EXPECT_EQ(CacheEntry::kNotCached, items[5]->last_access());
  EXPECT_EQ(40U, cache->size());

  items[5]->set_payload(make(5));
  EXPECT_TRUE(items[5]->is_cached());
  EXPECT_EQ(40U, cache->size());

  for (int i = 40; i < 440; ++i) {
    items.push_back(cache->admit(make(i)));
    ASSERT_EQ(40U, cache->size());
  }
  EXPECT_EQ(items.size() - 40, count_uncached(items));
}

TEST(PseudoLRUCache, TombstoneIsReclaimed) {
  auto cache = make_cache(40);
  ItemVec items;
  for (int i = 0; i < 40; ++i) items.push_back(cache->admit(make(i)));
  items[20]->set_payload(nullptr);

  // The emptied handle is the oldest entry, so it goes before any payload
  // once it reaches the candidate zone.
  for (int i = 40; i < 80; ++i) items.push_back(cache->admit(make(i)));
  EXPECT_EQ(40U, cache->size());
  EXPECT_EQ(40U, items.size() - count_uncached(items));
}

TEST(PseudoLRUCache, FrequentlyReadItemSurvives) {
  auto cache = make_cache(100);
  auto hot = cache->admit(make(-1));
  ItemVec cold;
  int hot_evictions = 0;
  const int rounds = 2000;
  for (int i = 0; i < rounds; ++i) {
    cold.push_back(cache->admit(make(i)));
    if (!hot->is_cached()) {
      ++hot_evictions;
      hot->set_payload(make(-1));
    }
    hot->read();
  }
  // A uniformly random victim would hit |hot| about once per 100 evictions.
  const int uniform = (rounds - 100) / 100;
  EXPECT_LT(hot_evictions * 4, uniform);
  EXPECT_EQ(100U, cache->size());
}

static double zipf_hit_ratio(std::size_t n, std::size_t capacity,
                             double alpha, std::size_t trials) {
  math::rand::ZipfDistribution zipf(n, alpha);
  math::rand::Random rng(20170101);
  auto cache = make_cache(capacity, 42);
  ItemVec items(n + 1);
  for (std::size_t trial = 0; trial < trials; ++trial) {
    std::size_t rank = zipf.next(rng);
    if (!items[rank]) {
      items[rank] = cache->admit(make(int(rank)));
    } else {
      auto value =
          items[rank]->get_or_create([rank] { return make(int(rank)); });
      EXPECT_EQ(std::to_string(rank), *value);
    }
  }
  EXPECT_LE(cache->size(), capacity);
  return cache->hit_ratio();
}

TEST(PseudoLRUCache, ZipfHitRatio) {
  double small = zipf_hit_ratio(10000, 500, 0.8, 200000);
  double large = zipf_hit_ratio(10000, 2000, 0.8, 200000);
  EXPECT_GE(small, 0.2);
  EXPECT_GT(large, small);
}

TEST(PseudoLRUCache, Concurrent) {
  auto cache = make_cache(50);
  ItemVec items;
  for (int i = 0; i < 200; ++i) items.push_back(cache->admit(make(i)));

  const int num_threads = 8;
  const int ops = 2000;
  std::atomic<int> bad(0);
  std::vector<std::thread> threads;
  for (int t = 0; t < num_threads; ++t) {
    threads.emplace_back([&cache, &items, &bad, t] {
      math::rand::Random rng(1000 + t);
      for (int op = 0; op < ops; ++op) {
        int i = int(rng.uniform_range(0, 200));
        Payload value;
        if (op % 5 == 0)
          value = items[i]->read();
        else
          value = items[i]->get_or_create([i] { return make(i); });
        if (value && *value != std::to_string(i)) ++bad;
        if (cache->size() > cache->capacity()) ++bad;
      }
    });
  }
  for (auto& thread : threads) thread.join();

  EXPECT_EQ(0, bad.load());
  EXPECT_EQ(50U, cache->size());
  uint64_t calls = uint64_t(num_threads) * (ops - ops / 5);
  EXPECT_EQ(calls, cache->hits() + cache->misses());
}

TEST(PseudoLRUCache, HandlesOutliveCache) {
  auto cache = make_cache(40);
  auto item = cache->admit(make(1));
  cache.reset();

  ASSERT_NE(nullptr, item->read());
  EXPECT_EQ("1", *item->read());
  EXPECT_TRUE(item->is_cached());

  item->set_payload(nullptr);
  int calls = 0;
  auto value = item->get_or_create([&calls]() -> Payload {
    ++calls;
    return make(2);
  });
  EXPECT_EQ(1, calls);
  EXPECT_EQ("2", *value);
  EXPECT_TRUE(item->is_cached());
}

TEST(PseudoLRUCache, NullAdmission) {
  auto cache = make_cache(40);
  auto item = cache->admit<std::string>(nullptr);
  EXPECT_FALSE(item->is_cached());
  EXPECT_EQ(0U, cache->size());

  auto value = item->get_or_create([] { return make(9); });
  EXPECT_EQ("9", *value);
  EXPECT_EQ(1U, cache->size());
  EXPECT_EQ(1U, cache->misses());
}

TEST(PseudoLRUCache, SampleSize) {
  auto cache = make_cache(40);
  cache->set_sample_size(0);
  EXPECT_EQ(1U, cache->sample_size());
  cache->set_sample_size(4);
  EXPECT_EQ(4U, cache->sample_size());

  cache->resize(0);
  EXPECT_EQ(PseudoLRUCache::min_capacity(4), cache->capacity());
}

TEST(PseudoLRUCache, HugeSampleSizeIsClamped) {
  auto cache = make_cache(40);
  ItemVec items;
  for (int i = 0; i < 40; ++i) items.push_back(cache->admit(make(i)));

  cache->set_sample_size(SIZE_MAX - 20);
  EXPECT_EQ(PseudoLRUCache::kMaxSampleSize, cache->sample_size());

  cache->resize(0);
  EXPECT_EQ(PseudoLRUCache::min_capacity(PseudoLRUCache::kMaxSampleSize),
            cache->capacity());
  EXPECT_GT(cache->capacity(), PseudoLRUCache::kCandidateSize);
  EXPECT_EQ(40U, cache->size());
  EXPECT_EQ(0U, count_uncached(items));

  cache->set_sample_size(SIZE_MAX);
  EXPECT_EQ(PseudoLRUCache::kMaxSampleSize, cache->sample_size());
}

TEST(PseudoLRUCache, SameSeedSameVictims) {
  auto run = [](uint64_t seed) -> std::vector<bool> {
    auto cache = make_cache(40, seed);
    ItemVec items;
    for (int i = 0; i < 200; ++i) {
      items.push_back(cache->admit(make(i)));
      if (i % 3 == 0) items[i / 2]->read();
    }
    std::vector<bool> cached;
    for (const auto& item : items) cached.push_back(item->is_cached());
    return cached;
  };
  EXPECT_EQ(run(77), run(77));
}

TEST(PseudoLRUCache, StatsAndVisualize) {
  auto cache = make_cache(40);
  ItemVec items;
  for (int i = 0; i < 3; ++i) items.push_back(cache->admit(make(i)));
  items[0]->get_or_create([] { return make(0); });

  auto stats = cache->stats();
  EXPECT_EQ(40U, stats.capacity);
  EXPECT_EQ(3U, stats.size);
  EXPECT_EQ(1U, stats.hits);
  EXPECT_EQ(0U, stats.misses);
  EXPECT_EQ(10U, stats.sample_size);

  std::string out;
  cache->visualize(&out);
  EXPECT_NE(std::string::npos, out.find("capacity = 40\n"));
  EXPECT_NE(std::string::npos, out.find("size = 3\n"));
  EXPECT_NE(std::string::npos, out.find("candidates = [\n"));
  EXPECT_NE(std::string::npos, out.find(" ->"));
}

TEST(PseudoLRUCache, Factory) {
  PseudoLRUCachePtr cache;
  EXPECT_OUT_OF_RANGE(
      container::new_pseudo_lru_cache(&cache, PseudoLRUOptions(35)));
  EXPECT_EQ(nullptr, cache);
  EXPECT_INVALID_ARGUMENT(
      container::new_pseudo_lru_cache(&cache, PseudoLRUOptions(100, 0)));
  EXPECT_OK(container::new_pseudo_lru_cache(&cache, PseudoLRUOptions(36)));
  ASSERT_NE(nullptr, cache);
  EXPECT_EQ(36U, cache->capacity());
  EXPECT_OK(
      container::new_pseudo_lru_cache(&cache, PseudoLRUOptions(27, 1, 5)));
  EXPECT_EQ(1U, cache->sample_size());
}

TEST(PseudoLRUCacheDeathTest, CapacityTooSmall) {
  EXPECT_DEATH(container::new_pseudo_lru_cache(10), "OUT_OF_RANGE");
}
