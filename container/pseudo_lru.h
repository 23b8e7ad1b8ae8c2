// container/pseudo_lru.h - Approximate-LRU object cache
// Copyright © 2017 by Donald King <chronos@chronos-tachyon.net>
// Available under the MIT License. See LICENSE for details.

#ifndef CONTAINER_PSEUDO_LRU_H
#define CONTAINER_PSEUDO_LRU_H

#include <atomic>
#include <climits>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "base/result.h"
#include "container/pseudo_lru_options.h"
#include "math/rand/rand.h"

// PseudoLRUCache holds a bounded number of objects and evicts the
// approximately least recently used one when a new object arrives.
//
// Objects are not looked up by key.  Instead, admitting an object returns a
// CacheItem handle that the owner keeps in its own data structures:
//
//    auto cache = container::new_pseudo_lru_cache(1000);
//    auto item = cache->admit(std::make_shared<Widget>(...));
//    ...
//    std::shared_ptr<Widget> w = item->get_or_create([] {
//      return load_widget();  // only runs if |item| was evicted
//    });
//
// All methods are thread-safe.  Readers of a handle lock only that handle;
// structural changes lock the whole cache.  Locks are always taken cache
// first, handle second.
//
// Storage layout: the last 16 slots form the candidate zone, whose first
// slot holds the youngest candidate and whose last slot holds the next
// victim.  The remaining slots form a ring that is filled from the top down
// and drained into the candidate zone one entry per eviction.

namespace container {

class PseudoLRUCache;  // forward declaration
using PseudoLRUCachePtr = std::shared_ptr<PseudoLRUCache>;

// CacheEntry is the type-erased base of CacheItem<T>.
class CacheEntry : public std::enable_shared_from_this<CacheEntry> {
 public:
  // last_access() value of an entry that holds no payload.
  static constexpr int64_t kNotCached = INT64_MIN;

  CacheEntry(const CacheEntry&) = delete;
  CacheEntry(CacheEntry&&) = delete;
  CacheEntry& operator=(const CacheEntry&) = delete;
  CacheEntry& operator=(CacheEntry&&) = delete;

  virtual ~CacheEntry() noexcept = default;

  // Returns true iff a payload is present.  Does not count as an access.
  bool is_cached() const;

  // Clock value of the most recent access, or kNotCached.
  int64_t last_access() const noexcept {
    return last_access_.load(std::memory_order_acquire);
  }

  bool is_older_than(const CacheEntry& other) const noexcept {
    return last_access() < other.last_access();
  }

 protected:
  explicit CacheEntry(std::weak_ptr<PseudoLRUCache> cache) noexcept;

  std::shared_ptr<void> read_erased();
  void set_payload_erased(std::shared_ptr<void> payload);
  std::shared_ptr<void> get_or_create_erased(
      const std::function<std::shared_ptr<void>()>& factory);

 private:
  friend class PseudoLRUCache;

  // Drops the payload and returns it.  Caller holds the cache lock.
  std::shared_ptr<void> evict();

  mutable std::mutex mu_;
  const std::weak_ptr<PseudoLRUCache> cache_;
  std::shared_ptr<void> payload_;      // protected by mu_
  std::atomic<int64_t> last_access_;
  bool registered_;                    // protected by cache_->mu_
};

using CacheEntryPtr = std::shared_ptr<CacheEntry>;

// CacheItem<T> is the handle through which an owner reaches its object.
//
// A handle may outlive its cache.  Once the cache is gone, the handle keeps
// whatever payload it last held and no longer counts hits or misses.
template <typename T>
class CacheItem : public CacheEntry {
 public:
  // Returns the payload, or nullptr if it was evicted.
  // Refreshes the access time if a payload is present.
  std::shared_ptr<T> read() {
    return std::static_pointer_cast<T>(read_erased());
  }

  // Replaces the payload.
  //
  // A non-null payload is (re)admitted into the cache, evicting another
  // entry if the cache is full.  A null payload empties this handle; its
  // slot is reclaimed by a later eviction.
  void set_payload(std::shared_ptr<T> payload) {
    set_payload_erased(std::move(payload));
  }

  // Returns the payload, calling |factory| to recreate it if it was evicted.
  // |factory| runs without any lock held and must return something
  // convertible to std::shared_ptr<T>.
  //
  // Two threads that miss at the same moment may both call |factory|; the
  // last one to finish wins.
  template <typename F>
  std::shared_ptr<T> get_or_create(F factory) {
    return std::static_pointer_cast<T>(
        get_or_create_erased([&factory]() -> std::shared_ptr<void> {
          return std::shared_ptr<T>(factory());
        }));
  }

 private:
  friend class PseudoLRUCache;

  explicit CacheItem(std::weak_ptr<PseudoLRUCache> cache) noexcept
      : CacheEntry(std::move(cache)) {}
};

template <typename T>
using CacheItemPtr = std::shared_ptr<CacheItem<T>>;

struct PseudoLRUStats {
  std::size_t capacity = 0;
  std::size_t size = 0;
  uint64_t hits = 0;
  uint64_t misses = 0;
  std::size_t sample_size = 0;
};

class PseudoLRUCache : public std::enable_shared_from_this<PseudoLRUCache> {
 public:
  static constexpr std::size_t kCandidateSize = 16;
  static constexpr std::size_t kDefaultSampleSize = 10;
  static constexpr std::size_t kMaxSampleSize = 1U << 16;

  // Smallest capacity accepted for a given sample size.
  // |sample_size| must not exceed kMaxSampleSize.
  static constexpr std::size_t min_capacity(std::size_t sample_size) noexcept {
    return kCandidateSize + sample_size + 10;
  }

  PseudoLRUCache(const PseudoLRUCache&) = delete;
  PseudoLRUCache(PseudoLRUCache&&) = delete;
  PseudoLRUCache& operator=(const PseudoLRUCache&) = delete;
  PseudoLRUCache& operator=(PseudoLRUCache&&) = delete;

  ~PseudoLRUCache() noexcept;

  // Wraps |payload| in a new handle and admits it, evicting an older entry
  // first if the cache is full.  A null |payload| yields an empty handle
  // that joins the cache on its first set_payload() or get_or_create().
  template <typename T>
  CacheItemPtr<T> admit(std::shared_ptr<T> payload) {
    CacheItemPtr<T> item(new CacheItem<T>(shared_from_this()));
    if (payload) item->set_payload(std::move(payload));
    return item;
  }

  // Forgets every entry.  Outstanding handles keep their payloads, but they
  // no longer occupy slots and will never be evicted until readmitted.
  void clear();

  // Empties every handle in the cache, then clears it.
  void evict_all();

  // Changes the capacity, clamping it to min_capacity(sample_size()).
  // When shrinking, the least recently used entries are evicted.
  void resize(std::size_t capacity);

  std::size_t capacity() const;
  std::size_t size() const;
  bool is_full() const;
  bool is_empty() const;

  std::size_t sample_size() const;
  // Clamped to [1, kMaxSampleSize].
  void set_sample_size(std::size_t n);

  uint64_t hits() const noexcept {
    return hits_.load(std::memory_order_relaxed);
  }
  uint64_t misses() const noexcept {
    return misses_.load(std::memory_order_relaxed);
  }

  // Fraction of get_or_create() calls that found a payload.
  // NaN if get_or_create() has never been called.
  double hit_ratio() const noexcept;
  double miss_ratio() const noexcept;

  PseudoLRUStats stats() const;

  // Appends a human-readable dump of the slot layout to |out|.
  void visualize(std::string* out) const;

 private:
  friend class CacheEntry;
  friend base::Result new_pseudo_lru_cache(PseudoLRUCachePtr* out,
                                           const PseudoLRUOptions& opts);

  PseudoLRUCache(std::size_t capacity, std::size_t sample_size, uint64_t seed);

  int64_t next_access() noexcept {
    return access_counter_.fetch_add(1, std::memory_order_acq_rel) + 1;
  }
  void record_hit() noexcept { hits_.fetch_add(1, std::memory_order_relaxed); }
  void record_miss() noexcept {
    misses_.fetch_add(1, std::memory_order_relaxed);
  }

  std::size_t ring_capacity() const noexcept {
    return slots_.size() - kCandidateSize;
  }
  bool is_full_locked() const noexcept { return size_ == slots_.size(); }

  std::vector<CacheEntryPtr> reset_locked(std::size_t capacity);
  std::shared_ptr<void> insert_locked(CacheEntryPtr entry);
  std::shared_ptr<void> evict_one_locked();
  void find_victim_locked();
  void order_candidates_locked();
  std::size_t position_to_index(std::size_t position) const noexcept;

  mutable std::mutex mu_;
  std::vector<CacheEntryPtr> slots_;  // protected by mu_
  std::size_t add_position_;          // protected by mu_
  std::size_t size_;                  // protected by mu_
  std::size_t sample_size_;           // protected by mu_
  math::rand::Random rng_;            // protected by mu_
  std::atomic<int64_t> access_counter_;
  std::atomic<uint64_t> hits_;
  std::atomic<uint64_t> misses_;
};

// Creates a new PseudoLRUCache.
// Fails with OUT_OF_RANGE or INVALID_ARGUMENT if |opts| is not valid.
base::Result new_pseudo_lru_cache(PseudoLRUCachePtr* out,
                                  const PseudoLRUOptions& opts);

// Creates a new PseudoLRUCache with default options and the given capacity.
// Dies if |capacity| is less than PseudoLRUCache::min_capacity(10).
PseudoLRUCachePtr new_pseudo_lru_cache(std::size_t capacity);

}  // namespace container

#endif  // CONTAINER_PSEUDO_LRU_H
