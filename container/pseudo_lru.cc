// Copyright © 2017 by Donald King <chronos@chronos-tachyon.net>
// Available under the MIT License. See LICENSE for details.

#include "container/pseudo_lru.h"

#include <algorithm>
#include <limits>
#include <sstream>
#include <utility>

#include "base/logging.h"
#include "base/mutex.h"
#include "container/low_high.h"

namespace container {

constexpr int64_t CacheEntry::kNotCached;
constexpr std::size_t PseudoLRUCache::kCandidateSize;
constexpr std::size_t PseudoLRUCache::kDefaultSampleSize;
constexpr std::size_t PseudoLRUCache::kMaxSampleSize;

using Payload = std::shared_ptr<void>;

inline namespace implementation {

// Orders the candidate zone so that the most recently used entry comes first
// and the least recently used entry comes last.
struct MoreRecent {
  bool operator()(const CacheEntryPtr& a, const CacheEntryPtr& b) const
      noexcept {
    return a->last_access() > b->last_access();
  }
};

struct Snapshot {
  int64_t last_access;
  CacheEntryPtr entry;

  Snapshot(int64_t t, CacheEntryPtr e) noexcept : last_access(t),
                                                  entry(std::move(e)) {}
};

}  // inline namespace implementation

// CacheEntry {{{

CacheEntry::CacheEntry(std::weak_ptr<PseudoLRUCache> cache) noexcept
    : cache_(std::move(cache)),
      last_access_(kNotCached),
      registered_(false) {}

bool CacheEntry::is_cached() const {
  auto lock = base::acquire_lock(mu_);
  return !!payload_;
}

Payload CacheEntry::read_erased() {
  auto cache = cache_.lock();
  auto lock = base::acquire_lock(mu_);
  if (payload_ && cache) {
    last_access_.store(cache->next_access(), std::memory_order_release);
  }
  return payload_;
}

void CacheEntry::set_payload_erased(Payload payload) {
  // Destroyed after every lock below is released.
  Payload old;
  Payload evicted;

  if (!payload) {
    auto lock = base::acquire_lock(mu_);
    old = std::move(payload_);
    payload_.reset();
    last_access_.store(kNotCached, std::memory_order_release);
    return;
  }

  auto cache = cache_.lock();
  if (!cache) {
    auto lock = base::acquire_lock(mu_);
    if (payload == payload_) return;
    old = std::move(payload_);
    payload_ = std::move(payload);
    last_access_.store(0, std::memory_order_release);
    return;
  }

  auto cache_lock = base::acquire_lock(cache->mu_);
  {
    auto lock = base::acquire_lock(mu_);
    if (payload == payload_) return;
    old = std::move(payload_);
    payload_ = std::move(payload);
    last_access_.store(cache->next_access(), std::memory_order_release);
  }
  if (!registered_) evicted = cache->insert_locked(shared_from_this());
}

Payload CacheEntry::get_or_create_erased(
    const std::function<Payload()>& factory) {
  auto cache = cache_.lock();
  {
    auto lock = base::acquire_lock(mu_);
    if (payload_) {
      if (cache) {
        cache->record_hit();
        last_access_.store(cache->next_access(), std::memory_order_release);
      }
      return payload_;
    }
  }

  Payload fresh = factory();
  if (cache) cache->record_miss();
  set_payload_erased(fresh);
  return fresh;
}

Payload CacheEntry::evict() {
  auto lock = base::acquire_lock(mu_);
  last_access_.store(kNotCached, std::memory_order_release);
  Payload out = std::move(payload_);
  payload_.reset();
  return out;
}

// }}}
// PseudoLRUCache {{{

PseudoLRUCache::PseudoLRUCache(std::size_t capacity, std::size_t sample_size,
                               uint64_t seed)
    : add_position_(0),
      size_(0),
      sample_size_(sample_size),
      rng_(seed),
      access_counter_(0),
      hits_(0),
      misses_(0) {
  DCHECK_GE(capacity, min_capacity(sample_size));
  reset_locked(capacity);
}

PseudoLRUCache::~PseudoLRUCache() noexcept {
  for (const auto& slot : slots_) {
    if (slot) slot->registered_ = false;
  }
}

std::vector<CacheEntryPtr> PseudoLRUCache::reset_locked(std::size_t capacity) {
  for (const auto& slot : slots_) {
    if (slot) slot->registered_ = false;
  }
  std::vector<CacheEntryPtr> old(capacity);
  slots_.swap(old);
  add_position_ = capacity - 1;
  size_ = 0;
  return old;
}

void PseudoLRUCache::clear() {
  std::vector<CacheEntryPtr> old;
  auto lock = base::acquire_lock(mu_);
  VLOG(1) << "clearing PseudoLRUCache: capacity=" << slots_.size()
          << " size=" << size_;
  old = reset_locked(slots_.size());
}

void PseudoLRUCache::evict_all() {
  std::vector<Payload> evicted;
  std::vector<CacheEntryPtr> old;
  auto lock = base::acquire_lock(mu_);
  VLOG(1) << "evicting all entries from PseudoLRUCache: capacity="
          << slots_.size() << " size=" << size_;
  evicted.reserve(size_);
  for (const auto& slot : slots_) {
    if (slot) evicted.push_back(slot->evict());
  }
  old = reset_locked(slots_.size());
}

void PseudoLRUCache::resize(std::size_t capacity) {
  std::vector<Payload> evicted;
  std::vector<CacheEntryPtr> old;
  auto lock = base::acquire_lock(mu_);

  std::size_t floor = min_capacity(sample_size_);
  CHECK_GT(floor, kCandidateSize);
  if (capacity < floor) {
    LOG(WARN) << "PseudoLRUCache capacity " << capacity
              << " is below the minimum; using " << floor;
    capacity = floor;
  }
  VLOG(1) << "resizing PseudoLRUCache: " << slots_.size() << " -> "
          << capacity << " (size=" << size_ << ")";

  // Entries are ranked by a snapshot of their clocks, since readers may
  // refresh them while the sort is running.
  std::vector<Snapshot> live;
  live.reserve(size_);
  for (std::size_t pos = 0; pos < size_; ++pos) {
    const CacheEntryPtr& entry = slots_[position_to_index(pos)];
    DCHECK(entry);
    live.emplace_back(entry->last_access(), entry);
  }
  std::stable_sort(live.begin(), live.end(),
                   [](const Snapshot& a, const Snapshot& b) {
                     return a.last_access < b.last_access;
                   });

  std::size_t keep = std::min(capacity, live.size());
  std::size_t drop = live.size() - keep;
  evicted.reserve(drop);
  for (std::size_t i = 0; i < drop; ++i) {
    CacheEntry* entry = live[i].entry.get();
    entry->registered_ = false;
    evicted.push_back(entry->evict());
  }

  // Survivors are laid out oldest first, starting at the tail, which is
  // the same layout a fresh cache reaches by admitting them in that order.
  old.assign(capacity, nullptr);
  slots_.swap(old);
  for (std::size_t i = 0; i < keep; ++i) {
    slots_[capacity - 1 - i] = std::move(live[drop + i].entry);
  }
  size_ = keep;
  if (keep < capacity)
    add_position_ = capacity - 1 - keep;
  else
    add_position_ = ring_capacity() - 1;
}

std::size_t PseudoLRUCache::capacity() const {
  auto lock = base::acquire_lock(mu_);
  return slots_.size();
}

std::size_t PseudoLRUCache::size() const {
  auto lock = base::acquire_lock(mu_);
  return size_;
}

bool PseudoLRUCache::is_full() const {
  auto lock = base::acquire_lock(mu_);
  return is_full_locked();
}

bool PseudoLRUCache::is_empty() const {
  auto lock = base::acquire_lock(mu_);
  return size_ == 0;
}

std::size_t PseudoLRUCache::sample_size() const {
  auto lock = base::acquire_lock(mu_);
  return sample_size_;
}

void PseudoLRUCache::set_sample_size(std::size_t n) {
  auto lock = base::acquire_lock(mu_);
  sample_size_ = std::min(std::max(n, std::size_t(1)), kMaxSampleSize);
}

double PseudoLRUCache::hit_ratio() const noexcept {
  uint64_t h = hits();
  uint64_t m = misses();
  if (h + m == 0) return std::numeric_limits<double>::quiet_NaN();
  return double(h) / double(h + m);
}

double PseudoLRUCache::miss_ratio() const noexcept {
  uint64_t h = hits();
  uint64_t m = misses();
  if (h + m == 0) return std::numeric_limits<double>::quiet_NaN();
  return double(m) / double(h + m);
}

PseudoLRUStats PseudoLRUCache::stats() const {
  PseudoLRUStats out;
  auto lock = base::acquire_lock(mu_);
  out.capacity = slots_.size();
  out.size = size_;
  out.hits = hits();
  out.misses = misses();
  out.sample_size = sample_size_;
  return out;
}

void PseudoLRUCache::visualize(std::string* out) const {
  CHECK_NOTNULL(out);
  std::ostringstream o;
  auto lock = base::acquire_lock(mu_);
  const std::size_t cap = slots_.size();
  const std::size_t candidates = cap - kCandidateSize;
  o << "capacity = " << cap << "\n"
    << "size = " << size_ << "\n"
    << "add_position = " << add_position_ << "\n"
    << "sample_size = " << sample_size_ << "\n"
    << "hits = " << hits() << "\n"
    << "misses = " << misses() << "\n";
  for (std::size_t i = 0; i < cap; ++i) {
    if (i == 0) o << "ring = [\n";
    if (i == candidates) o << "]\ncandidates = [\n";
    o << (i == add_position_ ? " ->" : "   ") << " [" << i << "] ";
    const CacheEntryPtr& slot = slots_[i];
    if (!slot) {
      o << "NULL,\n";
      continue;
    }
    int64_t t = slot->last_access();
    if (t == CacheEntry::kNotCached)
      o << "(empty)";
    else
      o << "t=" << t;
    o << ",\n";
  }
  o << "]\n";
  out->append(o.str());
}

std::shared_ptr<void> PseudoLRUCache::insert_locked(CacheEntryPtr entry) {
  DCHECK(!entry->registered_);
  Payload evicted;
  if (is_full_locked()) evicted = evict_one_locked();

  DCHECK(!slots_[add_position_]);
  entry->registered_ = true;
  slots_[add_position_] = std::move(entry);
  if (add_position_ == 0)
    add_position_ = ring_capacity() - 1;
  else
    --add_position_;
  ++size_;
  return evicted;
}

std::shared_ptr<void> PseudoLRUCache::evict_one_locked() {
  if (!is_full_locked()) return nullptr;
  find_victim_locked();

  const std::size_t tail = slots_.size() - 1;
  CacheEntryPtr victim = std::move(slots_[tail]);
  slots_[tail] = std::move(slots_[add_position_]);
  slots_[add_position_].reset();
  --size_;

  DCHECK(victim);
  VLOG(2) << "PseudoLRUCache evicting entry with last_access="
          << victim->last_access();
  victim->registered_ = false;
  return victim->evict();
}

void PseudoLRUCache::order_candidates_locked() {
  low_high(slots_, slots_.size() - kCandidateSize, kCandidateSize,
           MoreRecent());
}

// Monte-Carlo search for the approximately least recently used entry.
// On return, the tail slot holds the victim.
void PseudoLRUCache::find_victim_locked() {
  DCHECK(is_full_locked());
  order_candidates_locked();

  // Logical positions [lo, hi) skip the candidate zone and the most
  // recently admitted third of the ring.
  const std::size_t cap = slots_.size();
  const std::size_t lo = kCandidateSize;
  const std::size_t hi = cap - ring_capacity() / 3;
  const std::size_t youngest = cap - kCandidateSize;

  for (std::size_t i = 0; i < sample_size_; ++i) {
    auto pos = rng_.uniform_range(int64_t(lo), int64_t(hi));
    std::size_t index = position_to_index(std::size_t(pos));
    CacheEntryPtr& sampled = slots_[index];
    CacheEntryPtr& candidate = slots_[youngest];
    DCHECK(sampled);
    DCHECK(candidate);
    if (sampled->is_older_than(*candidate)) {
      sampled.swap(candidate);
      order_candidates_locked();
    }
  }
}

// Maps a logical position (0 = next victim, size_ - 1 = newest entry) to a
// physical slot index.
std::size_t PseudoLRUCache::position_to_index(std::size_t position) const
    noexcept {
  if (position < kCandidateSize) return slots_.size() - position - 1;
  if (position == size_) return add_position_;
  position -= kCandidateSize;
  std::size_t ring_size = size_ - kCandidateSize;
  return (add_position_ + ring_size - position) % ring_capacity();
}

// }}}

base::Result new_pseudo_lru_cache(PseudoLRUCachePtr* out,
                                  const PseudoLRUOptions& opts) {
  CHECK_NOTNULL(out);
  out->reset();
  auto result = opts.validate();
  if (!result) return result;

  uint64_t seed = opts.seed;
  if (seed == 0) seed = math::rand::default_seed();
  out->reset(new PseudoLRUCache(opts.capacity, opts.sample_size, seed));
  VLOG(1) << "new PseudoLRUCache: " << opts;
  return base::Result();
}

PseudoLRUCachePtr new_pseudo_lru_cache(std::size_t capacity) {
  PseudoLRUCachePtr out;
  auto result = new_pseudo_lru_cache(&out, PseudoLRUOptions(capacity));
  if (!result) LOG(FATAL) << "new_pseudo_lru_cache: " << result;
  return out;
}

}  // namespace container
