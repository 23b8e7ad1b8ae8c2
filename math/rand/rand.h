// math/rand/rand.h - Interface for non-secure PRNGs
// Copyright © 2017 by Donald King <chronos@chronos-tachyon.net>
// Available under the MIT License. See LICENSE for details.

#ifndef MATH_RAND_RAND_H
#define MATH_RAND_RAND_H

#include <cstdint>
#include <memory>

namespace math {
namespace rand {

class Source {
 protected:
  Source() noexcept = default;
  Source(const Source&) noexcept = default;
  Source(Source&&) noexcept = default;
  Source& operator=(const Source&) noexcept = default;
  Source& operator=(Source&&) noexcept = default;

 public:
  virtual ~Source() noexcept = default;
  virtual std::unique_ptr<Source> copy() const = 0;
  virtual void seed(uint64_t n) noexcept = 0;
  virtual uint64_t next() noexcept = 0;
};

using SourcePtr = std::unique_ptr<Source>;

// Returns the process-wide default seed.
// If $TEST_RANDOM_SEED is set to an integer, that value is used.
uint64_t default_seed();

SourcePtr new_xorshift_source(uint64_t seed);
SourcePtr new_xorshift_source();
SourcePtr new_default_source(uint64_t seed);
SourcePtr new_default_source();

// Random is NOT thread-safe.
class Random {
 public:
  explicit Random(SourcePtr ptr) noexcept : ptr_(std::move(ptr)) {}

  explicit Random(uint64_t seed) : Random(new_default_source(seed)) {}

  Random() : Random(new_default_source()) {}

  Random(const Random& other) : ptr_(copy(other.ptr_)) {}
  Random& operator=(const Random& other) {
    ptr_ = copy(other.ptr_);
    return *this;
  }

  Random(Random&&) noexcept = default;
  Random& operator=(Random&&) noexcept = default;

  void assert_valid() const noexcept;

  void seed(uint64_t n) noexcept {
    assert_valid();
    ptr_->seed(n);
  }

  uint64_t uniform_u64() noexcept {
    assert_valid();
    return ptr_->next();
  }

  // Returns a value uniformly distributed over [lo, hi).
  // Requires lo < hi.
  int64_t uniform_range(int64_t lo, int64_t hi) noexcept;

  // Returns a value uniformly distributed over [0.0, 1.0).
  double uniform_double() noexcept;

  // Implementation of UniformRandomBitGenerator concept {{{
  using result_type = uint64_t;
  static constexpr result_type min() noexcept { return 0ULL; }
  static constexpr result_type max() noexcept { return 0xffffffffffffffffULL; }
  result_type operator()() noexcept { return uniform_u64(); }
  // }}}

 private:
  static SourcePtr copy(const SourcePtr& ptr) {
    if (ptr)
      return ptr->copy();
    else
      return nullptr;
  }

  SourcePtr ptr_;
};

}  // namespace rand
}  // namespace math

#endif  // MATH_RAND_RAND_H
