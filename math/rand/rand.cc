// Copyright © 2017 by Donald King <chronos@chronos-tachyon.net>
// Available under the MIT License. See LICENSE for details.

#include "math/rand/rand.h"

#include <sys/types.h>
#include <time.h>
#include <unistd.h>

#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <system_error>

#include "base/logging.h"

namespace math {
namespace rand {

void Random::assert_valid() const noexcept { CHECK_NOTNULL(ptr_.get()); }

int64_t Random::uniform_range(int64_t lo, int64_t hi) noexcept {
  DCHECK_LT(lo, hi);
  uint64_t span = uint64_t(hi) - uint64_t(lo);

  // Values below |threshold| would favor the low end of the range.
  uint64_t threshold = (-span) % span;
  uint64_t x;
  do {
    x = uniform_u64();
  } while (x < threshold);
  return int64_t(uint64_t(lo) + (x % span));
}

double Random::uniform_double() noexcept {
  // 53 bits fill the mantissa of an IEEE 754 double exactly.
  return double(uniform_u64() >> 11) * (1.0 / double(1ULL << 53));
}

static uint64_t make_default_seed() {
  const char* envvar = ::getenv("TEST_RANDOM_SEED");
  if (envvar && *envvar) {
    char* end = nullptr;
    auto value = ::strtoull(envvar, &end, 0);
    if (!*end) return value;
    LOG(WARN) << "ignoring malformed TEST_RANDOM_SEED: \"" << envvar << "\"";
  }

  struct timespec ts;
  ::bzero(&ts, sizeof(ts));

  int rc = clock_gettime(CLOCK_REALTIME, &ts);
  if (rc != 0) {
    int err_no = errno;
    throw std::system_error(err_no, std::system_category(), "clock_gettime(2)");
  }

  uint64_t x;
  if (ts.tv_sec >= 0)
    x = uint64_t(ts.tv_sec);
  else
    x = ~uint64_t(-(ts.tv_sec + 1));
  x ^= ::getpid();
  x <<= 32;
  x |= uint64_t(uint32_t(ts.tv_nsec));
  return x;
}

uint64_t default_seed() {
  static uint64_t seed = make_default_seed();
  return seed;
}

SourcePtr new_default_source(uint64_t seed) {
  return new_xorshift_source(seed);
}

SourcePtr new_default_source() { return new_xorshift_source(); }

}  // namespace rand
}  // namespace math
