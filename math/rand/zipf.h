// math/rand/zipf.h - Zipf-distributed rank generator
// Copyright © 2017 by Donald King <chronos@chronos-tachyon.net>
// Available under the MIT License. See LICENSE for details.

#ifndef MATH_RAND_ZIPF_H
#define MATH_RAND_ZIPF_H

#include <cstddef>
#include <vector>

#include "math/rand/rand.h"

namespace math {
namespace rand {

// ZipfDistribution draws ranks in [1, n] with P(r) = C / r^alpha.
//
// The normalization constant is computed exactly and the full CDF table is
// kept in memory, so construction is O(n) and each draw is O(log n).
class ZipfDistribution {
 public:
  // Requires n >= 1 and alpha > 0.
  ZipfDistribution(std::size_t n, double alpha);

  std::size_t n() const noexcept { return cdf_.size(); }
  double alpha() const noexcept { return alpha_; }
  double normalization() const noexcept { return c_; }

  // Probability of drawing |rank|; 0.0 outside [1, n].
  double pdf(std::size_t rank) const noexcept;

  // Probability of drawing a rank <= |rank|.
  double cdf(std::size_t rank) const noexcept;

  // Smallest rank whose cdf() is >= |p|.
  std::size_t rank(double p) const noexcept;

  std::size_t next(Random& rng) const noexcept {
    return rank(rng.uniform_double());
  }

 private:
  double alpha_;
  double c_;
  std::vector<double> cdf_;  // cdf_[i] is cdf(i + 1)
};

}  // namespace rand
}  // namespace math

#endif  // MATH_RAND_ZIPF_H
