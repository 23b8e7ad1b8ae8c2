// Copyright © 2017 by Donald King <chronos@chronos-tachyon.net>
// Available under the MIT License. See LICENSE for details.

#include "math/rand/zipf.h"

#include <algorithm>
#include <cmath>

#include "base/logging.h"

namespace math {
namespace rand {

ZipfDistribution::ZipfDistribution(std::size_t n, double alpha)
    : alpha_(alpha), c_(0.0) {
  CHECK_GE(n, 1U);
  CHECK_GT(alpha, 0.0);

  cdf_.resize(n);
  double sum = 0.0;
  for (std::size_t r = 1; r <= n; ++r) {
    sum += std::pow(double(r), -alpha);
    cdf_[r - 1] = sum;
  }
  c_ = 1.0 / sum;
  for (auto& x : cdf_) x *= c_;
  cdf_.back() = 1.0;
}

double ZipfDistribution::pdf(std::size_t rank) const noexcept {
  if (rank < 1 || rank > cdf_.size()) return 0.0;
  return c_ * std::pow(double(rank), -alpha_);
}

double ZipfDistribution::cdf(std::size_t rank) const noexcept {
  if (rank < 1) return 0.0;
  if (rank > cdf_.size()) return 1.0;
  return cdf_[rank - 1];
}

std::size_t ZipfDistribution::rank(double p) const noexcept {
  auto it = std::lower_bound(cdf_.begin(), cdf_.end(), p);
  if (it == cdf_.end()) return cdf_.size();
  return std::size_t(it - cdf_.begin()) + 1;
}

}  // namespace rand
}  // namespace math
