// container/pseudo_lru_options.h - Construction parameters for PseudoLRUCache
// Copyright © 2017 by Donald King <chronos@chronos-tachyon.net>
// Available under the MIT License. See LICENSE for details.

#ifndef CONTAINER_PSEUDO_LRU_OPTIONS_H
#define CONTAINER_PSEUDO_LRU_OPTIONS_H

#include <cstddef>
#include <cstdint>
#include <iosfwd>
#include <string>

#include "base/result.h"

namespace container {

struct PseudoLRUOptions {
  // Number of slots.  Must be at least 16 + sample_size + 10.
  std::size_t capacity;

  // Number of random probes per eviction search.  Must be at least 1.
  std::size_t sample_size;

  // Seed for the eviction sampler.  0 selects math::rand::default_seed().
  uint64_t seed;

  explicit PseudoLRUOptions(std::size_t capacity = 1024,
                            std::size_t sample_size = 10,
                            uint64_t seed = 0) noexcept
      : capacity(capacity),
        sample_size(sample_size),
        seed(seed) {}

  // Returns the smallest capacity acceptable for these options.
  std::size_t min_capacity() const noexcept;

  base::Result validate() const;

  // "capacity=<n>,sample_size=<n>,seed=<n>"
  void append_to(std::string* out) const;
  std::string as_string() const;
};

std::ostream& operator<<(std::ostream& o, const PseudoLRUOptions& opts);

// Parses a comma-separated list of "key=value" pairs into |out|.
// Keys not mentioned in |text| keep their current values in |out|.
// Recognized keys are "capacity", "sample_size", and "seed".
base::Result parse_pseudo_lru_options(PseudoLRUOptions* out,
                                      const std::string& text);

}  // namespace container

#endif  // CONTAINER_PSEUDO_LRU_OPTIONS_H
