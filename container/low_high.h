// container/low_high.h - Partial min/max ordering of a range
// Copyright © 2017 by Donald King <chronos@chronos-tachyon.net>
// Available under the MIT License. See LICENSE for details.

#ifndef CONTAINER_LOW_HIGH_H
#define CONTAINER_LOW_HIGH_H

#include <cstddef>
#include <iterator>
#include <utility>
#include <vector>

namespace container {

// Moves the least element of [first, last) to |first| and the greatest
// element to |last - 1|, using at most two swaps.  The relative order of the
// remaining elements is unspecified.
//
// |less| is a strict weak ordering.  Ties keep the earliest element found.
template <typename RandomIt, typename Less>
void low_high(RandomIt first, RandomIt last, Less less) {
  auto count = std::distance(first, last);
  if (count <= 1) return;

  RandomIt stop = last - 1;
  RandomIt imin = first;
  RandomIt imax = first;
  for (RandomIt it = first + 1; it != last; ++it) {
    if (less(*it, *imin))
      imin = it;
    else if (less(*imax, *it))
      imax = it;
  }

  using std::swap;
  if (imin != first) {
    swap(*first, *imin);
    // The maximum may have just been moved out of |first|.
    if (imax == first) imax = imin;
  }
  if (imax != stop) swap(*stop, *imax);
}

template <typename RandomIt>
void low_high(RandomIt first, RandomIt last) {
  using T = typename std::iterator_traits<RandomIt>::value_type;
  low_high(first, last, [](const T& a, const T& b) { return a < b; });
}

// As above, for the |count| elements of |vec| starting at |start|.
// A |count| running past the end of |vec| is clamped to the remaining tail.
template <typename T, typename Alloc, typename Less>
void low_high(std::vector<T, Alloc>& vec, std::size_t start, std::size_t count,
              Less less) {
  if (start >= vec.size()) return;
  std::size_t avail = vec.size() - start;
  if (count > avail) count = avail;
  auto first = vec.begin() + start;
  low_high(first, first + count, less);
}

}  // namespace container

#endif  // CONTAINER_LOW_HIGH_H
