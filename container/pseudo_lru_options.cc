// Copyright © 2017 by Donald King <chronos@chronos-tachyon.net>
// Available under the MIT License. See LICENSE for details.

#include "container/pseudo_lru_options.h"

#include <cerrno>
#include <cstdlib>
#include <ostream>
#include <sstream>

#include "base/logging.h"
#include "container/pseudo_lru.h"
#include "re2/re2.h"

namespace container {

inline namespace implementation {

static const re2::RE2& pair_re() {
  static const re2::RE2& ref =
      *new re2::RE2("\\s*([A-Za-z_][A-Za-z0-9_]*)\\s*=\\s*([0-9]+)\\s*");
  return ref;
}

static const re2::RE2& comma_re() {
  static const re2::RE2& ref = *new re2::RE2(",");
  return ref;
}

static const re2::RE2& blank_re() {
  static const re2::RE2& ref = *new re2::RE2("\\s*");
  return ref;
}

static std::string remainder(const re2::StringPiece& sp) {
  return std::string(sp.data(), sp.size());
}

static base::Result parse_u64(uint64_t* out, const std::string& key,
                              const std::string& value) {
  char* end = nullptr;
  errno = 0;
  auto n = ::strtoull(value.c_str(), &end, 10);
  if (errno == ERANGE || *end != '\0') {
    return base::Result::out_of_range("value for \"", key,
                                      "\" is too large: ", value);
  }
  *out = n;
  return base::Result();
}

}  // inline namespace implementation

std::size_t PseudoLRUOptions::min_capacity() const noexcept {
  if (sample_size > PseudoLRUCache::kMaxSampleSize) {
    return PseudoLRUCache::min_capacity(PseudoLRUCache::kMaxSampleSize);
  }
  return PseudoLRUCache::min_capacity(sample_size);
}

base::Result PseudoLRUOptions::validate() const {
  if (sample_size == 0) {
    return base::Result::invalid_argument("sample_size must be at least 1");
  }
  if (sample_size > PseudoLRUCache::kMaxSampleSize) {
    return base::Result::out_of_range("sample_size ", sample_size,
                                      " exceeds the maximum of ",
                                      PseudoLRUCache::kMaxSampleSize);
  }
  if (capacity < min_capacity()) {
    return base::Result::out_of_range("capacity ", capacity,
                                      " is below the minimum of ",
                                      min_capacity(), " for sample_size ",
                                      sample_size);
  }
  return base::Result();
}

void PseudoLRUOptions::append_to(std::string* out) const {
  std::ostringstream o;
  o << "capacity=" << capacity << ",sample_size=" << sample_size
    << ",seed=" << seed;
  out->append(o.str());
}

std::string PseudoLRUOptions::as_string() const {
  std::string out;
  append_to(&out);
  return out;
}

std::ostream& operator<<(std::ostream& o, const PseudoLRUOptions& opts) {
  return (o << opts.as_string());
}

base::Result parse_pseudo_lru_options(PseudoLRUOptions* out,
                                      const std::string& text) {
  CHECK_NOTNULL(out);
  PseudoLRUOptions tmp = *out;

  re2::StringPiece input(text);
  re2::RE2::Consume(&input, blank_re());
  while (!input.empty()) {
    std::string key;
    std::string value;
    if (!re2::RE2::Consume(&input, pair_re(), &key, &value)) {
      return base::Result::invalid_argument(
          "expected <key>=<number> at \"", remainder(input), "\"");
    }

    uint64_t n = 0;
    auto result = parse_u64(&n, key, value);
    if (!result) return result;

    if (key == "capacity") {
      tmp.capacity = n;
    } else if (key == "sample_size") {
      tmp.sample_size = n;
    } else if (key == "seed") {
      tmp.seed = n;
    } else {
      return base::Result::invalid_argument("unknown option \"", key, "\"");
    }

    if (input.empty()) break;
    if (!re2::RE2::Consume(&input, comma_re())) {
      return base::Result::invalid_argument("expected \",\" at \"",
                                            remainder(input), "\"");
    }
    if (input.empty()) {
      return base::Result::invalid_argument("trailing \",\" in \"", text,
                                            "\"");
    }
  }

  *out = tmp;
  return base::Result();
}

}  // namespace container
