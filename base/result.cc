// Copyright © 2016 by Donald King <chronos@chronos-tachyon.net>
// Available under the MIT License. See LICENSE for details.

#include "base/result.h"

#include <map>

using Code = base::ResultCode;
using Rep = base::internal::ResultRep;
using RepPtr = std::shared_ptr<const Rep>;

namespace base {

namespace {

static const std::map<Code, std::string>& name_map() {
  static const auto& ref = *new std::map<Code, std::string>{
#define MAP(x) {Code::x, #x}
      MAP(OK),
      MAP(UNKNOWN),
      MAP(INTERNAL),
      MAP(FAILED_PRECONDITION),
      MAP(NOT_FOUND),
      MAP(INVALID_ARGUMENT),
      MAP(OUT_OF_RANGE),
#undef MAP
  };
  return ref;
}

// Message-less failures are shared instead of allocated per Result.
static const std::map<Code, RepPtr>& memo_map() {
  static const auto& ref = *new std::map<Code, RepPtr>{
#define MAP(x) {Code::x, std::make_shared<const Rep>(Code::x, std::string())}
      MAP(UNKNOWN),
      MAP(INTERNAL),
      MAP(FAILED_PRECONDITION),
      MAP(NOT_FOUND),
      MAP(INVALID_ARGUMENT),
      MAP(OUT_OF_RANGE),
#undef MAP
  };
  return ref;
}

}  // anonymous namespace

namespace internal {
const std::string& empty_string() noexcept {
  static const auto& ref = *new std::string;
  return ref;
}
}  // namespace internal

const std::string& resultcode_name(Code code) noexcept {
  const auto& map = name_map();
  auto it = map.find(code);
  if (it != map.end()) return it->second;
  return internal::empty_string();
}

RepPtr Result::make(Code code, std::string message) {
  if (code == Code::OK) return nullptr;
  if (message.empty()) {
    const auto& map = memo_map();
    auto it = map.find(code);
    if (it != map.end()) return it->second;
  }
  return std::make_shared<const Rep>(code, std::move(message));
}

void Result::append_to(std::string* out) const {
  std::ostringstream o;
  if (rep_) {
    o << code_name(rep_->code) << '(' << static_cast<uint16_t>(rep_->code)
      << ')';
    if (!rep_->message.empty()) o << ": " << rep_->message;
  } else {
    o << "OK(0)";
  }
  out->append(o.str());
}

std::string Result::as_string() const {
  std::string out;
  append_to(&out);
  return out;
}

}  // namespace base
