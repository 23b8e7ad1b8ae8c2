// base/result.h - Value type representing operation success or failure
// Copyright © 2016 by Donald King <chronos@chronos-tachyon.net>
// Available under the MIT License. See LICENSE for details.

#ifndef BASE_RESULT_H
#define BASE_RESULT_H

#include <cstdint>
#include <memory>
#include <ostream>
#include <sstream>
#include <string>
#include <utility>

namespace base {

// ResultCode denotes the type of success/failure that a Result represents.
enum class ResultCode : uint8_t {
  // Success.
  OK = 0x00,

  // Failure of an unknown type, or whose type does not fit into these codes.
  UNKNOWN = 0x01,

  // Internal-only failure that should never be seen by the user.
  INTERNAL = 0x02,

  // The world was in a state that was not compatible with the operation.
  FAILED_PRECONDITION = 0x04,

  // The operation was unable to find the specified resource.
  // Subtype of: FAILED_PRECONDITION
  NOT_FOUND = 0x05,

  // The operation failed because of an argument that doesn't make sense.
  INVALID_ARGUMENT = 0x0a,

  // The operation failed because an argument was outside the valid range.
  // Subtype of: INVALID_ARGUMENT
  OUT_OF_RANGE = 0x0b,
};

// Returns the string representation of a Code.
const std::string& resultcode_name(ResultCode code) noexcept;

inline std::ostream& operator<<(std::ostream& os, ResultCode arg) {
  return (os << resultcode_name(arg));
}

namespace internal {
struct ResultRep {
  ResultCode code;
  std::string message;

  ResultRep(ResultCode code, std::string message) noexcept
      : code(code),
        message(std::move(message)) {}
};

const std::string& empty_string() noexcept;

inline void stringify_to(std::ostringstream&) {}

template <typename T, typename... Rest>
void stringify_to(std::ostringstream& o, const T& first, const Rest&... rest) {
  o << first;
  stringify_to(o, rest...);
}

template <typename... Args>
std::string stringify(const Args&... args) {
  std::ostringstream o;
  stringify_to(o, args...);
  return o.str();
}
}  // namespace internal

// Result represents the success or failure of an operation.
// Failures are further categorized by the type of failure.
class Result {
 public:
  using Code = ResultCode;

  static const std::string& code_name(Code code) noexcept {
    return resultcode_name(code);
  }

 private:
  using Rep = ::base::internal::ResultRep;
  using RepPtr = std::shared_ptr<const Rep>;

  static RepPtr make(Code code, std::string message);

 public:
  // Constructors for fixed Code values {{{

  template <typename... Args>
  static Result unknown(const Args&... args) {
    return Result(Code::UNKNOWN, ::base::internal::stringify(args...));
  }

  template <typename... Args>
  static Result internal(const Args&... args) {
    return Result(Code::INTERNAL, ::base::internal::stringify(args...));
  }

  template <typename... Args>
  static Result failed_precondition(const Args&... args) {
    return Result(Code::FAILED_PRECONDITION,
                  ::base::internal::stringify(args...));
  }

  template <typename... Args>
  static Result not_found(const Args&... args) {
    return Result(Code::NOT_FOUND, ::base::internal::stringify(args...));
  }

  template <typename... Args>
  static Result invalid_argument(const Args&... args) {
    return Result(Code::INVALID_ARGUMENT, ::base::internal::stringify(args...));
  }

  template <typename... Args>
  static Result out_of_range(const Args&... args) {
    return Result(Code::OUT_OF_RANGE, ::base::internal::stringify(args...));
  }

  // }}}

  // Result is default constructible, copyable, and moveable.
  // The default-constructed value has code OK and message "".
  Result() noexcept = default;
  Result(const Result&) noexcept = default;
  Result(Result&&) noexcept = default;
  Result& operator=(const Result&) noexcept = default;
  Result& operator=(Result&&) noexcept = default;

  Result(Code code, std::string message = std::string())
      : rep_(make(code, std::move(message))) {}

  void clear() noexcept { rep_.reset(); }
  void swap(Result& other) noexcept { rep_.swap(other.rep_); }

  // Checks if the Result was successful.
  explicit operator bool() const noexcept { return !rep_; }

  // Returns the Code for this Result.
  Code code() const noexcept {
    if (rep_) return rep_->code;
    return Code::OK;
  }

  // Returns the message associated with this Result.
  const std::string& message() const noexcept {
    if (rep_) return rep_->message;
    return ::base::internal::empty_string();
  }

  // Helper for chaining together blocks of code, conditional on success.
  // Short-circuits to the first failure.
  //
  //    base::Result result = op1().and_then([] {
  //      return op2();    // only runs if op1() succeeded
  //    });
  //
  template <typename F, typename... Args>
  Result and_then(F continuation, Args&&... args) const {
    if (rep_) return *this;
    return continuation(std::forward<Args>(args)...);
  }

  // Helper for chaining together blocks of code, conditional on failure.
  // Short-circuits to the first success.
  template <typename F, typename... Args>
  Result or_else(F continuation, Args&&... args) const {
    if (rep_) return continuation(std::forward<Args>(args)...);
    return *this;
  }

  // Stringifies this Result into a human-friendly form.
  std::string as_string() const;
  void append_to(std::string* out) const;

 private:
  RepPtr rep_;
};

inline void swap(Result& a, Result& b) noexcept { a.swap(b); }

inline std::ostream& operator<<(std::ostream& os, const Result& arg) {
  return (os << arg.as_string());
}

}  // namespace base

#endif  // BASE_RESULT_H
