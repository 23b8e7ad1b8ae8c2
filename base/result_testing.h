// base/result_testing.h - Macros for checking base::Result values in tests
// Copyright © 2016 by Donald King <chronos@chronos-tachyon.net>
// Available under the MIT License. See LICENSE for details.

#ifndef BASE_RESULT_TESTING_H
#define BASE_RESULT_TESTING_H

#include "base/result.h"
#include "gtest/gtest.h"

namespace base {
namespace testing {

inline ::testing::AssertionResult ResultCodeEQ(const char* code_text,
                                               const char* expr_text,
                                               Result::Code code,
                                               const Result& expr) {
  if (code == expr.code()) return ::testing::AssertionSuccess();
  return ::testing::AssertionFailure()
         << "expression: " << expr_text << "\n"
         << "  expected: " << code << "("
         << static_cast<uint16_t>(static_cast<uint8_t>(code)) << ")\n"
         << "       got: " << expr.as_string();
}

}  // namespace testing
}  // namespace base

#define BASE_RESULT_ASSERT(code, x)                                \
  ASSERT_PRED_FORMAT2(::base::testing::ResultCodeEQ,               \
                      ::base::Result::Code::code, x)
#define BASE_RESULT_EXPECT(code, x)                                \
  EXPECT_PRED_FORMAT2(::base::testing::ResultCodeEQ,               \
                      ::base::Result::Code::code, x)

#define ASSERT_OK(x) BASE_RESULT_ASSERT(OK, x)
#define ASSERT_UNKNOWN(x) BASE_RESULT_ASSERT(UNKNOWN, x)
#define ASSERT_INTERNAL(x) BASE_RESULT_ASSERT(INTERNAL, x)
#define ASSERT_FAILED_PRECONDITION(x) BASE_RESULT_ASSERT(FAILED_PRECONDITION, x)
#define ASSERT_NOT_FOUND(x) BASE_RESULT_ASSERT(NOT_FOUND, x)
#define ASSERT_INVALID_ARGUMENT(x) BASE_RESULT_ASSERT(INVALID_ARGUMENT, x)
#define ASSERT_OUT_OF_RANGE(x) BASE_RESULT_ASSERT(OUT_OF_RANGE, x)

#define EXPECT_OK(x) BASE_RESULT_EXPECT(OK, x)
#define EXPECT_UNKNOWN(x) BASE_RESULT_EXPECT(UNKNOWN, x)
#define EXPECT_INTERNAL(x) BASE_RESULT_EXPECT(INTERNAL, x)
#define EXPECT_FAILED_PRECONDITION(x) BASE_RESULT_EXPECT(FAILED_PRECONDITION, x)
#define EXPECT_NOT_FOUND(x) BASE_RESULT_EXPECT(NOT_FOUND, x)
#define EXPECT_INVALID_ARGUMENT(x) BASE_RESULT_EXPECT(INVALID_ARGUMENT, x)
#define EXPECT_OUT_OF_RANGE(x) BASE_RESULT_EXPECT(OUT_OF_RANGE, x)

#endif  // BASE_RESULT_TESTING_H
