// -*- mode:C++; tab-width:8; c-basic-offset:2; indent-tabs-mode:t -*-
// vim: ts=8 sw=2 smarttab

#pragma once

#include <string>

#include <fmt/format.h>

/*
 * shardrec_assert: always-on assertion, independent of NDEBUG.
 *
 * Used for programming-invariant violations only.  Recoverable failures
 * are reported through return codes or recovery_error.
 */

namespace shardrec {

struct assert_data {
  const char *assertion;
  const char *file;
  const int line;
  const char *function;
};

[[noreturn]] void __shardrec_assert_fail(const assert_data &ctx);
[[noreturn]] void __shardrec_assert_fail(
  const char *assertion, const char *file, int line, const char *function);
[[noreturn]] void __shardrec_assertf_fail(
  const char *assertion, const char *file, int line, const char *function,
  const std::string &msg);
[[noreturn]] void __shardrec_abort(
  const char *file, int line, const char *function, const std::string &msg);

}

#define __SHARDREC_ASSERT_STRING(x) #x

#define shardrec_assert(expr)						\
  do {									\
    static const ::shardrec::assert_data assert_data_ctx = {		\
      __SHARDREC_ASSERT_STRING(expr), __FILE__, __LINE__, __func__};	\
    if (!(expr)) [[unlikely]] {						\
      ::shardrec::__shardrec_assert_fail(assert_data_ctx);		\
    }									\
  } while (false)

#define shardrec_assertf(expr, ...)					\
  do {									\
    if (!(expr)) [[unlikely]] {						\
      ::shardrec::__shardrec_assertf_fail(				\
	__SHARDREC_ASSERT_STRING(expr), __FILE__, __LINE__, __func__,	\
	fmt::format(__VA_ARGS__));					\
    }									\
  } while (false)

#define shardrec_abort_msg(...)						\
  ::shardrec::__shardrec_abort(						\
    __FILE__, __LINE__, __func__, fmt::format(__VA_ARGS__))
