// -*- mode:C++; tab-width:8; c-basic-offset:2; indent-tabs-mode:t -*-
// vim: ts=8 sw=2 smarttab

#include <cstdlib>
#include <iostream>

#include "include/shardrec_assert.h"

namespace shardrec {

[[noreturn]] void __shardrec_assert_fail(const assert_data &ctx)
{
  __shardrec_assert_fail(ctx.assertion, ctx.file, ctx.line, ctx.function);
}

[[noreturn]] void __shardrec_assert_fail(
  const char *assertion, const char *file, int line, const char *function)
{
  std::cerr << fmt::format("{}: In function '{}'\n{}: {}: FAILED assertion({})",
			   file, function, file, line, assertion)
	    << std::endl;
  std::abort();
}

[[noreturn]] void __shardrec_assertf_fail(
  const char *assertion, const char *file, int line, const char *function,
  const std::string &msg)
{
  std::cerr << fmt::format("{}: In function '{}'\n{}: {}: FAILED assertion({})\n{}",
			   file, function, file, line, assertion, msg)
	    << std::endl;
  std::abort();
}

[[noreturn]] void __shardrec_abort(
  const char *file, int line, const char *function, const std::string &msg)
{
  std::cerr << fmt::format("{}: In function '{}'\n{}: {}: abort: {}",
			   file, function, file, line, msg)
	    << std::endl;
  std::abort();
}

}
