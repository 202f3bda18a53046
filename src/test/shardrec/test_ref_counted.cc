// -*- mode:C++; tab-width:8; c-basic-offset:2; indent-tabs-mode:t -*-
// vim: ts=8 sw=2 smarttab

#include <atomic>
#include <thread>
#include <vector>

#include "gtest/gtest.h"

#include "common/ref_counted.h"

using namespace shardrec::common;

struct counted_t final : abstract_ref_counted_t {
  std::atomic<unsigned> closes{0};
protected:
  void close_internal() noexcept final {
    ++closes;
  }
};

TEST(ref_counted, starts_with_one_reference)
{
  counted_t c;
  EXPECT_EQ(1, c.ref_count());
  EXPECT_TRUE(c.dec_ref());
  EXPECT_EQ(0, c.ref_count());
  EXPECT_EQ(1u, c.closes);
}

TEST(ref_counted, try_inc_ref_fails_once_closed)
{
  counted_t c;
  ASSERT_TRUE(c.try_inc_ref());
  EXPECT_EQ(2, c.ref_count());
  EXPECT_FALSE(c.dec_ref());
  EXPECT_EQ(0u, c.closes);
  EXPECT_TRUE(c.dec_ref());
  EXPECT_FALSE(c.try_inc_ref());
  EXPECT_EQ(0, c.ref_count());
  EXPECT_EQ(1u, c.closes);
}

TEST(ref_counted, concurrent_holders_close_once)
{
  counted_t c;
  std::atomic<bool> go{false};
  std::vector<std::thread> threads;
  for (int t = 0; t < 8; ++t) {
    threads.emplace_back([&] {
      while (!go) {
	std::this_thread::yield();
      }
      for (int i = 0; i < 10000; ++i) {
	if (c.try_inc_ref()) {
	  c.dec_ref();
	}
      }
    });
  }
  go = true;
  c.dec_ref();
  for (auto &t : threads) {
    t.join();
  }
  EXPECT_EQ(0, c.ref_count());
  EXPECT_EQ(1u, c.closes);
  EXPECT_FALSE(c.try_inc_ref());
}

TEST(ref_counted_death, dec_ref_below_zero_aborts)
{
  GTEST_FLAG_SET(death_test_style, "threadsafe");
  counted_t c;
  c.dec_ref();
  EXPECT_DEATH(c.dec_ref(), "ref count below zero");
}

TEST(ref_counted_death, inc_ref_on_closed_aborts)
{
  GTEST_FLAG_SET(death_test_style, "threadsafe");
  counted_t c;
  c.dec_ref();
  EXPECT_DEATH(c.inc_ref(), "inc_ref on closed object");
}
