// -*- mode:C++; tab-width:8; c-basic-offset:2; indent-tabs-mode:t -*-
// vim: ts=8 sw=2 smarttab

#include <atomic>
#include <latch>
#include <thread>
#include <vector>

#include <fmt/format.h>

#include "gtest/gtest.h"

#include "test/shardrec/recovery_test_helpers.h"

using namespace shardrec;
using namespace shardrec::recovery;
using shardrec::test::metadata_for;
using shardrec::test::recovery_test_t;

constexpr unsigned NUM_THREADS = 8;

TEST_F(recovery_test_t, concurrent_references_finalize_once)
{
  auto session = begin_session();
  std::latch start(NUM_THREADS + 1);

  std::vector<std::thread> threads;
  for (unsigned i = 0; i < NUM_THREADS; ++i) {
    threads.emplace_back([&] {
      start.arrive_and_wait();
      for (unsigned j = 0; j < 1000; ++j) {
	auto ref = RecoveryRef::try_acquire(session);
	if (!ref) {
	  // once zero is reached it stays there
	  EXPECT_TRUE(session->is_finalized());
	  return;
	}
	EXPECT_FALSE((*ref)->is_finalized());
	EXPECT_EQ(2, store->ref_count());
      }
    });
  }
  start.arrive_and_wait();
  session->cancel("shard closed");
  for (auto &t : threads) {
    t.join();
  }

  EXPECT_TRUE(session->is_finalized());
  EXPECT_EQ(0, session->ref_count());
  expect_store_released();
}

TEST_F(recovery_test_t, racing_terminal_calls_notify_at_most_once)
{
  for (unsigned i = 0; i < 200; ++i) {
    auto before_done = listener->num_done.load();
    auto before_failed = listener->num_failed.load();
    auto session = begin_session();
    std::latch start(3);

    std::thread canceler([&] {
      start.arrive_and_wait();
      session->cancel("shard closed");
    });
    std::thread failer([&] {
      start.arrive_and_wait();
      session->fail(recovery_failed_error(shard, peer, "source gone"), true);
    });
    std::thread finisher([&] {
      start.arrive_and_wait();
      session->mark_as_done();
    });
    canceler.join();
    failer.join();
    finisher.join();

    auto notified = (listener->num_done - before_done) +
      (listener->num_failed - before_failed);
    EXPECT_LE(notified, 1u);
    EXPECT_TRUE(session->is_finalized());
    expect_store_released();
  }
}

TEST_F(recovery_test_t, cancel_interrupts_blocked_worker)
{
  auto session = begin_session();
  auto waiter = RecoveryWaiter::create();
  std::atomic<bool> interrupted{false};

  std::thread worker([&] {
    auto ref = RecoveryRef::try_acquire(session);
    ASSERT_TRUE(ref);
    auto md = metadata_for("_0.cfs", "never finished");
    (*ref)->open_and_register_output("_0.cfs", "_0.cfs", md)->write("never");
    try {
      RecoverySession::blocking_section_t section(**ref, waiter);
      // waiting on the source peer for the next chunk
      waiter->wait_until_interrupted();
      waiter->check_interrupted();
    } catch (const recovery_interrupted_error &) {
      interrupted = true;
    }
  });

  while (!session->get_waiting_worker()) {
    std::this_thread::yield();
  }
  session->cancel("shard closed");
  worker.join();

  EXPECT_TRUE(interrupted);
  EXPECT_TRUE(session->is_finalized());
  EXPECT_EQ(0u, store->get_num_renames());
  EXPECT_TRUE(store->list_files().empty());
  EXPECT_EQ(0u, listener->num_notifications());
  expect_store_released();
}

TEST_F(recovery_test_t, writers_racing_cancel_leave_no_files)
{
  auto session = begin_session();
  std::latch start(NUM_THREADS + 1);

  std::vector<std::thread> threads;
  for (unsigned i = 0; i < NUM_THREADS; ++i) {
    threads.emplace_back([&, i] {
      start.arrive_and_wait();
      for (unsigned j = 0; j < 100; ++j) {
	auto ref = RecoveryRef::try_acquire(session);
	if (!ref || (*ref)->is_finished()) {
	  return;
	}
	auto name = fmt::format("_{}_{}.cfs", i, j);
	auto content = fmt::format("segment {} of writer {}", j, i);
	auto out = (*ref)->open_and_register_output(
	  name, name, metadata_for(name, content));
	out->write(content);
	(*ref)->complete_output(name);
      }
    });
  }
  start.arrive_and_wait();
  session->cancel("shard closed");
  for (auto &t : threads) {
    t.join();
  }

  EXPECT_TRUE(session->is_finalized());
  EXPECT_TRUE(session->list_temp_files().empty());
  EXPECT_TRUE(store->list_files().empty());
  expect_store_released();
}
