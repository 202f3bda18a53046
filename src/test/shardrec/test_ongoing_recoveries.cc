// -*- mode:C++; tab-width:8; c-basic-offset:2; indent-tabs-mode:t -*-
// vim: ts=8 sw=2 smarttab

#include "gtest/gtest.h"

#include "shardrec/recovery/ongoing_recoveries.h"
#include "test/shardrec/recovery_test_helpers.h"

using namespace shardrec;
using namespace shardrec::recovery;
using shardrec::test::recovery_test_t;

struct ongoing_recoveries_test_t : recovery_test_t {
  uint64_t start(OngoingRecoveries &recoveries, const shard_id_t &s) {
    return recoveries.start_recovery(
      s, peer, std::make_shared<RecoveryState>(s), listener, *store);
  }
};

TEST_F(ongoing_recoveries_test_t, tracks_until_done)
{
  OngoingRecoveries recoveries;
  auto id = start(recoveries, shard);
  EXPECT_EQ(1u, recoveries.size());
  {
    auto ref = recoveries.get_recovery(id);
    ASSERT_TRUE(ref);
    EXPECT_EQ(id, (*ref)->get_id());
    EXPECT_EQ(shard, (*ref)->get_shard());
  }

  EXPECT_TRUE(recoveries.mark_recovery_done(id));
  EXPECT_EQ(0u, recoveries.size());
  EXPECT_FALSE(recoveries.get_recovery(id));
  EXPECT_FALSE(recoveries.mark_recovery_done(id));
  EXPECT_FALSE(recoveries.cancel_recovery(id, "gone"));
  EXPECT_EQ(1u, listener->num_done);
  expect_store_released();
}

TEST_F(ongoing_recoveries_test_t, fail_notifies_listener)
{
  OngoingRecoveries recoveries;
  auto id = start(recoveries, shard);
  EXPECT_TRUE(recoveries.fail_recovery(
    id, recovery_failed_error(shard, peer, "peer left"), true));
  EXPECT_FALSE(recoveries.fail_recovery(
    id, recovery_failed_error(shard, peer, "peer left"), true));
  EXPECT_EQ(1u, listener->num_failed);
  EXPECT_EQ("peer left", listener->failure_reason);
  expect_store_released();
}

TEST_F(ongoing_recoveries_test_t, cancel_by_shard)
{
  OngoingRecoveries recoveries;
  shard_id_t other{"idx", 1};
  start(recoveries, shard);
  start(recoveries, shard);
  auto kept = start(recoveries, other);
  EXPECT_EQ(3u, recoveries.size());

  EXPECT_EQ(2u, recoveries.cancel_recoveries_for_shard(shard, "shard closed"));
  EXPECT_EQ(1u, recoveries.size());
  EXPECT_TRUE(recoveries.get_recovery(kept));
  EXPECT_EQ(0u, recoveries.cancel_recoveries_for_shard(shard, "again"));

  EXPECT_TRUE(recoveries.cancel_recovery(kept, "shard closed"));
  EXPECT_EQ(0u, listener->num_notifications());
  expect_store_released();
}

TEST_F(ongoing_recoveries_test_t, held_ref_outlives_cancel)
{
  OngoingRecoveries recoveries;
  auto id = start(recoveries, shard);
  auto ref = recoveries.get_recovery(id);
  ASSERT_TRUE(ref);
  auto session = ref->get();

  auto temp = (*ref)->issue_temp_name("_0.cfs");
  EXPECT_TRUE(recoveries.cancel_recovery(id, "shard closed"));
  EXPECT_FALSE(recoveries.get_recovery(id));
  EXPECT_TRUE(session->is_finished());
  EXPECT_FALSE(session->is_finalized());
  EXPECT_TRUE((*ref)->is_temp_file(temp));

  ref->reset();
  EXPECT_TRUE(session->is_finalized());
  expect_store_released();
}

TEST_F(ongoing_recoveries_test_t, shutdown_cancels_remaining)
{
  {
    OngoingRecoveries recoveries;
    start(recoveries, shard);
    start(recoveries, shard_id_t{"other", 3});
    EXPECT_EQ(3, store->ref_count());
  }
  EXPECT_EQ(0u, listener->num_notifications());
  expect_store_released();
}

TEST_F(ongoing_recoveries_test_t, start_on_closed_store_is_not_tracked)
{
  OngoingRecoveries recoveries;
  store::MemStore closed_store;
  closed_store.dec_ref();
  EXPECT_THROW(
    recoveries.start_recovery(
      shard, peer, std::make_shared<RecoveryState>(shard),
      listener, closed_store),
    recovery_error);
  EXPECT_EQ(0u, recoveries.size());
}
