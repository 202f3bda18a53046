// -*- mode:C++; tab-width:8; c-basic-offset:2; indent-tabs-mode:t -*-
// vim: ts=8 sw=2 smarttab

#include "shardrec/recovery/ongoing_recoveries.h"

#include <vector>

#include "common/log.h"

SET_SUBSYS(recovery);

namespace shardrec::recovery {

OngoingRecoveries::~OngoingRecoveries()
{
  LOG_PREFIX(OngoingRecoveries::~OngoingRecoveries);
  std::map<uint64_t, RecoverySession::ref> remaining;
  {
    std::lock_guard l(lock);
    remaining.swap(recoveries);
  }
  for (auto &[id, session] : remaining) {
    DEBUGDPP("canceling on shutdown", *session);
    session->cancel("shutting down");
  }
}

RecoverySession::ref OngoingRecoveries::take(uint64_t id)
{
  std::lock_guard l(lock);
  auto iter = recoveries.find(id);
  if (iter == recoveries.end()) {
    return nullptr;
  }
  auto ret = std::move(iter->second);
  recoveries.erase(iter);
  return ret;
}

uint64_t OngoingRecoveries::start_recovery(
  shard_id_t shard,
  peer_t source,
  std::shared_ptr<RecoveryState> state,
  std::shared_ptr<RecoveryListener> listener,
  store::FileStore &store)
{
  LOG_PREFIX(OngoingRecoveries::start_recovery);
  auto session = RecoverySession::begin(
    std::move(shard), std::move(source), std::move(state),
    std::move(listener), store, conf);
  auto id = session->get_id();
  std::lock_guard l(lock);
  auto [iter, inserted] = recoveries.emplace(id, std::move(session));
  shardrec_assertf(inserted, "recovery id {} already tracked", id);
  DEBUGDPP("started", *iter->second);
  return id;
}

std::optional<RecoveryRef> OngoingRecoveries::get_recovery(uint64_t id)
{
  RecoverySession::ref session;
  {
    std::lock_guard l(lock);
    auto iter = recoveries.find(id);
    if (iter == recoveries.end()) {
      return std::nullopt;
    }
    session = iter->second;
  }
  return RecoveryRef::try_acquire(std::move(session));
}

bool OngoingRecoveries::cancel_recovery(uint64_t id, const std::string &reason)
{
  auto session = take(id);
  if (!session) {
    return false;
  }
  session->cancel(reason);
  return true;
}

unsigned OngoingRecoveries::cancel_recoveries_for_shard(
  const shard_id_t &shard, const std::string &reason)
{
  LOG_PREFIX(OngoingRecoveries::cancel_recoveries_for_shard);
  std::vector<RecoverySession::ref> to_cancel;
  {
    std::lock_guard l(lock);
    for (auto iter = recoveries.begin(); iter != recoveries.end(); ) {
      if (iter->second->get_shard() == shard) {
	to_cancel.push_back(std::move(iter->second));
	iter = recoveries.erase(iter);
      } else {
	++iter;
      }
    }
  }
  for (auto &session : to_cancel) {
    session->cancel(reason);
  }
  DEBUG("canceled {} recoveries of {}", to_cancel.size(), shard);
  return to_cancel.size();
}

bool OngoingRecoveries::fail_recovery(
  uint64_t id, const recovery_failed_error &e, bool send_shard_failure)
{
  auto session = take(id);
  if (!session) {
    return false;
  }
  session->fail(e, send_shard_failure);
  return true;
}

bool OngoingRecoveries::mark_recovery_done(uint64_t id)
{
  auto session = take(id);
  if (!session) {
    return false;
  }
  session->mark_as_done();
  return true;
}

size_t OngoingRecoveries::size() const
{
  std::lock_guard l(lock);
  return recoveries.size();
}

}
