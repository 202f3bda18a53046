// -*- mode:C++; tab-width:8; c-basic-offset:2; indent-tabs-mode:t -*-
// vim: ts=8 sw=2 smarttab
/*
 * shardrec - shard recovery
 *
 * This is free software; you can redistribute it and/or
 * modify it under the terms of the GNU Lesser General Public
 * License version 2.1, as published by the Free Software
 * Foundation.  See file COPYING.
 *
 */

#include "shardrec/recovery/recovery_session.h"

#include <cerrno>
#include <cstring>

#include <seastar/util/defer.hh>

#include "common/log.h"

SET_SUBSYS(recovery);

namespace shardrec::recovery {

std::atomic<uint64_t> RecoverySession::id_generator{0};

std::string RecoverySession::make_temp_prefix(
  const recovery_config_t &conf, int64_t start_ms, uint64_t id)
{
  return fmt::format("{}{}.{}.", conf.temp_prefix, start_ms, id);
}

RecoverySession::RecoverySession(
  private_tag_t,
  shard_id_t _shard,
  peer_t _source,
  std::shared_ptr<RecoveryState> _state,
  std::shared_ptr<RecoveryListener> _listener,
  store::FileStore &store,
  const recovery_config_t &conf)
  : recovery_id(++id_generator),
    shard(std::move(_shard)),
    source(std::move(_source)),
    state(std::move(_state)),
    listener(std::move(_listener)),
    store(store),
    temp_files([this, &conf] {
      state->get_timer().start_time(RecoveryState::now_ms());
      return make_temp_prefix(
	conf, state->get_timer().start_time(), recovery_id);
    }())
{
  shardrec_assert(listener);
  // the store must outlive our temp files
  if (!store.try_inc_ref()) {
    throw recovery_error(
      ESHUTDOWN, fmt::format("{}: store already closed", *this));
  }
}

RecoverySession::~RecoverySession()
{
  LOG_PREFIX(RecoverySession::~RecoverySession);
  if (!is_finalized()) {
    WARNDPP("destroyed with {} references outstanding", *this, ref_count());
  }
}

RecoverySession::ref RecoverySession::begin(
  shard_id_t shard,
  peer_t source,
  std::shared_ptr<RecoveryState> state,
  std::shared_ptr<RecoveryListener> listener,
  store::FileStore &store,
  const recovery_config_t &conf)
{
  LOG_PREFIX(RecoverySession::begin);
  auto ret = std::make_shared<RecoverySession>(
    private_tag_t{}, std::move(shard), std::move(source),
    std::move(state), std::move(listener), store, conf);
  DEBUGDPP("from {}, temp prefix {}", *ret, ret->source, ret->get_temp_prefix());
  return ret;
}

void RecoverySession::set_waiting_worker(RecoveryWaiter::ref waiter)
{
  std::lock_guard l(waiter_lock);
  waiting_worker = waiter;
  // cancel() sets finished before taking waiter_lock
  if (waiter && is_finished()) {
    waiter->interrupt();
  }
}

void RecoverySession::clear_waiting_worker(const RecoveryWaiter::ref &expected)
{
  std::lock_guard l(waiter_lock);
  if (waiting_worker == expected) {
    waiting_worker.reset();
  }
}

std::string RecoverySession::issue_temp_name(const std::string &original)
{
  auto temp = temp_files.issue(original);
  if (!temp) {
    throw recovery_error(
      ESHUTDOWN,
      fmt::format("{}: temp name for {} requested after cleanup",
		  *this, original));
  }
  return std::move(*temp);
}

bool RecoverySession::is_temp_file(const std::string &name) const
{
  return temp_files.contains(name);
}

std::string RecoverySession::original_name_for(const std::string &temp) const
{
  return temp_files.original_name(temp);
}

std::vector<std::string> RecoverySession::list_temp_files() const
{
  return temp_files.list();
}

store::VerifyingOutput::ref RecoverySession::open_and_register_output(
  const std::string &key,
  const std::string &original,
  const file_metadata_t &metadata)
{
  LOG_PREFIX(RecoverySession::open_and_register_output);
  // registered before creation so that cleanup covers a partial create
  auto temp = issue_temp_name(original);

  store::VerifyingOutput::ref out;
  int r = store.create_verifying_output(temp, metadata, &out);
  if (r < 0) {
    DEBUGDPP("failed to create {}: {}", *this, temp, std::strerror(-r));
    throw recovery_error(
      -r, fmt::format("{}: failed to create {}", *this, temp));
  }
  auto &index = state->get_index();
  ++index.total_files;
  index.total_bytes += metadata.length;

  auto ret = out;
  store::VerifyingOutput::ref replaced;
  if (!outputs.put(key, std::move(out), &replaced)) {
    // lost a race with cleanup, which may have missed the new file
    if (int cr = ret->close(); cr < 0) {
      DEBUGDPP("error closing {}: {}", *this, temp, std::strerror(-cr));
    }
    store.delete_quietly(temp);
    throw recovery_error(
      ESHUTDOWN, fmt::format("{}: output {} opened after cleanup", *this, key));
  }
  if (replaced) {
    WARNDPP("replacing open output {} for key {}",
	    *this, replaced->get_name(), key);
    if (int cr = replaced->close(); cr < 0) {
      WARNDPP("error closing {}: {}", *this, replaced->get_name(),
	      std::strerror(-cr));
    }
  }
  TRACEDPP("opened {} for {} ({})", *this, temp, key, metadata);
  return ret;
}

store::VerifyingOutput::ref RecoverySession::lookup_output(
  const std::string &key) const
{
  return outputs.get(key);
}

store::VerifyingOutput::ref RecoverySession::remove_output(const std::string &key)
{
  return outputs.remove(key);
}

void RecoverySession::complete_output(const std::string &key)
{
  LOG_PREFIX(RecoverySession::complete_output);
  auto out = outputs.remove(key);
  if (!out) {
    throw recovery_error(
      ENOENT, fmt::format("{}: no open output for {}", *this, key));
  }
  out->verify_and_close();
  state->get_index().recovered_bytes += out->get_written();
  if (legacy_checksums.add(out->get_metadata())) {
    TRACEDPP("recorded legacy checksum for {}", *this, out->get_metadata().name);
  }
}

void RecoverySession::commit_all_temp_files()
{
  LOG_PREFIX(RecoverySession::commit_all_temp_files);
  if (is_finalized()) {
    throw recovery_error(
      ESHUTDOWN, fmt::format("{}: commit after cleanup", *this));
  }
  for (const auto &temp : temp_files.list()) {
    auto original = temp_files.original_name(temp);
    // first, go and delete the existing one
    if (int r = store.remove_file(original); r < 0 && r != -ENOENT) {
      DEBUGDPP("failed to delete file [{}]: {}",
	       *this, original, std::strerror(-r));
    }
    if (int r = store.rename_file(temp, original); r < 0) {
      ERRORDPP("failed to rename {} to {}: {}",
	       *this, temp, original, std::strerror(-r));
      throw recovery_error(
	-r, fmt::format("{}: failed to rename {} to {}", *this, temp, original));
    }
    temp_files.remove(temp);
    ++state->get_index().committed_files;
    TRACEDPP("renamed {} to {}", *this, temp, original);
  }
}

void RecoverySession::write_legacy_checksums()
{
  if (int r = legacy_checksums.write(store); r < 0) {
    throw recovery_error(
      -r, fmt::format("{}: failed to write legacy checksums", *this));
  }
}

void RecoverySession::cancel(const std::string &reason)
{
  LOG_PREFIX(RecoverySession::cancel);
  bool expected = false;
  if (!finished.compare_exchange_strong(expected, true)) {
    return;
  }
  DEBUGDPP("recovery canceled (reason: [{}])", *this, reason);
  // the initial reference, cleanup runs once other holders release theirs
  dec_ref();

  if (auto waiter = get_waiting_worker(); waiter) {
    waiter->interrupt();
  }
}

void RecoverySession::fail(
  const recovery_failed_error &e, bool send_shard_failure)
{
  LOG_PREFIX(RecoverySession::fail);
  bool expected = false;
  if (!finished.compare_exchange_strong(expected, true)) {
    return;
  }
  auto release = seastar::defer([this] () noexcept {
    dec_ref();
  });
  DEBUGDPP("recovery failed: {}", *this, e.what());
  try {
    listener->on_recovery_failure(*state, e, send_shard_failure);
  } catch (const std::exception &notify_error) {
    ERRORDPP("unexpected failure while notifying listener of failure: {}",
	     *this, notify_error.what());
  } catch (...) {
    ERRORDPP("unknown exception while notifying listener of failure", *this);
  }
}

void RecoverySession::mark_as_done()
{
  LOG_PREFIX(RecoverySession::mark_as_done);
  bool expected = false;
  if (!finished.compare_exchange_strong(expected, true)) {
    return;
  }
  shardrec_assertf(temp_files.empty(),
		   "{}: not all temporary files are renamed: {}",
		   *this, temp_files.size());
  dec_ref();
  DEBUGDPP("recovery done in {}ms", *this, state->get_timer().time());
  try {
    listener->on_recovery_done(*state);
  } catch (const std::exception &notify_error) {
    ERRORDPP("unexpected failure while notifying listener of completion: {}",
	     *this, notify_error.what());
  } catch (...) {
    ERRORDPP("unknown exception while notifying listener of completion",
	     *this);
  }
}

void RecoverySession::close_internal() noexcept
{
  LOG_PREFIX(RecoverySession::close_internal);
  finalized.store(true);
  {
    // the store reference is given back last, after every file op below
    auto release_store = seastar::defer([this] () noexcept {
      store.dec_ref();
    });
    for (auto &[key, out] : outputs.drain()) {
      if (int r = out->close(); r < 0) {
	WARNDPP("error closing output {}: {}",
		*this, out->get_name(), std::strerror(-r));
      }
    }
    for (const auto &temp : temp_files.drain()) {
      TRACEDPP("cleaning temporary file [{}]", *this, temp);
      store.delete_quietly(temp);
    }
  }
  legacy_checksums.clear();
}

std::ostream &operator<<(std::ostream &out, const RecoverySession &session)
{
  return out << session.get_shard() << " [" << session.get_id() << "]";
}

std::optional<RecoveryRef> RecoveryRef::try_acquire(RecoverySession::ref session)
{
  if (!session || !session->acquire_reference()) {
    return std::nullopt;
  }
  return RecoveryRef(std::move(session));
}

void RecoveryRef::reset()
{
  if (session) {
    auto s = std::move(session);
    session.reset();
    s->release_reference();
  }
}

}
