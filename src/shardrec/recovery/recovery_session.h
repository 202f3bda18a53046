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

#pragma once

#include <atomic>
#include <cstdint>
#include <iostream>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include <fmt/ostream.h>

#include "common/ref_counted.h"
#include "shardrec/errors.h"
#include "shardrec/recovery/config.h"
#include "shardrec/recovery/output_registry.h"
#include "shardrec/recovery/recovery_listener.h"
#include "shardrec/recovery/recovery_state.h"
#include "shardrec/recovery/recovery_waiter.h"
#include "shardrec/recovery/temp_file_registry.h"
#include "shardrec/store/file_store.h"
#include "shardrec/store/legacy_checksums.h"
#include "shardrec/types.h"

namespace shardrec::recovery {

/**
 * RecoverySession
 *
 * One attempt at pulling the files of a shard from a source peer into the
 * shard's FileStore.
 *
 * Files are written under temp names (prefix + original name) and only
 * become visible through commit_all_temp_files(), which renames each over
 * its original.  A session ends in exactly one of cancel(), fail() or
 * mark_as_done(); the first call wins and later ones are no-ops.
 *
 * The session is reference counted independently of its memory (which is
 * held through shared_ptr).  The creator holds the initial reference and
 * gives it up through the terminal call.  Anyone else must
 * acquire_reference() before touching files and release_reference() when
 * done.  When the count drops to zero, open outputs are closed, remaining
 * temp files are deleted and the store reference taken in begin() is
 * released.  That may happen on any thread, after the terminal call.
 */
class RecoverySession final
  : public common::abstract_ref_counted_t,
    public std::enable_shared_from_this<RecoverySession> {
  struct private_tag_t {};

  static std::atomic<uint64_t> id_generator;

  const uint64_t recovery_id;
  const shard_id_t shard;
  const peer_t source;
  const std::shared_ptr<RecoveryState> state;
  const std::shared_ptr<RecoveryListener> listener;
  store::FileStore &store;

  TempFileRegistry temp_files;
  OutputRegistry outputs;
  store::LegacyChecksums legacy_checksums;

  /// set by the first of cancel/fail/mark_as_done
  std::atomic<bool> finished{false};
  std::atomic<bool> finalized{false};
  mutable std::mutex waiter_lock;
  RecoveryWaiter::ref waiting_worker;

  static std::string make_temp_prefix(
    const recovery_config_t &conf, int64_t start_ms, uint64_t id);

protected:
  void close_internal() noexcept final;

public:
  using ref = std::shared_ptr<RecoverySession>;

  RecoverySession(
    private_tag_t,
    shard_id_t shard,
    peer_t source,
    std::shared_ptr<RecoveryState> state,
    std::shared_ptr<RecoveryListener> listener,
    store::FileStore &store,
    const recovery_config_t &conf);
  ~RecoverySession() final;

  /**
   * Starts a session holding one reference on itself and one on store.
   * Throws recovery_error(ESHUTDOWN) if store is already closed.
   */
  static ref begin(
    shard_id_t shard,
    peer_t source,
    std::shared_ptr<RecoveryState> state,
    std::shared_ptr<RecoveryListener> listener,
    store::FileStore &store,
    const recovery_config_t &conf = recovery_config_t{});

  uint64_t get_id() const { return recovery_id; }
  const shard_id_t &get_shard() const { return shard; }
  const peer_t &get_source() const { return source; }
  RecoveryState &get_state() { return *state; }
  const RecoveryState &get_state() const { return *state; }
  store::FileStore &get_store() { return store; }
  const std::string &get_temp_prefix() const { return temp_files.get_prefix(); }
  store::LegacyChecksums &get_legacy_checksums() { return legacy_checksums; }

  void set_stage(RecoveryState::stage_t stage) { state->set_stage(stage); }
  RecoveryState::stage_t get_stage() const { return state->get_stage(); }

  /// True once cancel, fail or mark_as_done has won
  bool is_finished() const { return finished.load(); }
  /// True once the reference count reached zero and cleanup ran
  bool is_finalized() const { return finalized.load(); }

  /**
   * Pins the session, false if it already reached zero references in
   * which case it must not be used.  Each true return must be paired with
   * release_reference().
   */
  [[nodiscard]] bool acquire_reference() { return try_inc_ref(); }
  void release_reference() { dec_ref(); }

  /**
   * Records the waiter cancel() should interrupt.  A waiter registered
   * after cancel() is interrupted right away.
   */
  void set_waiting_worker(RecoveryWaiter::ref waiter);
  /// Clears the recorded waiter only if it is still expected
  void clear_waiting_worker(const RecoveryWaiter::ref &expected);
  RecoveryWaiter::ref get_waiting_worker() const {
    std::lock_guard l(waiter_lock);
    return waiting_worker;
  }

  /// Registers a waiter with the session for the lifetime of the section
  class blocking_section_t {
    RecoverySession &session;
    RecoveryWaiter::ref waiter;
  public:
    blocking_section_t(RecoverySession &session, RecoveryWaiter::ref waiter)
      : session(session), waiter(std::move(waiter)) {
      session.set_waiting_worker(this->waiter);
    }
    ~blocking_section_t() {
      session.clear_waiting_worker(waiter);
    }
    blocking_section_t(const blocking_section_t &) = delete;
    blocking_section_t &operator=(const blocking_section_t &) = delete;
  };

  /**
   * Returns the temp name for original and registers it for cleanup.
   * Call before creating the file so cleanup knows about it even if
   * creation fails.  Throws recovery_error(ESHUTDOWN) once finalized.
   */
  std::string issue_temp_name(const std::string &original);

  bool is_temp_file(const std::string &name) const;

  /// name must be a temp file issued by this session
  std::string original_name_for(const std::string &temp) const;

  std::vector<std::string> list_temp_files() const;

  /**
   * Creates a verifying output for original under its temp name and
   * registers it under key.  Throws recovery_error if the store cannot
   * create the file, the temp name stays registered for cleanup.  An
   * output already registered under key is closed and replaced; handles
   * to it stay valid but reject further writes.
   */
  store::VerifyingOutput::ref open_and_register_output(
    const std::string &key,
    const std::string &original,
    const file_metadata_t &metadata);

  /// nullptr if key has no open output
  store::VerifyingOutput::ref lookup_output(const std::string &key) const;

  /// Unregisters and returns the output under key, nullptr if none
  store::VerifyingOutput::ref remove_output(const std::string &key);

  /**
   * Removes the output under key, verifies and closes it and records its
   * legacy checksum.  Throws corrupt_file_error on mismatch and
   * recovery_error(ENOENT) if key has no open output.
   */
  void complete_output(const std::string &key);

  /**
   * Renames every temp file over its original name, deleting any existing
   * original first.  A failed rename throws recovery_error and the
   * recovery must be failed; files renamed before it stay renamed.
   */
  void commit_all_temp_files();

  /// Persists the legacy checksums gathered by complete_output()
  void write_legacy_checksums();

  /**
   * Ends the recovery without notifying the listener and interrupts the
   * waiting worker, if any.  Cleanup runs once all references are released.
   */
  void cancel(const std::string &reason);

  /// Ends the recovery and reports e to the listener
  void fail(const recovery_failed_error &e, bool send_shard_failure);

  /**
   * Ends the recovery successfully.  All temp files must already be
   * committed.
   */
  void mark_as_done();
};

std::ostream &operator<<(std::ostream &out, const RecoverySession &session);

/**
 * RecoveryRef
 *
 * Holds one acquired reference on a session, released on destruction.
 */
class RecoveryRef {
  RecoverySession::ref session;

  explicit RecoveryRef(RecoverySession::ref session)
    : session(std::move(session)) {}

public:
  RecoveryRef() = default;
  RecoveryRef(RecoveryRef &&other) noexcept = default;
  RecoveryRef &operator=(RecoveryRef &&other) noexcept {
    if (this != &other) {
      reset();
      session = std::move(other.session);
    }
    return *this;
  }
  RecoveryRef(const RecoveryRef &) = delete;
  RecoveryRef &operator=(const RecoveryRef &) = delete;
  ~RecoveryRef() {
    reset();
  }

  /// nullopt if the session already dropped to zero references
  static std::optional<RecoveryRef> try_acquire(RecoverySession::ref session);

  void reset();

  explicit operator bool() const { return static_cast<bool>(session); }
  RecoverySession *operator->() const { return session.get(); }
  RecoverySession &operator*() const { return *session; }
  const RecoverySession::ref &get() const { return session; }
};

}

#if FMT_VERSION >= 90000
template <> struct fmt::formatter<shardrec::recovery::RecoverySession>
  : fmt::ostream_formatter {};
#endif
