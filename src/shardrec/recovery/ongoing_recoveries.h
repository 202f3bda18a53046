// -*- mode:C++; tab-width:8; c-basic-offset:2; indent-tabs-mode:t -*-
// vim: ts=8 sw=2 smarttab

#pragma once

#include <cstdint>
#include <map>
#include <mutex>
#include <optional>
#include <string>

#include "shardrec/recovery/recovery_session.h"

namespace shardrec::recovery {

/**
 * OngoingRecoveries
 *
 * Sessions in flight on this node, by recovery id.  Lookups hand out
 * RecoveryRefs so a session found here stays usable until the ref is
 * dropped even if it is ended concurrently.  Ending a session through
 * this class also forgets it.
 */
class OngoingRecoveries {
  const recovery_config_t conf;
  mutable std::mutex lock;
  std::map<uint64_t, RecoverySession::ref> recoveries;

  RecoverySession::ref take(uint64_t id);

public:
  explicit OngoingRecoveries(recovery_config_t conf = recovery_config_t{})
    : conf(std::move(conf)) {}
  ~OngoingRecoveries();

  /// Begins and tracks a new session, returns its id
  uint64_t start_recovery(
    shard_id_t shard,
    peer_t source,
    std::shared_ptr<RecoveryState> state,
    std::shared_ptr<RecoveryListener> listener,
    store::FileStore &store);

  /// nullopt if id is unknown or already past its last reference
  std::optional<RecoveryRef> get_recovery(uint64_t id);

  /// Returns false if id was not tracked
  bool cancel_recovery(uint64_t id, const std::string &reason);

  /// Cancels every session recovering shard, returns how many
  unsigned cancel_recoveries_for_shard(
    const shard_id_t &shard, const std::string &reason);

  bool fail_recovery(
    uint64_t id, const recovery_failed_error &e, bool send_shard_failure);

  /// All temp files of the session must already be committed
  bool mark_recovery_done(uint64_t id);

  size_t size() const;
};

}
