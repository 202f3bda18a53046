// -*- mode:C++; tab-width:8; c-basic-offset:2; indent-tabs-mode:t -*-
// vim: ts=8 sw=2 smarttab

#pragma once

#include "shardrec/errors.h"
#include "shardrec/recovery/recovery_state.h"

namespace shardrec::recovery {

/**
 * RecoveryListener
 *
 * Told about the outcome of a recovery, at most once per session.
 * Cancellation is not reported.
 */
class RecoveryListener {
public:
  virtual ~RecoveryListener() = default;

  virtual void on_recovery_done(RecoveryState &state) = 0;

  /// send_shard_failure: whether the shard failure should be reported on
  virtual void on_recovery_failure(
    RecoveryState &state,
    const recovery_failed_error &e,
    bool send_shard_failure) = 0;
};

}
