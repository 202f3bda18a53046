// -*- mode:C++; tab-width:8; c-basic-offset:2; indent-tabs-mode:t -*-
// vim: ts=8 sw=2 smarttab

#pragma once

#include <atomic>
#include <cstdint>
#include <iostream>

#include <fmt/ostream.h>

#include "shardrec/types.h"

namespace shardrec::recovery {

/**
 * RecoveryState
 *
 * Progress of one recovery: the current stage, when it started and
 * stopped, and how far the file copy has gotten.  Updated by the worker,
 * read by anyone, all fields are individually atomic.
 */
class RecoveryState {
public:
  enum class stage_t : uint8_t {
    init = 0,
    index,
    verify_index,
    translog,
    finalize,
    done
  };

  class Timer {
    std::atomic<int64_t> start_ms{0};
    std::atomic<int64_t> stop_ms{0};

  public:
    void start_time(int64_t ms) { start_ms.store(ms); }
    int64_t start_time() const { return start_ms.load(); }
    void stop_time(int64_t ms) { stop_ms.store(ms); }
    int64_t stop_time() const { return stop_ms.load(); }

    /// Elapsed ms, up to now if not yet stopped
    int64_t time() const;
  };

  struct index_t {
    std::atomic<uint64_t> total_files{0};
    std::atomic<uint64_t> total_bytes{0};
    std::atomic<uint64_t> recovered_bytes{0};
    std::atomic<uint64_t> committed_files{0};
  };

private:
  const shard_id_t shard;
  std::atomic<stage_t> stage{stage_t::init};
  Timer timer;
  index_t index;

public:
  explicit RecoveryState(shard_id_t shard) : shard(std::move(shard)) {}

  const shard_id_t &get_shard() const { return shard; }

  /// Moving to done stamps the stop time
  void set_stage(stage_t s);
  stage_t get_stage() const { return stage.load(); }

  Timer &get_timer() { return timer; }
  const Timer &get_timer() const { return timer; }
  index_t &get_index() { return index; }
  const index_t &get_index() const { return index; }

  static int64_t now_ms();
};

std::ostream &operator<<(std::ostream &out, RecoveryState::stage_t s);
std::ostream &operator<<(std::ostream &out, const RecoveryState &state);

}

#if FMT_VERSION >= 90000
template <> struct fmt::formatter<shardrec::recovery::RecoveryState::stage_t>
  : fmt::ostream_formatter {};
template <> struct fmt::formatter<shardrec::recovery::RecoveryState>
  : fmt::ostream_formatter {};
#endif
