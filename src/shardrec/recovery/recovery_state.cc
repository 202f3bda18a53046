// -*- mode:C++; tab-width:8; c-basic-offset:2; indent-tabs-mode:t -*-
// vim: ts=8 sw=2 smarttab

#include "shardrec/recovery/recovery_state.h"

#include <chrono>

namespace shardrec::recovery {

int64_t RecoveryState::Timer::time() const
{
  auto start = start_time();
  if (start == 0) {
    return 0;
  }
  auto stop = stop_time();
  return (stop ? stop : now_ms()) - start;
}

void RecoveryState::set_stage(stage_t s)
{
  stage.store(s);
  if (s == stage_t::done) {
    timer.stop_time(now_ms());
  }
}

int64_t RecoveryState::now_ms()
{
  return std::chrono::duration_cast<std::chrono::milliseconds>(
    std::chrono::system_clock::now().time_since_epoch()).count();
}

std::ostream &operator<<(std::ostream &out, RecoveryState::stage_t s)
{
  switch (s) {
  case RecoveryState::stage_t::init: return out << "init";
  case RecoveryState::stage_t::index: return out << "index";
  case RecoveryState::stage_t::verify_index: return out << "verify_index";
  case RecoveryState::stage_t::translog: return out << "translog";
  case RecoveryState::stage_t::finalize: return out << "finalize";
  case RecoveryState::stage_t::done: return out << "done";
  }
  return out << "unknown(" << static_cast<int>(s) << ")";
}

std::ostream &operator<<(std::ostream &out, const RecoveryState &state)
{
  const auto &index = state.get_index();
  return out << "recovery_state(" << state.get_shard()
	     << " stage=" << state.get_stage()
	     << " files=" << index.committed_files.load() << "/" << index.total_files.load()
	     << " bytes=" << index.recovered_bytes.load() << "/" << index.total_bytes.load()
	     << " time=" << state.get_timer().time() << "ms)";
}

}
