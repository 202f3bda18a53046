// -*- mode:C++; tab-width:8; c-basic-offset:2; indent-tabs-mode:t -*-
// vim: ts=8 sw=2 smarttab

#pragma once

#include <atomic>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

#include <boost/crc.hpp>

#include "gtest/gtest.h"

#include "shardrec/recovery/recovery_session.h"
#include "shardrec/store/mem_store.h"

namespace shardrec::test {

inline file_metadata_t metadata_for(
  const std::string &name, const std::string &content, bool legacy = false)
{
  boost::crc_32_type crc;
  crc.process_bytes(content.data(), content.size());
  return file_metadata_t(name, content.size(), crc.checksum(), legacy);
}

struct test_listener_t final : recovery::RecoveryListener {
  std::atomic<unsigned> num_done{0};
  std::atomic<unsigned> num_failed{0};
  std::atomic<bool> throw_on_notify{false};
  /// throw something not derived from std::exception
  std::atomic<bool> throw_non_standard{false};

  std::mutex lock;
  std::optional<recovery::RecoveryState::stage_t> done_stage;
  std::optional<std::string> failure_reason;
  bool send_shard_failure = false;

  void on_recovery_done(recovery::RecoveryState &state) final {
    {
      std::lock_guard l(lock);
      done_stage = state.get_stage();
    }
    ++num_done;
    if (throw_non_standard) {
      throw 42;
    }
    if (throw_on_notify) {
      throw std::runtime_error("listener blew up on done");
    }
  }

  void on_recovery_failure(
    recovery::RecoveryState &,
    const recovery_failed_error &e,
    bool _send_shard_failure) final {
    {
      std::lock_guard l(lock);
      failure_reason = e.get_reason();
      send_shard_failure = _send_shard_failure;
    }
    ++num_failed;
    if (throw_non_standard) {
      throw 42;
    }
    if (throw_on_notify) {
      throw std::runtime_error("listener blew up on failure");
    }
  }

  unsigned num_notifications() const {
    return num_done + num_failed;
  }
};

/// Fixture owning a MemStore, declared first so it outlives sessions
struct recovery_test_t : public ::testing::Test {
  std::unique_ptr<store::MemStore> store = std::make_unique<store::MemStore>();
  std::shared_ptr<test_listener_t> listener =
    std::make_shared<test_listener_t>();
  shard_id_t shard{"idx", 0};
  peer_t peer{"node-1", "10.0.0.1:9300"};

  recovery::RecoverySession::ref begin_session(
    const recovery::recovery_config_t &conf = recovery::recovery_config_t{}) {
    return recovery::RecoverySession::begin(
      shard, peer, std::make_shared<recovery::RecoveryState>(shard),
      listener, *store, conf);
  }

  /// Writes content through a fresh output and completes it
  void receive_file(
    recovery::RecoverySession &session,
    const std::string &name,
    const std::string &content) {
    auto md = metadata_for(name, content);
    auto out = session.open_and_register_output(name, name, md);
    out->write(content);
    session.complete_output(name);
  }

  /// Store back to the reference held by the fixture and never closed
  void expect_store_released() {
    EXPECT_EQ(1, store->ref_count());
    EXPECT_FALSE(store->was_closed());
    EXPECT_EQ(0u, store->get_num_open_outputs());
  }
};

}
