// -*- mode:C++; tab-width:8; c-basic-offset:2; indent-tabs-mode:t -*-
// vim: ts=8 sw=2 smarttab

#pragma once

#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>

namespace shardrec::recovery {

/**
 * RecoveryWaiter
 *
 * Wakeup channel for a worker blocked on behalf of a recovery.  A worker
 * registers its waiter with the session around a blocking call and checks
 * is_interrupted() before and after blocking.  Once interrupted, a waiter
 * stays interrupted.
 */
class RecoveryWaiter {
  mutable std::mutex lock;
  std::condition_variable cv;
  bool interrupted = false;
  bool notified = false;

public:
  using ref = std::shared_ptr<RecoveryWaiter>;

  static ref create() {
    return std::make_shared<RecoveryWaiter>();
  }

  void interrupt();
  bool is_interrupted() const;

  /// Throws recovery_interrupted_error once interrupted
  void check_interrupted() const;

  /// Wakes a waiter without interrupting it
  void notify();

  /**
   * Blocks until notified, interrupted or timeout expires.  Returns false
   * iff the timeout expired.  Consumes a pending notify().
   */
  template <typename Rep, typename Period>
  bool wait_for(std::chrono::duration<Rep, Period> timeout) {
    std::unique_lock l(lock);
    bool woken = cv.wait_for(l, timeout, [this] {
      return interrupted || notified;
    });
    notified = false;
    return woken;
  }

  void wait_until_interrupted();
};

}
