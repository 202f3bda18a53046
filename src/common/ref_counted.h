// -*- mode:C++; tab-width:8; c-basic-offset:2; indent-tabs-mode:t -*-
// vim: ts=8 sw=2 smarttab

#pragma once

#include <atomic>

#include "include/shardrec_assert.h"

namespace shardrec::common {

/**
 * abstract_ref_counted_t
 *
 * Reference count starting at 1 on behalf of the creator.  The count may
 * only be raised while it is positive (try_inc_ref), so once it has dropped
 * to zero the object is unreachable and close_internal() has run exactly
 * once.  close_internal() releases resources; it does not free the object.
 */
class abstract_ref_counted_t {
  std::atomic<int> nref{1};

protected:
  /**
   * Invoked by whichever dec_ref() brings the count to zero, possibly from
   * a destructor or scope guard, so it must not throw.
   */
  virtual void close_internal() noexcept = 0;

public:
  abstract_ref_counted_t() = default;
  abstract_ref_counted_t(const abstract_ref_counted_t &) = delete;
  abstract_ref_counted_t &operator=(const abstract_ref_counted_t &) = delete;
  virtual ~abstract_ref_counted_t() = default;

  /// Returns true iff the count was positive and has been incremented
  bool try_inc_ref() {
    int i = nref.load(std::memory_order_relaxed);
    while (i > 0) {
      if (nref.compare_exchange_weak(
	    i, i + 1, std::memory_order_acquire, std::memory_order_relaxed)) {
	return true;
      }
    }
    return false;
  }

  void inc_ref() {
    bool got = try_inc_ref();
    shardrec_assertf(got, "inc_ref on closed object {}", (void*)this);
  }

  /// Returns true iff this call released the last reference
  bool dec_ref() {
    int i = nref.fetch_sub(1, std::memory_order_acq_rel) - 1;
    shardrec_assertf(i >= 0, "ref count below zero on {}", (void*)this);
    if (i == 0) {
      close_internal();
      return true;
    }
    return false;
  }

  int ref_count() const {
    return nref.load(std::memory_order_acquire);
  }
};

}
