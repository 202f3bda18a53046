// -*- mode:C++; tab-width:8; c-basic-offset:2; indent-tabs-mode:t -*-
// vim: ts=8 sw=2 smarttab

#include "shardrec/recovery/recovery_waiter.h"

#include "shardrec/errors.h"

namespace shardrec::recovery {

void RecoveryWaiter::interrupt()
{
  {
    std::lock_guard l(lock);
    interrupted = true;
  }
  cv.notify_all();
}

bool RecoveryWaiter::is_interrupted() const
{
  std::lock_guard l(lock);
  return interrupted;
}

void RecoveryWaiter::check_interrupted() const
{
  if (is_interrupted()) {
    throw recovery_interrupted_error("recovery worker interrupted");
  }
}

void RecoveryWaiter::notify()
{
  {
    std::lock_guard l(lock);
    notified = true;
  }
  cv.notify_all();
}

void RecoveryWaiter::wait_until_interrupted()
{
  std::unique_lock l(lock);
  cv.wait(l, [this] { return interrupted; });
}

}
