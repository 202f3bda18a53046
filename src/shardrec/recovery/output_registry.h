// -*- mode:C++; tab-width:8; c-basic-offset:2; indent-tabs-mode:t -*-
// vim: ts=8 sw=2 smarttab

#pragma once

#include <map>
#include <mutex>
#include <string>

#include "shardrec/store/verifying_output.h"

namespace shardrec::recovery {

/**
 * OutputRegistry
 *
 * Open outputs of one recovery by logical key.  Handles given out by
 * get() share ownership, so they stay valid after the key is replaced,
 * removed or drained.
 */
class OutputRegistry {
  using output_ref = store::VerifyingOutput::ref;

  mutable std::mutex lock;
  std::map<std::string, output_ref> outputs;
  bool drained = false;

public:
  /**
   * Takes out and registers it under key.  A previous output under key is
   * moved into *replaced.  Returns false, leaving out untouched, once
   * drained.
   */
  bool put(const std::string &key, output_ref &&out, output_ref *replaced);

  /// Output under key or nullptr
  output_ref get(const std::string &key) const;

  output_ref remove(const std::string &key);

  size_t size() const;

  /// Refuses further outputs and hands back the open ones, allocation free
  std::map<std::string, output_ref> drain() noexcept;
};

}
