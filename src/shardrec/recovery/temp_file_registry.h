// -*- mode:C++; tab-width:8; c-basic-offset:2; indent-tabs-mode:t -*-
// vim: ts=8 sw=2 smarttab

#pragma once

#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace shardrec::recovery {

/**
 * TempFileRegistry
 *
 * Temp file names issued by one recovery.  Every name is prefix + original
 * name.  Once drained the registry refuses new names, so nothing issued
 * after finalization started can escape cleanup.
 */
class TempFileRegistry {
  const std::string prefix;
  mutable std::mutex lock;
  std::set<std::string> names;
  bool drained = false;

public:
  explicit TempFileRegistry(std::string prefix);

  const std::string &get_prefix() const { return prefix; }

  /// Registers and returns prefix + original, nullopt once drained
  std::optional<std::string> issue(const std::string &original);

  bool contains(const std::string &temp) const;

  /// temp must have been issued by this registry
  std::string original_name(const std::string &temp) const;

  /// Returns true iff temp was registered
  bool remove(const std::string &temp);

  std::vector<std::string> list() const;
  size_t size() const;
  bool empty() const { return size() == 0; }

  /// Refuses further names and hands back the remaining ones, allocation free
  std::set<std::string> drain() noexcept;
  bool is_drained() const;
};

}
