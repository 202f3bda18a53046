// -*- mode:C++; tab-width:8; c-basic-offset:2; indent-tabs-mode:t -*-
// vim: ts=8 sw=2 smarttab

#pragma once

#include <map>
#include <mutex>
#include <string>

#include "shardrec/types.h"

namespace shardrec::store {

class FileStore;

/**
 * LegacyChecksums
 *
 * Checksums of files whose metadata is flagged legacy, gathered while a
 * recovery receives them and written out once all files are committed.
 */
class LegacyChecksums {
  mutable std::mutex lock;
  std::map<std::string, uint32_t> checksums;

public:
  /// Records metadata.checksum if metadata is legacy, returns true if recorded
  bool add(const file_metadata_t &metadata);

  /// Persists the gathered checksums, no-op if there are none
  int write(FileStore &store);

  void clear();
  size_t size() const;
  bool empty() const { return size() == 0; }
};

}
