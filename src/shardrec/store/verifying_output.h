// -*- mode:C++; tab-width:8; c-basic-offset:2; indent-tabs-mode:t -*-
// vim: ts=8 sw=2 smarttab

#pragma once

#include <cstdint>
#include <memory>
#include <string>

#include <boost/crc.hpp>

#include "shardrec/types.h"

namespace shardrec::store {

/**
 * VerifyingOutput
 *
 * Write handle for one file in a FileStore.  Tracks length and crc32 of
 * everything written and checks both against the expected metadata in
 * verify_and_close().  Writes beyond the expected length are rejected
 * immediately.
 *
 * Handles are shared: a replaced or removed output stays valid for its
 * holders and rejects writes once closed.  Not thread safe, a single
 * worker writes a given file.
 */
class VerifyingOutput {
  const std::string name;
  const file_metadata_t metadata;
  boost::crc_32_type crc;
  uint64_t written = 0;
  bool closed = false;

protected:
  virtual int do_write(const char *buf, size_t len) = 0;
  virtual int do_sync() = 0;
  virtual int do_close() = 0;

public:
  using ref = std::shared_ptr<VerifyingOutput>;

  VerifyingOutput(std::string name, file_metadata_t metadata)
    : name(std::move(name)), metadata(std::move(metadata)) {}
  VerifyingOutput(const VerifyingOutput &) = delete;
  VerifyingOutput &operator=(const VerifyingOutput &) = delete;
  virtual ~VerifyingOutput() = default;

  /// Name of the file in the store (the temp name during recovery)
  const std::string &get_name() const { return name; }
  const file_metadata_t &get_metadata() const { return metadata; }
  uint64_t get_written() const { return written; }
  uint32_t get_checksum() const { return crc.checksum(); }
  bool is_closed() const { return closed; }

  /// Throws corrupt_file_error past expected length, recovery_error on io
  void write(const char *buf, size_t len);
  void write(const std::string &data) {
    write(data.data(), data.size());
  }

  /**
   * Syncs and closes, then checks length and checksum.  The handle is
   * closed even when verification throws.
   */
  void verify_and_close();

  /// Closes without verifying, returns <0 on error.  Idempotent.
  int close();
};

}
