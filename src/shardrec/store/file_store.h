// -*- mode:C++; tab-width:8; c-basic-offset:2; indent-tabs-mode:t -*-
// vim: ts=8 sw=2 smarttab

#pragma once

#include <atomic>
#include <map>
#include <string>
#include <vector>

#include "common/ref_counted.h"
#include "shardrec/store/verifying_output.h"
#include "shardrec/types.h"

namespace shardrec::store {

/**
 * FileStore
 *
 * Persistent file namespace of one shard, shared by every recovery that
 * targets the shard.  Reference counted: the owner holds the initial
 * reference and anyone using the store while the owner might drop it must
 * hold one of their own.  on_close() runs once the last reference is
 * released.
 *
 * Primitives return 0 on success or a negative errno, -ENOENT when the
 * named file does not exist.
 */
class FileStore : public common::abstract_ref_counted_t {
  std::atomic<bool> closed{false};

protected:
  void close_internal() noexcept final;
  virtual void on_close() noexcept {}

public:
  FileStore() = default;
  ~FileStore() override = default;

  /// Creates (truncating) name and opens a verifying handle on it
  virtual int create_verifying_output(
    const std::string &name,
    const file_metadata_t &metadata,
    VerifyingOutput::ref *out) = 0;

  /// Atomically replaces to with from
  virtual int rename_file(const std::string &from, const std::string &to) = 0;

  virtual int remove_file(const std::string &name) = 0;

  virtual bool file_exists(const std::string &name) const = 0;

  virtual std::vector<std::string> list_files() const = 0;

  /// Persists name -> checksum for files with out of line checksums
  virtual int write_legacy_checksums(
    const std::map<std::string, uint32_t> &checksums) = 0;

  /// Removes name, ignoring a missing file and logging other errors
  void delete_quietly(const std::string &name) noexcept;

  bool is_closed() const {
    return closed.load(std::memory_order_acquire);
  }
};

}
