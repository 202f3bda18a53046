// -*- mode:C++; tab-width:8; c-basic-offset:2; indent-tabs-mode:t -*-
// vim: ts=8 sw=2 smarttab

#pragma once

#include <map>
#include <mutex>
#include <optional>
#include <string>

#include "shardrec/store/file_store.h"

namespace shardrec::store {

/**
 * MemStore
 *
 * FileStore keeping file contents in memory.  Errors may be injected per
 * operation and file name to exercise failure paths.
 */
class MemStore final : public FileStore {
public:
  enum class op_t {
    create,
    write,
    rename,
    remove,
  };

private:
  class MemOutput;

  mutable std::mutex lock;
  std::map<std::string, std::string> files;
  std::map<std::string, uint32_t> legacy_checksums;
  std::map<std::pair<op_t, std::string>, int> injected;
  unsigned renames = 0;
  unsigned removes = 0;
  unsigned open_outputs = 0;
  bool on_close_called = false;

  std::optional<int> get_injected(op_t op, const std::string &name) const;
  int append(const std::string &name, const char *buf, size_t len);
  void output_closed();

protected:
  void on_close() noexcept final;

public:
  MemStore() = default;
  ~MemStore() final;

  int create_verifying_output(
    const std::string &name,
    const file_metadata_t &metadata,
    VerifyingOutput::ref *out) final;
  int rename_file(const std::string &from, const std::string &to) final;
  int remove_file(const std::string &name) final;
  bool file_exists(const std::string &name) const final;
  std::vector<std::string> list_files() const final;
  int write_legacy_checksums(
    const std::map<std::string, uint32_t> &checksums) final;

  /// Makes every subsequent op on name return r (negative errno)
  void inject_error(op_t op, const std::string &name, int r);
  void clear_injected_errors();

  void put_file(const std::string &name, std::string content);
  std::optional<std::string> get_file(const std::string &name) const;
  std::map<std::string, uint32_t> get_legacy_checksums() const;

  unsigned get_num_renames() const;
  unsigned get_num_removes() const;
  unsigned get_num_open_outputs() const;
  bool was_closed() const;
};

}
