// -*- mode:C++; tab-width:8; c-basic-offset:2; indent-tabs-mode:t -*-
// vim: ts=8 sw=2 smarttab

#pragma once

#include <string>

#include <boost/program_options/options_description.hpp>
#include <boost/program_options/value_semantic.hpp>

#include "shardrec/store/file_store.h"

namespace shardrec::store {

/**
 * DirStore
 *
 * FileStore over a flat posix directory.  Outputs are fsynced before
 * close and renames are followed by an fsync of the directory.
 */
class DirStore final : public FileStore {
public:
  struct config_t {
    std::string path;
    std::string option_name = "store-path";

    void populate_options(
      boost::program_options::options_description &desc)
    {
      desc.add_options()
	(option_name.c_str(),
	 boost::program_options::value<std::string>()
	 ->required()
	 ->notifier([this](auto s) {
	   path = s;
	 }),
	 "Directory holding the shard files"
	);
    }
  };

  static constexpr const char *legacy_checksums_prefix = "_checksums-";

private:
  class DirOutput;
  const std::string root;

  std::string path_of(const std::string &name) const;
  int sync_dir() const;

public:
  explicit DirStore(config_t config);
  ~DirStore() final = default;

  /// Creates the directory if needed
  int mount();

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

  /// Reads a whole file into out
  int read_file(const std::string &name, std::string *out) const;
  const std::string &get_root() const { return root; }
};

}
