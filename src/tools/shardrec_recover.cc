// -*- mode:C++; tab-width:8; c-basic-offset:2; indent-tabs-mode:t -*-
// vim: ts=8 sw=2 smarttab

/**
 * shardrec-recover
 *
 * Recovers the files of a shard from a local source directory into the
 * shard's store directory through a recovery session: every file is
 * written under a temp name, verified against the length and crc32 of
 * its source, then all are committed over the originals.
 *
 * Example usage:
 *
 *  $ ./bin/shardrec-recover --source-dir /data/peer/idx/0 \
 *      --target-dir /data/local/idx/0 --index idx --shard 0 --debug true
 */

#include <algorithm>
#include <cstring>
#include <iostream>

#include <boost/crc.hpp>
#include <boost/program_options/parsers.hpp>
#include <boost/program_options/variables_map.hpp>

#include "common/log.h"
#include "shardrec/recovery/config.h"
#include "shardrec/recovery/recovery_session.h"
#include "shardrec/store/dir_store.h"

namespace po = boost::program_options;

using namespace shardrec;
using namespace shardrec::recovery;

SET_SUBSYS(recovery);

namespace {

constexpr size_t chunk_size = 512 << 10;

class ToolListener final : public RecoveryListener {
public:
  bool done = false;
  std::string failure;

  void on_recovery_done(RecoveryState &state) final {
    done = true;
    LOGGER(recovery).info("recovery done: {}", state);
  }

  void on_recovery_failure(
    RecoveryState &state,
    const recovery_failed_error &e,
    bool) final {
    failure = e.what();
    LOGGER(recovery).error("recovery failed: {}: {}", state, e.what());
  }
};

file_metadata_t read_metadata(
  store::DirStore &source, const std::string &name, bool legacy,
  std::string *content)
{
  if (int r = source.read_file(name, content); r < 0) {
    throw recovery_error(-r, fmt::format("unable to read source file {}", name));
  }
  boost::crc_32_type crc;
  crc.process_bytes(content->data(), content->size());
  return file_metadata_t(name, content->size(), crc.checksum(), legacy);
}

void recover_files(
  RecoverySession &session, store::DirStore &source, bool legacy)
{
  LOG_PREFIX(recover_files);
  auto worker = RecoveryWaiter::create();
  session.set_stage(RecoveryState::stage_t::index);
  for (const auto &name : source.list_files()) {
    std::string content;
    auto metadata = read_metadata(source, name, legacy, &content);
    auto out = session.open_and_register_output(name, name, metadata);
    {
      RecoverySession::blocking_section_t section(session, worker);
      for (size_t off = 0; off < content.size(); off += chunk_size) {
	worker->check_interrupted();
	out->write(content.data() + off,
		  std::min(chunk_size, content.size() - off));
      }
    }
    session.complete_output(name);
    DEBUGDPP("received {}", session, metadata);
  }
  session.set_stage(RecoveryState::stage_t::verify_index);
  session.commit_all_temp_files();
  session.write_legacy_checksums();
  session.set_stage(RecoveryState::stage_t::finalize);
}

}

int main(int argc, char** argv)
{
  po::options_description desc{"Allowed options"};
  bool debug = false;
  bool legacy = false;
  std::string index;
  int shard = 0;
  std::string peer;
  desc.add_options()
    ("help,h", "show help message")
    ("debug", po::value<bool>(&debug)->default_value(false),
     "enable debugging")
    ("index", po::value<std::string>(&index)->required(),
     "index the shard belongs to")
    ("shard", po::value<int>(&shard)->default_value(0),
     "shard number")
    ("peer", po::value<std::string>(&peer)->default_value("local"),
     "name of the source node")
    ("legacy-checksums", po::value<bool>(&legacy)->default_value(false),
     "record checksums of recovered files out of line");

  po::options_description source_options{"Source Options"};
  store::DirStore::config_t source_config;
  source_config.option_name = "source-dir";
  source_config.populate_options(source_options);
  desc.add(source_options);

  po::options_description target_options{"Target Options"};
  store::DirStore::config_t target_config;
  target_config.option_name = "target-dir";
  target_config.populate_options(target_options);
  desc.add(target_options);

  po::options_description recovery_options{"Recovery Options"};
  recovery_config_t recovery_config;
  recovery_config.populate_options(recovery_options);
  desc.add(recovery_options);

  po::variables_map vm;
  try {
    po::store(po::parse_command_line(argc, argv, desc), vm);
    if (vm.count("help")) {
      std::cout << desc << std::endl;
      return 0;
    }
    po::notify(vm);
  } catch(const po::error& e) {
    std::cerr << "error: " << e.what() << std::endl;
    return 1;
  }

  if (debug) {
    shardrec::set_log_level(seastar::log_level::debug);
  }

  auto source = std::make_unique<store::DirStore>(source_config);
  auto target = std::make_unique<store::DirStore>(target_config);
  for (auto *s : {source.get(), target.get()}) {
    if (int r = s->mount(); r < 0) {
      std::cerr << "error: unable to mount " << s->get_root() << ": "
		<< std::strerror(-r) << std::endl;
      return 1;
    }
  }

  auto listener = std::make_shared<ToolListener>();
  shard_id_t shard_id(index, shard);
  auto session = RecoverySession::begin(
    shard_id, peer_t{peer, source->get_root()},
    std::make_shared<RecoveryState>(shard_id), listener, *target,
    recovery_config);
  try {
    recover_files(*session, *source, legacy);
    session->set_stage(RecoveryState::stage_t::done);
    session->mark_as_done();
  } catch (const recovery_error &e) {
    session->fail(
      recovery_failed_error(shard_id, session->get_source(), e.what(),
			    e.get_errno()),
      false);
  }

  target->dec_ref();
  source->dec_ref();
  return listener->done ? 0 : 1;
}
