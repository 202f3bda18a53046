// -*- mode:C++; tab-width:8; c-basic-offset:2; indent-tabs-mode:t -*-
// vim: ts=8 sw=2 smarttab

#include "shardrec/store/mem_store.h"

#include <cerrno>

#include "common/log.h"

SET_SUBSYS(store);

namespace shardrec::store {

class MemStore::MemOutput final : public VerifyingOutput {
  MemStore &store;

protected:
  int do_write(const char *buf, size_t len) final {
    return store.append(get_name(), buf, len);
  }

  int do_sync() final {
    return 0;
  }

  int do_close() final {
    store.output_closed();
    return 0;
  }

public:
  MemOutput(MemStore &store, std::string name, file_metadata_t metadata)
    : VerifyingOutput(std::move(name), std::move(metadata)), store(store) {}

  ~MemOutput() final {
    close();
  }
};

MemStore::~MemStore()
{
  shardrec_assertf(open_outputs == 0, "{} outputs still open", open_outputs);
}

std::optional<int> MemStore::get_injected(
  op_t op, const std::string &name) const
{
  auto iter = injected.find(std::make_pair(op, name));
  if (iter == injected.end()) {
    return std::nullopt;
  }
  return iter->second;
}

int MemStore::append(const std::string &name, const char *buf, size_t len)
{
  std::lock_guard l(lock);
  if (auto r = get_injected(op_t::write, name); r) {
    return *r;
  }
  auto iter = files.find(name);
  if (iter == files.end()) {
    return -ENOENT;
  }
  iter->second.append(buf, len);
  return 0;
}

void MemStore::output_closed()
{
  std::lock_guard l(lock);
  shardrec_assert(open_outputs > 0);
  --open_outputs;
}

void MemStore::on_close() noexcept
{
  std::lock_guard l(lock);
  on_close_called = true;
}

int MemStore::create_verifying_output(
  const std::string &name,
  const file_metadata_t &metadata,
  VerifyingOutput::ref *out)
{
  LOG_PREFIX(MemStore::create_verifying_output);
  std::lock_guard l(lock);
  if (auto r = get_injected(op_t::create, name); r) {
    DEBUG("injected error {} creating {}", *r, name);
    return *r;
  }
  files[name].clear();
  ++open_outputs;
  *out = std::make_shared<MemOutput>(*this, name, metadata);
  return 0;
}

int MemStore::rename_file(const std::string &from, const std::string &to)
{
  std::lock_guard l(lock);
  if (auto r = get_injected(op_t::rename, from); r) {
    return *r;
  }
  auto iter = files.find(from);
  if (iter == files.end()) {
    return -ENOENT;
  }
  files[to] = std::move(iter->second);
  files.erase(from);
  ++renames;
  return 0;
}

int MemStore::remove_file(const std::string &name)
{
  std::lock_guard l(lock);
  ++removes;
  if (auto r = get_injected(op_t::remove, name); r) {
    return *r;
  }
  return files.erase(name) ? 0 : -ENOENT;
}

bool MemStore::file_exists(const std::string &name) const
{
  std::lock_guard l(lock);
  return files.contains(name);
}

std::vector<std::string> MemStore::list_files() const
{
  std::lock_guard l(lock);
  std::vector<std::string> ret;
  ret.reserve(files.size());
  for (const auto &[name, _] : files) {
    ret.push_back(name);
  }
  return ret;
}

int MemStore::write_legacy_checksums(
  const std::map<std::string, uint32_t> &checksums)
{
  std::lock_guard l(lock);
  for (const auto &[name, crc] : checksums) {
    legacy_checksums[name] = crc;
  }
  return 0;
}

void MemStore::inject_error(op_t op, const std::string &name, int r)
{
  shardrec_assert(r < 0);
  std::lock_guard l(lock);
  injected[std::make_pair(op, name)] = r;
}

void MemStore::clear_injected_errors()
{
  std::lock_guard l(lock);
  injected.clear();
}

void MemStore::put_file(const std::string &name, std::string content)
{
  std::lock_guard l(lock);
  files[name] = std::move(content);
}

std::optional<std::string> MemStore::get_file(const std::string &name) const
{
  std::lock_guard l(lock);
  auto iter = files.find(name);
  if (iter == files.end()) {
    return std::nullopt;
  }
  return iter->second;
}

std::map<std::string, uint32_t> MemStore::get_legacy_checksums() const
{
  std::lock_guard l(lock);
  return legacy_checksums;
}

unsigned MemStore::get_num_renames() const
{
  std::lock_guard l(lock);
  return renames;
}

unsigned MemStore::get_num_removes() const
{
  std::lock_guard l(lock);
  return removes;
}

unsigned MemStore::get_num_open_outputs() const
{
  std::lock_guard l(lock);
  return open_outputs;
}

bool MemStore::was_closed() const
{
  std::lock_guard l(lock);
  return on_close_called;
}

}
