// -*- mode:C++; tab-width:8; c-basic-offset:2; indent-tabs-mode:t -*-
// vim: ts=8 sw=2 smarttab

#include "shardrec/store/dir_store.h"

#include <algorithm>
#include <cerrno>
#include <chrono>
#include <cstring>
#include <filesystem>

#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

#include "common/log.h"

SET_SUBSYS(store);

namespace shardrec::store {

namespace {

int write_fully(int fd, const char *buf, size_t len)
{
  while (len > 0) {
    ssize_t r = ::write(fd, buf, len);
    if (r < 0) {
      if (errno == EINTR) {
	continue;
      }
      return -errno;
    }
    buf += r;
    len -= r;
  }
  return 0;
}

}

class DirStore::DirOutput final : public VerifyingOutput {
  int fd;

protected:
  int do_write(const char *buf, size_t len) final {
    return write_fully(fd, buf, len);
  }

  int do_sync() final {
    return ::fsync(fd) < 0 ? -errno : 0;
  }

  int do_close() final {
    int r = ::close(fd) < 0 ? -errno : 0;
    fd = -1;
    return r;
  }

public:
  DirOutput(int fd, std::string name, file_metadata_t metadata)
    : VerifyingOutput(std::move(name), std::move(metadata)), fd(fd) {}

  ~DirOutput() final {
    close();
  }
};

DirStore::DirStore(config_t config)
  : root(std::move(config.path))
{
  shardrec_assert(!root.empty());
}

std::string DirStore::path_of(const std::string &name) const
{
  shardrec_assertf(name.find('/') == std::string::npos,
		   "invalid file name {}", name);
  return root + "/" + name;
}

int DirStore::sync_dir() const
{
  int fd = ::open(root.c_str(), O_RDONLY | O_DIRECTORY | O_CLOEXEC);
  if (fd < 0) {
    return -errno;
  }
  int r = ::fsync(fd) < 0 ? -errno : 0;
  ::close(fd);
  return r;
}

int DirStore::mount()
{
  LOG_PREFIX(DirStore::mount);
  if (::mkdir(root.c_str(), 0755) < 0 && errno != EEXIST) {
    int r = -errno;
    ERROR("unable to create {}: {}", root, std::strerror(-r));
    return r;
  }
  struct stat st;
  if (::stat(root.c_str(), &st) < 0) {
    return -errno;
  }
  if (!S_ISDIR(st.st_mode)) {
    return -ENOTDIR;
  }
  DEBUG("mounted {}", root);
  return 0;
}

int DirStore::create_verifying_output(
  const std::string &name,
  const file_metadata_t &metadata,
  VerifyingOutput::ref *out)
{
  LOG_PREFIX(DirStore::create_verifying_output);
  int fd = ::open(path_of(name).c_str(),
		  O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, 0644);
  if (fd < 0) {
    int r = -errno;
    DEBUG("unable to create {}: {}", name, std::strerror(-r));
    return r;
  }
  *out = std::make_shared<DirOutput>(fd, name, metadata);
  return 0;
}

int DirStore::rename_file(const std::string &from, const std::string &to)
{
  if (::rename(path_of(from).c_str(), path_of(to).c_str()) < 0) {
    return -errno;
  }
  return sync_dir();
}

int DirStore::remove_file(const std::string &name)
{
  if (::unlink(path_of(name).c_str()) < 0) {
    return -errno;
  }
  return 0;
}

bool DirStore::file_exists(const std::string &name) const
{
  struct stat st;
  return ::stat(path_of(name).c_str(), &st) == 0;
}

std::vector<std::string> DirStore::list_files() const
{
  LOG_PREFIX(DirStore::list_files);
  std::vector<std::string> ret;
  std::error_code ec;
  for (const auto &entry : std::filesystem::directory_iterator(root, ec)) {
    if (entry.is_regular_file()) {
      ret.push_back(entry.path().filename().string());
    }
  }
  if (ec) {
    WARN("unable to list {}: {}", root, ec.message());
  }
  std::sort(ret.begin(), ret.end());
  return ret;
}

int DirStore::write_legacy_checksums(
  const std::map<std::string, uint32_t> &checksums)
{
  auto now = std::chrono::duration_cast<std::chrono::milliseconds>(
    std::chrono::system_clock::now().time_since_epoch()).count();
  std::string name = fmt::format("{}{}", legacy_checksums_prefix, now);
  std::string content;
  for (const auto &[file, crc] : checksums) {
    content += fmt::format("{} {:08x}\n", file, crc);
  }
  int fd = ::open(path_of(name).c_str(),
		  O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, 0644);
  if (fd < 0) {
    return -errno;
  }
  int r = write_fully(fd, content.data(), content.size());
  if (r == 0 && ::fsync(fd) < 0) {
    r = -errno;
  }
  ::close(fd);
  return r;
}

int DirStore::read_file(const std::string &name, std::string *out) const
{
  int fd = ::open(path_of(name).c_str(), O_RDONLY | O_CLOEXEC);
  if (fd < 0) {
    return -errno;
  }
  out->clear();
  char buf[64 << 10];
  while (true) {
    ssize_t r = ::read(fd, buf, sizeof(buf));
    if (r < 0) {
      if (errno == EINTR) {
	continue;
      }
      int err = -errno;
      ::close(fd);
      return err;
    }
    if (r == 0) {
      break;
    }
    out->append(buf, r);
  }
  ::close(fd);
  return 0;
}

}
