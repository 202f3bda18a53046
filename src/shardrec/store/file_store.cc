// -*- mode:C++; tab-width:8; c-basic-offset:2; indent-tabs-mode:t -*-
// vim: ts=8 sw=2 smarttab

#include "shardrec/store/file_store.h"

#include <cerrno>
#include <cstring>

#include "common/log.h"

SET_SUBSYS(store);

namespace shardrec::store {

void FileStore::close_internal() noexcept
{
  LOG_PREFIX(FileStore::close_internal);
  DEBUG("last reference released, closing store {}", (void*)this);
  closed.store(true, std::memory_order_release);
  on_close();
}

void FileStore::delete_quietly(const std::string &name) noexcept
{
  LOG_PREFIX(FileStore::delete_quietly);
  int r = remove_file(name);
  if (r < 0 && r != -ENOENT) {
    DEBUG("failed to delete file [{}]: {}", name, std::strerror(-r));
  }
}

}
