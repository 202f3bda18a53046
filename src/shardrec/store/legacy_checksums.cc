// -*- mode:C++; tab-width:8; c-basic-offset:2; indent-tabs-mode:t -*-
// vim: ts=8 sw=2 smarttab

#include "shardrec/store/legacy_checksums.h"

#include "common/log.h"
#include "shardrec/store/file_store.h"

SET_SUBSYS(store);

namespace shardrec::store {

bool LegacyChecksums::add(const file_metadata_t &metadata)
{
  if (!metadata.legacy) {
    return false;
  }
  std::lock_guard l(lock);
  checksums[metadata.name] = metadata.checksum;
  return true;
}

int LegacyChecksums::write(FileStore &store)
{
  LOG_PREFIX(LegacyChecksums::write);
  std::map<std::string, uint32_t> to_write;
  {
    std::lock_guard l(lock);
    if (checksums.empty()) {
      return 0;
    }
    to_write = checksums;
  }
  DEBUG("writing {} legacy checksums", to_write.size());
  return store.write_legacy_checksums(to_write);
}

void LegacyChecksums::clear()
{
  std::lock_guard l(lock);
  checksums.clear();
}

size_t LegacyChecksums::size() const
{
  std::lock_guard l(lock);
  return checksums.size();
}

}
