// -*- mode:C++; tab-width:8; c-basic-offset:2; indent-tabs-mode:t -*-
// vim: ts=8 sw=2 smarttab

#include "shardrec/store/verifying_output.h"

#include "common/log.h"
#include "shardrec/errors.h"

SET_SUBSYS(store);

namespace shardrec::store {

void VerifyingOutput::write(const char *buf, size_t len)
{
  LOG_PREFIX(VerifyingOutput::write);
  if (closed) {
    throw recovery_error(EBADF, fmt::format("write to closed output {}", name));
  }
  if (written + len > metadata.length) {
    throw corrupt_file_error(
      fmt::format("{}: write of {} bytes at {} exceeds expected length {}",
		  name, len, written, metadata.length));
  }
  int r = do_write(buf, len);
  if (r < 0) {
    throw recovery_error(-r, fmt::format("failed to write {}", name));
  }
  crc.process_bytes(buf, len);
  written += len;
  TRACE("{} wrote {}~{}", name, written - len, len);
}

void VerifyingOutput::verify_and_close()
{
  LOG_PREFIX(VerifyingOutput::verify_and_close);
  if (closed) {
    throw recovery_error(EBADF, fmt::format("output {} already closed", name));
  }
  int r = do_sync();
  int cr = close();
  if (r < 0) {
    throw recovery_error(-r, fmt::format("failed to sync {}", name));
  }
  if (cr < 0) {
    throw recovery_error(-cr, fmt::format("failed to close {}", name));
  }
  if (written != metadata.length) {
    throw corrupt_file_error(
      fmt::format("{}: expected length {} but got {}",
		  name, metadata.length, written));
  }
  if (crc.checksum() != metadata.checksum) {
    throw corrupt_file_error(
      fmt::format("{}: checksum mismatch, expected {:x} got {:x}",
		  name, metadata.checksum, crc.checksum()));
  }
  DEBUG("verified {} ({})", name, metadata);
}

int VerifyingOutput::close()
{
  if (closed) {
    return 0;
  }
  closed = true;
  return do_close();
}

}
