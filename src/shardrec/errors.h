// -*- mode:C++; tab-width:8; c-basic-offset:2; indent-tabs-mode:t -*-
// vim: ts=8 sw=2 smarttab

#pragma once

#include <cerrno>
#include <string>
#include <system_error>

#include "shardrec/types.h"

namespace shardrec {

/// Store or session failure surfaced to the caller, carries an errno
class recovery_error : public std::system_error {
public:
  recovery_error(int errnum, const std::string &what)
    : std::system_error(std::error_code(errnum, std::generic_category()), what) {}

  int get_errno() const {
    return code().value();
  }
};

/// Written content does not match the expected file metadata
class corrupt_file_error : public recovery_error {
public:
  explicit corrupt_file_error(const std::string &what)
    : recovery_error(EBADMSG, what) {}
};

/// A blocked recovery worker was woken up by cancellation
class recovery_interrupted_error : public recovery_error {
public:
  explicit recovery_interrupted_error(const std::string &what)
    : recovery_error(EINTR, what) {}
};

/**
 * recovery_failed_error
 *
 * Reason a whole recovery attempt failed, handed to the listener by
 * RecoverySession::fail().
 */
class recovery_failed_error : public recovery_error {
  shard_id_t shard;
  peer_t source;
  std::string reason;

public:
  recovery_failed_error(shard_id_t shard, peer_t source, std::string reason,
			int errnum = EIO)
    : recovery_error(
	errnum,
	fmt::format("{}: recovery failed from {}: {}", shard, source, reason)),
      shard(std::move(shard)), source(std::move(source)),
      reason(std::move(reason)) {}

  const shard_id_t &get_shard() const { return shard; }
  const peer_t &get_source() const { return source; }
  const std::string &get_reason() const { return reason; }
};

}
