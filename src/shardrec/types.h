// -*- mode:C++; tab-width:8; c-basic-offset:2; indent-tabs-mode:t -*-
// vim: ts=8 sw=2 smarttab

#pragma once

#include <cstdint>
#include <iostream>
#include <string>

#include <fmt/format.h>
#include <fmt/ostream.h>

namespace shardrec {

/// Identifies one shard of an index
struct shard_id_t {
  std::string index;
  int shard = -1;

  shard_id_t() = default;
  shard_id_t(std::string index, int shard)
    : index(std::move(index)), shard(shard) {}

  auto operator<=>(const shard_id_t &) const = default;
  bool operator==(const shard_id_t &) const = default;
};

inline std::ostream &operator<<(std::ostream &out, const shard_id_t &s) {
  return out << "[" << s.index << "][" << s.shard << "]";
}

/// Node a recovery pulls its files from
struct peer_t {
  std::string name;
  std::string addr;

  bool operator==(const peer_t &) const = default;
};

inline std::ostream &operator<<(std::ostream &out, const peer_t &p) {
  out << "{" << p.name;
  if (!p.addr.empty()) {
    out << "}{" << p.addr;
  }
  return out << "}";
}

/**
 * file_metadata_t
 *
 * Expected shape of a file being recovered.  checksum is the crc32 of the
 * full content.  legacy files carry their checksum out of line and have it
 * persisted separately once the recovery completes.
 */
struct file_metadata_t {
  std::string name;
  uint64_t length = 0;
  uint32_t checksum = 0;
  bool legacy = false;

  file_metadata_t() = default;
  file_metadata_t(std::string name, uint64_t length, uint32_t checksum,
		  bool legacy = false)
    : name(std::move(name)), length(length), checksum(checksum),
      legacy(legacy) {}
};

inline std::ostream &operator<<(std::ostream &out, const file_metadata_t &m) {
  return out << "name [" << m.name << "], length [" << m.length
	     << "], checksum [" << std::hex << m.checksum << std::dec << "]"
	     << (m.legacy ? ", legacy" : "");
}

}

#if FMT_VERSION >= 90000
template <> struct fmt::formatter<shardrec::shard_id_t> : fmt::ostream_formatter {};
template <> struct fmt::formatter<shardrec::peer_t> : fmt::ostream_formatter {};
template <> struct fmt::formatter<shardrec::file_metadata_t> : fmt::ostream_formatter {};
#endif
