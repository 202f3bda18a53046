// -*- mode:C++; tab-width:8; c-basic-offset:2; indent-tabs-mode:t -*-
// vim: ts=8 sw=2 smarttab

#pragma once

#include <fmt/format.h>
#include <seastar/util/log.hh>

enum shardrec_subsys_t : unsigned {
  shardrec_subsys_recovery = 0,
  shardrec_subsys_store,
  shardrec_subsys_test,
  shardrec_subsys_max
};

namespace shardrec {

seastar::logger &get_logger(unsigned subsys);
const char *get_subsys_name(unsigned subsys);

/// Applies level to every registered logger
void set_log_level(seastar::log_level level);

}

#define SET_SUBSYS(subname_) \
  static constexpr auto SOURCE_SUBSYS = shardrec_subsys_##subname_
#define LOCAL_LOGGER shardrec::get_logger(SOURCE_SUBSYS)
#define LOGGER(subname_) shardrec::get_logger(shardrec_subsys_##subname_)
#define LOG_PREFIX(x) constexpr auto FNAME = #x

#define LOG(level_, MSG, ...) \
  LOCAL_LOGGER.log(level_, "{}: " MSG, FNAME , ##__VA_ARGS__)
#define SUBLOG(subname_, level_, MSG, ...) \
  LOGGER(subname_).log(level_, "{}: " MSG, FNAME , ##__VA_ARGS__)

#define TRACE(...) LOG(seastar::log_level::trace, __VA_ARGS__)
#define SUBTRACE(subname_, ...) SUBLOG(subname_, seastar::log_level::trace, __VA_ARGS__)

#define DEBUG(...) LOG(seastar::log_level::debug, __VA_ARGS__)
#define SUBDEBUG(subname_, ...) SUBLOG(subname_, seastar::log_level::debug, __VA_ARGS__)

#define INFO(...) LOG(seastar::log_level::info, __VA_ARGS__)
#define SUBINFO(subname_, ...) SUBLOG(subname_, seastar::log_level::info, __VA_ARGS__)

#define WARN(...) LOG(seastar::log_level::warn, __VA_ARGS__)
#define SUBWARN(subname_, ...) SUBLOG(subname_, seastar::log_level::warn, __VA_ARGS__)

#define ERROR(...) LOG(seastar::log_level::error, __VA_ARGS__)
#define SUBERROR(subname_, ...) SUBLOG(subname_, seastar::log_level::error, __VA_ARGS__)

// *DPP variants print a "debug prefix provider" (usually the owning
// session) ahead of the message
#define LOGDPP(level_, MSG, dpp, ...) \
  LOG(level_, "{} " MSG, dpp , ##__VA_ARGS__)
#define TRACEDPP(MSG, dpp, ...) LOGDPP(seastar::log_level::trace, MSG, dpp , ##__VA_ARGS__)
#define DEBUGDPP(MSG, dpp, ...) LOGDPP(seastar::log_level::debug, MSG, dpp , ##__VA_ARGS__)
#define INFODPP(MSG, dpp, ...) LOGDPP(seastar::log_level::info, MSG, dpp , ##__VA_ARGS__)
#define WARNDPP(MSG, dpp, ...) LOGDPP(seastar::log_level::warn, MSG, dpp , ##__VA_ARGS__)
#define ERRORDPP(MSG, dpp, ...) LOGDPP(seastar::log_level::error, MSG, dpp , ##__VA_ARGS__)
