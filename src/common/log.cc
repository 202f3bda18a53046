// -*- mode:C++; tab-width:8; c-basic-offset:2; indent-tabs-mode:t -*-
// vim: ts=8 sw=2 smarttab

#include "common/log.h"

#include <array>

#include "include/shardrec_assert.h"

namespace {

const std::array<const char*, shardrec_subsys_max> subsys_names = {
  "recovery",
  "store",
  "test",
};

std::array<seastar::logger, shardrec_subsys_max> &loggers()
{
  static std::array<seastar::logger, shardrec_subsys_max> instances = {
    seastar::logger(subsys_names[shardrec_subsys_recovery]),
    seastar::logger(subsys_names[shardrec_subsys_store]),
    seastar::logger(subsys_names[shardrec_subsys_test]),
  };
  return instances;
}

}

namespace shardrec {

seastar::logger &get_logger(unsigned subsys)
{
  shardrec_assert(subsys < shardrec_subsys_max);
  return loggers()[subsys];
}

const char *get_subsys_name(unsigned subsys)
{
  shardrec_assert(subsys < shardrec_subsys_max);
  return subsys_names[subsys];
}

void set_log_level(seastar::log_level level)
{
  for (auto &l : loggers()) {
    l.set_level(level);
  }
}

}
