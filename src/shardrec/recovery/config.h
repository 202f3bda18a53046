// -*- mode:C++; tab-width:8; c-basic-offset:2; indent-tabs-mode:t -*-
// vim: ts=8 sw=2 smarttab

#pragma once

#include <string>

#include <boost/program_options/options_description.hpp>
#include <boost/program_options/value_semantic.hpp>

namespace shardrec::recovery {

struct recovery_config_t {
  /// Leading part of every temp file name, followed by start time and id
  std::string temp_prefix = "recovery.";

  void populate_options(
    boost::program_options::options_description &desc)
  {
    desc.add_options()
      ("temp-prefix",
       boost::program_options::value<std::string>()
       ->default_value(temp_prefix)
       ->notifier([this](auto s) {
	 temp_prefix = s;
       }),
       "Prefix of temporary files written during recovery"
      );
  }
};

}
