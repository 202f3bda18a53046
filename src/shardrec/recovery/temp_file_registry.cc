// -*- mode:C++; tab-width:8; c-basic-offset:2; indent-tabs-mode:t -*-
// vim: ts=8 sw=2 smarttab

#include "shardrec/recovery/temp_file_registry.h"

#include "include/shardrec_assert.h"

namespace shardrec::recovery {

TempFileRegistry::TempFileRegistry(std::string prefix)
  : prefix(std::move(prefix))
{
  shardrec_assert(!this->prefix.empty());
}

std::optional<std::string> TempFileRegistry::issue(const std::string &original)
{
  shardrec_assert(!original.empty());
  std::string temp = prefix + original;
  std::lock_guard l(lock);
  if (drained) {
    return std::nullopt;
  }
  names.insert(temp);
  return temp;
}

bool TempFileRegistry::contains(const std::string &temp) const
{
  std::lock_guard l(lock);
  return names.contains(temp);
}

std::string TempFileRegistry::original_name(const std::string &temp) const
{
  shardrec_assertf(contains(temp), "{} is not a temp file of this recovery",
		   temp);
  shardrec_assert(temp.starts_with(prefix));
  return temp.substr(prefix.size());
}

bool TempFileRegistry::remove(const std::string &temp)
{
  std::lock_guard l(lock);
  return names.erase(temp) > 0;
}

std::vector<std::string> TempFileRegistry::list() const
{
  std::lock_guard l(lock);
  return {names.begin(), names.end()};
}

size_t TempFileRegistry::size() const
{
  std::lock_guard l(lock);
  return names.size();
}

std::set<std::string> TempFileRegistry::drain() noexcept
{
  std::lock_guard l(lock);
  drained = true;
  std::set<std::string> ret;
  ret.swap(names);
  return ret;
}

bool TempFileRegistry::is_drained() const
{
  std::lock_guard l(lock);
  return drained;
}

}
