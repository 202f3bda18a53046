// -*- mode:C++; tab-width:8; c-basic-offset:2; indent-tabs-mode:t -*-
// vim: ts=8 sw=2 smarttab

#include "shardrec/recovery/output_registry.h"

namespace shardrec::recovery {

bool OutputRegistry::put(
  const std::string &key, output_ref &&out, output_ref *replaced)
{
  std::lock_guard l(lock);
  if (drained) {
    return false;
  }
  auto &slot = outputs[key];
  *replaced = std::move(slot);
  slot = std::move(out);
  return true;
}

OutputRegistry::output_ref OutputRegistry::get(const std::string &key) const
{
  std::lock_guard l(lock);
  auto iter = outputs.find(key);
  return iter == outputs.end() ? nullptr : iter->second;
}

OutputRegistry::output_ref OutputRegistry::remove(const std::string &key)
{
  std::lock_guard l(lock);
  auto iter = outputs.find(key);
  if (iter == outputs.end()) {
    return nullptr;
  }
  auto ret = std::move(iter->second);
  outputs.erase(iter);
  return ret;
}

size_t OutputRegistry::size() const
{
  std::lock_guard l(lock);
  return outputs.size();
}

std::map<std::string, OutputRegistry::output_ref> OutputRegistry::drain() noexcept
{
  std::lock_guard l(lock);
  drained = true;
  std::map<std::string, output_ref> ret;
  ret.swap(outputs);
  return ret;
}

}
