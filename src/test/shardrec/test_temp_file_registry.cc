// -*- mode:C++; tab-width:8; c-basic-offset:2; indent-tabs-mode:t -*-
// vim: ts=8 sw=2 smarttab

#include <set>

#include "gtest/gtest.h"

#include "shardrec/recovery/output_registry.h"
#include "shardrec/recovery/temp_file_registry.h"
#include "shardrec/store/mem_store.h"
#include "test/shardrec/recovery_test_helpers.h"

using namespace shardrec;
using namespace shardrec::recovery;

TEST(temp_file_registry, issue_maps_back_to_original)
{
  TempFileRegistry registry("recovery.1700000000000.7.");
  auto temp = registry.issue("segment1");
  ASSERT_TRUE(temp);
  EXPECT_EQ("recovery.1700000000000.7.segment1", *temp);
  EXPECT_TRUE(temp->starts_with(registry.get_prefix()));
  EXPECT_TRUE(registry.contains(*temp));
  EXPECT_FALSE(registry.contains("segment1"));
  EXPECT_EQ("segment1", registry.original_name(*temp));
}

TEST(temp_file_registry, remove_and_list)
{
  TempFileRegistry registry("p.");
  registry.issue("a");
  registry.issue("b");
  registry.issue("a");
  EXPECT_EQ(2u, registry.size());
  EXPECT_EQ((std::vector<std::string>{"p.a", "p.b"}), registry.list());
  EXPECT_TRUE(registry.remove("p.a"));
  EXPECT_FALSE(registry.remove("p.a"));
  EXPECT_EQ(1u, registry.size());
}

TEST(temp_file_registry, drained_registry_refuses_names)
{
  TempFileRegistry registry("p.");
  registry.issue("a");
  auto drained = registry.drain();
  EXPECT_EQ(std::set<std::string>{"p.a"}, drained);
  EXPECT_TRUE(registry.empty());
  EXPECT_TRUE(registry.is_drained());
  EXPECT_FALSE(registry.issue("b"));
  EXPECT_TRUE(registry.drain().empty());
}

TEST(temp_file_registry_death, original_name_of_unknown_file_aborts)
{
  GTEST_FLAG_SET(death_test_style, "threadsafe");
  TempFileRegistry registry("p.");
  EXPECT_DEATH(registry.original_name("p.never_issued"),
	       "is not a temp file of this recovery");
}

TEST(output_registry, put_get_remove)
{
  store::MemStore store;
  OutputRegistry registry;
  auto md = shardrec::test::metadata_for("a", "xyz");

  store::VerifyingOutput::ref first, second, replaced;
  ASSERT_EQ(0, store.create_verifying_output("t.a", md, &first));
  ASSERT_EQ(0, store.create_verifying_output("t.a2", md, &second));
  auto *first_raw = first.get();
  auto *second_raw = second.get();

  ASSERT_TRUE(registry.put("a", std::move(first), &replaced));
  EXPECT_FALSE(replaced);
  EXPECT_EQ(first_raw, registry.get("a").get());

  ASSERT_TRUE(registry.put("a", std::move(second), &replaced));
  EXPECT_EQ(first_raw, replaced.get());
  EXPECT_EQ(second_raw, registry.get("a").get());
  EXPECT_EQ(1u, registry.size());

  auto removed = registry.remove("a");
  EXPECT_EQ(second_raw, removed.get());
  EXPECT_EQ(nullptr, registry.get("a"));
  EXPECT_EQ(nullptr, registry.remove("a"));
}

TEST(output_registry, drained_registry_refuses_outputs)
{
  store::MemStore store;
  OutputRegistry registry;
  auto md = shardrec::test::metadata_for("a", "xyz");

  store::VerifyingOutput::ref out, late, replaced;
  ASSERT_EQ(0, store.create_verifying_output("t.a", md, &out));
  ASSERT_TRUE(registry.put("a", std::move(out), &replaced));
  auto drained = registry.drain();
  ASSERT_EQ(1u, drained.size());
  EXPECT_EQ(0u, registry.size());

  ASSERT_EQ(0, store.create_verifying_output("t.b", md, &late));
  EXPECT_FALSE(registry.put("b", std::move(late), &replaced));
  EXPECT_TRUE(late);
}
