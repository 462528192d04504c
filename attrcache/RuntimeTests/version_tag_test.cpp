// Copyright (c) Meta Platforms, Inc. and affiliates.

#include <gtest/gtest.h>

#include "attrcache/Jit/version_tag.h"
#include "attrcache/RuntimeTests/fixtures.h"

#include <set>

using namespace attrcache;

class VersionTagTest : public AttrCacheTest {};

TEST_F(VersionTagTest, NewTypesGetDistinctValidTags) {
  auto a = model_.makeType("A");
  auto b = model_.makeType("B");
  EXPECT_NE(a->versionTag(), 0);
  EXPECT_NE(b->versionTag(), 0);
  EXPECT_NE(a->versionTag(), b->versionTag());
  EXPECT_EQ(registry_.currentTag(*a), a->versionTag());
  EXPECT_FALSE(registry_.isPinned(*a));
}

TEST_F(VersionTagTest, GenerationsAreNeverReused) {
  std::set<uint64_t> seen;
  uint64_t last = 0;
  for (int i = 0; i < 50; i++) {
    // Each type dies at the end of the iteration.
    auto type = model_.makeType(fmt::format("T{}", i));
    EXPECT_GT(type->generation(), last);
    last = type->generation();
    EXPECT_TRUE(seen.insert(type->generation()).second);
  }
}

TEST_F(VersionTagTest, MutationChangesTag) {
  auto a = model_.makeType("A");
  std::set<uint32_t> tags{a->versionTag()};
  model_.setTypeAttr(*a, "x", intValue(1));
  EXPECT_TRUE(tags.insert(a->versionTag()).second);
  model_.setTypeAttr(*a, "x", intValue(2));
  EXPECT_TRUE(tags.insert(a->versionTag()).second);
  model_.delTypeAttr(*a, "x");
  EXPECT_TRUE(tags.insert(a->versionTag()).second);
  model_.invalidateType(*a);
  EXPECT_TRUE(tags.insert(a->versionTag()).second);
  EXPECT_EQ(a->versionBumps(), 4);
}

TEST_F(VersionTagTest, BumpReachesEverySubclassOnce) {
  auto a = model_.makeType("A");
  auto b = model_.makeType("B", {a});
  auto c = model_.makeType("C", {a});
  auto d = model_.makeType("D", {b, c});
  auto unrelated = model_.makeType("Unrelated");

  uint32_t b_tag = b->versionTag();
  uint32_t d_tag = d->versionTag();
  uint32_t unrelated_tag = unrelated->versionTag();

  model_.setTypeAttr(*a, "x", intValue(1));

  EXPECT_NE(b->versionTag(), b_tag);
  EXPECT_NE(d->versionTag(), d_tag);
  EXPECT_NE(c->versionTag(), 0);
  EXPECT_EQ(unrelated->versionTag(), unrelated_tag);
  // D is reachable through both B and C.
  EXPECT_EQ(d->versionBumps(), 1);
  EXPECT_EQ(b->versionBumps(), 1);
  EXPECT_EQ(c->versionBumps(), 1);
}

TEST_F(VersionTagTest, MutatingSubclassLeavesBaseAlone) {
  auto a = model_.makeType("A");
  auto b = model_.makeType("B", {a});
  uint32_t a_tag = a->versionTag();
  model_.setTypeAttr(*b, "x", intValue(1));
  EXPECT_EQ(a->versionTag(), a_tag);
}

TEST_F(VersionTagTest, DeadSubclassesAreSkipped) {
  auto a = model_.makeType("A");
  {
    auto b = model_.makeType("B", {a});
  }
  model_.setTypeAttr(*a, "x", intValue(1));
  EXPECT_NE(a->versionTag(), 0);
}

class VersionTagBudgetTest : public AttrCacheTest {
 public:
  VersionTagBudgetTest() : AttrCacheTest{3} {}
};

TEST_F(VersionTagBudgetTest, TypePinnedOnceBudgetIsExhausted) {
  auto a = model_.makeType("A");
  for (int i = 0; i < 3; i++) {
    model_.setTypeAttr(*a, "x", intValue(i));
    EXPECT_NE(a->versionTag(), 0) << "bump " << i;
  }
  model_.setTypeAttr(*a, "x", intValue(3));
  EXPECT_EQ(a->versionTag(), 0);
  EXPECT_TRUE(registry_.isPinned(*a));

  // Pinned types never get a valid tag back.
  model_.setTypeAttr(*a, "x", intValue(4));
  model_.invalidateType(*a);
  EXPECT_EQ(a->versionTag(), 0);
}

TEST_F(VersionTagBudgetTest, BudgetIsPerType) {
  auto a = model_.makeType("A");
  auto b = model_.makeType("B");
  for (int i = 0; i < 4; i++) {
    model_.setTypeAttr(*a, "x", intValue(i));
  }
  EXPECT_EQ(a->versionTag(), 0);
  model_.setTypeAttr(*b, "x", intValue(0));
  EXPECT_NE(b->versionTag(), 0);
}

TEST_F(VersionTagTest, PinAffectsOnlyTheType) {
  auto a = model_.makeType("A");
  auto b = model_.makeType("B", {a});
  model_.pinVersionTag(*a);
  EXPECT_EQ(a->versionTag(), 0);
  EXPECT_NE(b->versionTag(), 0);

  // Mutating the pinned base still invalidates the subclass.
  uint32_t b_tag = b->versionTag();
  model_.setTypeAttr(*a, "x", intValue(1));
  EXPECT_EQ(a->versionTag(), 0);
  EXPECT_NE(b->versionTag(), b_tag);
  EXPECT_NE(b->versionTag(), 0);
}

TEST(VersionTagSpaceTest, ExhaustedTagSpacePinsNewAndBumpedTypes) {
  VersionTagRegistry registry{1000, 3};
  ObjectModel model{registry};
  auto a = model.makeType("A");
  auto b = model.makeType("B");
  auto c = model.makeType("C");
  EXPECT_EQ(a->versionTag(), 1);
  EXPECT_EQ(b->versionTag(), 2);
  EXPECT_EQ(c->versionTag(), 3);

  auto d = model.makeType("D");
  EXPECT_EQ(d->versionTag(), 0);
  EXPECT_TRUE(registry.isPinned(*d));

  model.setTypeAttr(*a, "x", intValue(1));
  EXPECT_EQ(a->versionTag(), 0);
  EXPECT_TRUE(registry.isPinned(*a));
  // Untouched types keep their tags.
  EXPECT_EQ(b->versionTag(), 2);
}
