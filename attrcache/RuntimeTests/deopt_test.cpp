// Copyright (c) Meta Platforms, Inc. and affiliates.

#include <gtest/gtest.h>

#include "attrcache/Jit/config.h"
#include "attrcache/Jit/deopt.h"
#include "attrcache/RuntimeTests/fixtures.h"

#include <algorithm>
#include <chrono>
#include <stdexcept>

using namespace attrcache;

class DeoptTest : public AttrCacheTest {
 public:
  FillAction nextFill(LoadAttrCache& site, const Type& type) {
    auto guard = site.fillLock();
    return DeoptBridge::chooseFill(site, type.generation(), type.versionTag())
        .action;
  }
};

TEST_F(DeoptTest, FillActionsFollowStateMachine) {
  auto a = makeSlotType("A", {"x"});
  auto b = makeSlotType("B", {"x"});
  auto c = makeSlotType("C", {"x"});
  auto a_obj = makeObject(a, {{"x", intValue(1)}});
  auto b_obj = makeObject(b, {{"x", intValue(2)}});
  auto c_obj = makeObject(c, {{"x", intValue(3)}});
  LoadAttrCache* site = runtime_.compileGuardedAccess("site", "x");

  EXPECT_EQ(nextFill(*site, *a), FillAction::kInstallMonomorphic);
  evaluate(site, *a_obj);
  EXPECT_EQ(nextFill(*site, *a), FillAction::kSkip);

  model_.invalidateType(*a);
  EXPECT_EQ(nextFill(*site, *a), FillAction::kRefreshMonomorphic);
  evaluate(site, *a_obj);
  EXPECT_EQ(site->state(), CacheState::kMonomorphic);
  EXPECT_EQ(site->respecializationCount(), 1);

  EXPECT_EQ(nextFill(*site, *b), FillAction::kPromoteToPolymorphic);
  evaluate(site, *b_obj);
  EXPECT_EQ(site->state(), CacheState::kPolymorphic);

  EXPECT_EQ(nextFill(*site, *c), FillAction::kInsertPolymorphic);
  evaluate(site, *c_obj);

  // A stale entry is overwritten in place instead of taking a new slot.
  model_.invalidateType(*a);
  EXPECT_EQ(nextFill(*site, *a), FillAction::kReplacePolymorphic);
  evaluate(site, *a_obj);
  EXPECT_EQ(site->entryCount(), 3);

  // Polymorphic sites never go back.
  for (int i = 0; i < 10; i++) {
    model_.invalidateType(*a);
    EXPECT_EQ(evaluate(site, *a_obj), intValue(1));
  }
  EXPECT_EQ(site->state(), CacheState::kPolymorphic);
  EXPECT_EQ(site->respecializationCount(), 1);
  EXPECT_EQ(site->entryCount(), 3);
}

TEST_F(DeoptTest, FillActionNames) {
  EXPECT_EQ(
      fillActionName(FillAction::kPromoteToPolymorphic),
      "PromoteToPolymorphic");
  EXPECT_EQ(fillActionName(FillAction::kSkip), "Skip");
}

TEST_F(DeoptTest, FallbackHookResultIsNotCached) {
  auto c = makeSlotType("C", {"x"});
  int calls = 0;
  model_.setFallbackHook(*c, [&](Object&, const std::string& name) {
    calls++;
    return Value{"fallback:" + name};
  });
  auto obj = makeObject(c);
  LoadAttrCache* site = runtime_.compileGuardedAccess("site", "y");
  EXPECT_EQ(evaluate(site, *obj), strValue("fallback:y"));
  EXPECT_EQ(evaluate(site, *obj), strValue("fallback:y"));
  EXPECT_EQ(calls, 2);
  EXPECT_EQ(site->state(), CacheState::kEmpty);

  // An unset slot also falls back, even through a warm entry.
  LoadAttrCache* x_site = runtime_.compileGuardedAccess("x_site", "x");
  model_.setAttr(*obj, "x", intValue(1));
  EXPECT_EQ(evaluate(x_site, *obj), intValue(1));
  model_.delAttr(*obj, "x");
  EXPECT_EQ(evaluate(x_site, *obj), strValue("fallback:x"));
  EXPECT_EQ(calls, 3);
}

TEST_F(DeoptTest, HookFailurePropagatesAndInstallsNothing) {
  auto c = model_.makeType("C");
  model_.setFallbackHook(*c, [](Object&, const std::string&) -> Value {
    throw std::runtime_error{"hook failed"};
  });
  auto obj = makeObject(c);
  LoadAttrCache* site = runtime_.compileGuardedAccess("site", "x");
  try {
    evaluate(site, *obj);
    FAIL() << "Expected the hook's exception";
  } catch (const std::runtime_error& err) {
    EXPECT_STREQ(err.what(), "hook failed");
  }
  EXPECT_EQ(site->state(), CacheState::kEmpty);
}

TEST_F(DeoptTest, DescriptorGetterFailurePropagates) {
  auto c = makeSlotType("C", {});
  auto cls = model_.makeDescriptorClass(
      "broken", [](const Descriptor&, Object&) -> Value {
        throw std::logic_error{"getter failed"};
      });
  model_.setTypeAttr(*c, "x", model_.makeDescriptor(cls));
  auto obj = makeObject(c);
  LoadAttrCache* site = runtime_.compileGuardedAccess("site", "x");
  EXPECT_THROW(evaluate(site, *obj), std::logic_error);
  EXPECT_EQ(site->state(), CacheState::kEmpty);
}

TEST_F(DeoptTest, WarmDescriptorMissRunsFallbackHook) {
  // A property-style getter that only has a value when the instance stores
  // one.
  auto t = model_.makeType("T");
  auto cls = model_.makeDescriptorClass(
      "property",
      [](const Descriptor&, Object& obj) -> Value {
        if (auto value = obj.dictGet("_x")) {
          return *value;
        }
        throw AttributeNotFound{obj.type()->name(), "x"};
      },
      [](const Descriptor&, Object&, const Value&) {});
  model_.setTypeAttr(*t, "x", model_.makeDescriptor(cls));
  model_.setFallbackHook(
      *t, [](Object&, const std::string&) { return intValue(7); });
  auto with_value = makeObject(t, {{"_x", intValue(1)}});
  auto without_value = makeObject(t);
  LoadAttrCache* site = runtime_.compileGuardedAccess("site", "x");

  EXPECT_EQ(model_.genericGetAttr(*without_value, "x"), intValue(7));
  EXPECT_EQ(evaluate(site, *without_value), intValue(7));
  EXPECT_EQ(site->state(), CacheState::kEmpty);

  EXPECT_EQ(evaluate(site, *with_value), intValue(1));
  EXPECT_EQ(site->state(), CacheState::kMonomorphic);
  EXPECT_EQ(evaluate(site, *without_value), intValue(7));
  EXPECT_EQ(evaluate(site, *with_value), intValue(1));
  EXPECT_EQ(site->missCount(), 3);

  // Without a hook the warm path raises like the reference lookup does.
  model_.setFallbackHook(*t, nullptr);
  EXPECT_EQ(evaluate(site, *with_value), intValue(1));
  EXPECT_THROW(model_.genericGetAttr(*without_value, "x"), AttributeNotFound);
  EXPECT_THROW(evaluate(site, *without_value), AttributeNotFound);
  EXPECT_EQ(site->state(), CacheState::kMonomorphic);
}

TEST_F(DeoptTest, GetAttributeOverrideBypassesCache) {
  auto c = model_.makeType("C");
  int calls = 0;
  model_.setGetAttributeHook(*c, [&](Object&, const std::string&) {
    return intValue(++calls);
  });
  auto obj = makeObject(c, {{"x", intValue(100)}});
  LoadAttrCache* site = runtime_.compileGuardedAccess("site", "x");
  EXPECT_EQ(evaluate(site, *obj), intValue(1));
  EXPECT_EQ(evaluate(site, *obj), intValue(2));
  EXPECT_EQ(site->state(), CacheState::kEmpty);

  // Removing the override makes the type cacheable again.
  model_.setGetAttributeHook(*c, nullptr);
  EXPECT_EQ(evaluate(site, *obj), intValue(100));
  EXPECT_EQ(site->state(), CacheState::kMonomorphic);
}

TEST_F(DeoptTest, MissStatistics) {
  getMutableConfig().collect_attr_cache_stats = true;
  auto a = model_.makeType("A");
  auto b = model_.makeType("B");
  auto pinned = model_.makeType("Pinned");
  model_.pinVersionTag(*pinned);
  auto a_obj = makeObject(a, {{"x", intValue(1)}});
  auto b_obj = makeObject(b, {{"x", intValue(2)}});
  auto p_obj = makeObject(pinned, {{"x", intValue(3)}});
  auto b_empty = makeObject(b);
  LoadAttrCache* site = runtime_.compileGuardedAccess("site", "x");

  evaluate(site, *a_obj);
  evaluate(site, *a_obj);
  evaluate(site, *b_obj);
  model_.setTypeAttr(*a, "unrelated", intValue(0));
  evaluate(site, *a_obj);
  evaluate(site, *p_obj);
  EXPECT_THROW(evaluate(site, *b_empty), AttributeNotFound);

  InlineCacheStats stats = runtime_.getAndClearLoadAttrCacheStats();
  ASSERT_EQ(stats.size(), 1);
  EXPECT_EQ(stats[0].call_site, "site");
  EXPECT_EQ(stats[0].attr_name, "x");
  auto& misses = stats[0].misses;
  ASSERT_EQ(misses.size(), 3);
  EXPECT_EQ(misses.at("A.x").count, 2);
  EXPECT_EQ(misses.at("A.x").reason, CacheMissReason::kStaleVersion);
  EXPECT_EQ(misses.at("B.x").count, 2);
  EXPECT_EQ(misses.at("B.x").reason, CacheMissReason::kAttributeNotFound);
  EXPECT_EQ(misses.at("Pinned.x").reason, CacheMissReason::kUncacheableType);

  EXPECT_TRUE(runtime_.getAndClearLoadAttrCacheStats().empty());
}

TEST_F(DeoptTest, NoStatisticsUnlessEnabled) {
  auto a = model_.makeType("A");
  auto obj = makeObject(a, {{"x", intValue(1)}});
  LoadAttrCache* site = runtime_.compileGuardedAccess("site", "x");
  evaluate(site, *obj);
  EXPECT_EQ(site->missCount(), 1);
  EXPECT_TRUE(runtime_.getAndClearLoadAttrCacheStats().empty());
}

TEST_F(DeoptTest, MissReasonNames) {
  EXPECT_EQ(cacheMissReason(CacheMissReason::kWrongType), "WrongType");
  EXPECT_EQ(
      cacheMissReason(CacheMissReason::kCustomGetAttribute),
      "CustomGetAttribute");
  EXPECT_EQ(cacheStateName(CacheState::kPolymorphic), "polymorphic");
}

TEST_F(DeoptTest, Diagnostics) {
  auto a = makeSlotType("A", {"x"});
  auto obj = makeObject(a, {{"x", intValue(1)}});
  LoadAttrCache* site = runtime_.compileGuardedAccess("site", "x");
  CacheDiagnostics diag = runtime_.diagnostics(site);
  EXPECT_EQ(diag.state, CacheState::kEmpty);
  EXPECT_EQ(diag.entry_count, 0);

  evaluate(site, *obj);
  runtime_.invalidateType(*a);
  evaluate(site, *obj);
  diag = runtime_.diagnostics(site);
  EXPECT_EQ(diag.state, CacheState::kMonomorphic);
  EXPECT_EQ(diag.entry_count, 1);
  EXPECT_EQ(diag.miss_count, 2);
  EXPECT_EQ(diag.respecialization_count, 1);
  EXPECT_EQ(diag.eviction_count, 0);
}

namespace {

using Clock = std::chrono::steady_clock;

// Runs of timing-sensitive loops; the fastest one is used.
constexpr int kTimingRuns = 5;
constexpr int kIterations = 20000;

template <typename Func>
Clock::duration bestOf(Func func) {
  Clock::duration best = Clock::duration::max();
  for (int run = 0; run < kTimingRuns; run++) {
    best = std::min(best, func(run));
  }
  return best;
}

} // namespace

// A site cycling through four types must stay within a constant factor of a
// site that only ever sees one.
TEST_F(DeoptTest, NoDeoptStorm) {
  std::vector<std::shared_ptr<Object>> objs;
  for (int i = 0; i < 4; i++) {
    auto type = makeSlotType(fmt::format("S{}", i), {"x"});
    objs.push_back(makeObject(type, {{"x", intValue(i)}}));
  }

  auto mono_time = bestOf([&](int run) {
    LoadAttrCache* site =
        runtime_.compileGuardedAccess(fmt::format("mono{}", run), "x");
    auto start = Clock::now();
    for (int i = 0; i < kIterations; i++) {
      evaluate(site, *objs[0]);
    }
    return Clock::now() - start;
  });

  auto poly_time = bestOf([&](int run) {
    LoadAttrCache* site =
        runtime_.compileGuardedAccess(fmt::format("poly{}", run), "x");
    auto start = Clock::now();
    for (int i = 0; i < kIterations; i++) {
      evaluate(site, *objs[i % 4]);
    }
    return Clock::now() - start;
  });

  for (int run = 0; run < kTimingRuns; run++) {
    LoadAttrCache* site = runtime_.findCallSite(fmt::format("poly{}", run));
    ASSERT_NE(site, nullptr);
    EXPECT_EQ(site->missCount(), 4);
    EXPECT_EQ(site->respecializationCount(), 0);
    EXPECT_EQ(site->evictionCount(), 0);
  }

  double mono_rate = kIterations / std::chrono::duration<double>(mono_time).count();
  double poly_rate = kIterations / std::chrono::duration<double>(poly_time).count();
  EXPECT_GT(poly_rate / mono_rate, 0.3)
      << "mono " << mono_rate << "/s, poly " << poly_rate << "/s";
}

// After a site has seen a type, switching to a second one costs one miss, not
// a miss per call.
TEST_F(DeoptTest, NoThrash) {
  auto a = makeSlotType("A", {"x"});
  auto b = makeSlotType("B", {"x"});
  auto a_obj = makeObject(a, {{"x", intValue(1)}});
  auto b_obj = makeObject(b, {{"x", intValue(2)}});

  Clock::duration first = Clock::duration::max();
  Clock::duration second = Clock::duration::max();
  for (int run = 0; run < kTimingRuns; run++) {
    LoadAttrCache* site =
        runtime_.compileGuardedAccess(fmt::format("site{}", run), "x");
    for (int i = 0; i < kIterations; i++) {
      evaluate(site, *a_obj);
    }
    auto start = Clock::now();
    for (int i = 0; i < kIterations; i++) {
      evaluate(site, *b_obj);
    }
    auto middle = Clock::now();
    for (int i = 0; i < kIterations; i++) {
      evaluate(site, *b_obj);
    }
    auto end = Clock::now();
    first = std::min(first, middle - start);
    second = std::min(second, end - middle);

    EXPECT_EQ(site->missCount(), 2);
    EXPECT_EQ(site->state(), CacheState::kPolymorphic);
  }
  EXPECT_LT(second, 2 * first);
}
