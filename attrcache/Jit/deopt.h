// Copyright (c) Meta Platforms, Inc. and affiliates.

#pragma once

#include "attrcache/Common/util.h"
#include "attrcache/Jit/attr_resolution.h"
#include "attrcache/Jit/inline_cache.h"

#include <cstdint>
#include <optional>
#include <string_view>

namespace attrcache {

#define FILL_ACTIONS(X) \
  X(InstallMonomorphic) \
  X(RefreshMonomorphic) \
  X(PromoteToPolymorphic) \
  X(InsertPolymorphic) \
  X(ReplacePolymorphic) \
  X(Skip)

enum class FillAction : uint8_t {
#define DECLARE_FILL_ACTION(name) k##name,
  FILL_ACTIONS(DECLARE_FILL_ACTION)
#undef DECLARE_FILL_ACTION
};

std::string_view fillActionName(FillAction action);

struct FillDecision {
  FillAction action{FillAction::kSkip};
  // Position to overwrite, for kReplacePolymorphic.
  uint32_t pos{0};
};

// The boundary between a call site's fast path and full dynamic resolution.
//
// On a guard miss the bridge re-resolves the attribute through the
// ObjectModelAdapter, computes the value, and folds a fresh entry into the
// call site's cache.  Lookups that go through a __getattribute__ override or a
// fallback hook, and lookups that fail, install nothing.
class DeoptBridge {
 public:
  explicit DeoptBridge(ObjectModelAdapter& adapter) : adapter_{adapter} {}

  DISALLOW_COPY_AND_ASSIGN(DeoptBridge);

  ObjectModel& model() {
    return adapter_.model();
  }

  // Throws AttributeNotFound.  Exceptions from hooks propagate unchanged.
  Value handleMiss(LoadAttrCache& cache, Object& obj, CacheMissReason reason);

  // A load through a valid cache entry raised AttributeNotFound.  Runs the
  // type's fallback hook, or returns nullopt if it has none.
  std::optional<Value> runFallback(LoadAttrCache& cache, Object& obj);

  // Decide how an entry for the given guard key goes into cache.  Requires
  // the cache's fill lock.
  static FillDecision
  chooseFill(const LoadAttrCache& cache, uint64_t generation, uint32_t tag);

  static void applyFill(
      LoadAttrCache& cache,
      const FillDecision& decision,
      const CacheEntry& entry);

 private:
  void fill(LoadAttrCache& cache, const Resolution& resolution);

  ObjectModelAdapter& adapter_;
};

} // namespace attrcache
