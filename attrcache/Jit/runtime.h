// Copyright (c) Meta Platforms, Inc. and affiliates.

#pragma once

#include "attrcache/Common/util.h"
#include "attrcache/Jit/attr_resolution.h"
#include "attrcache/Jit/containers.h"
#include "attrcache/Jit/deopt.h"
#include "attrcache/Jit/inline_cache.h"
#include "attrcache/ObjectModel/object_model.h"

#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace attrcache {

// Read-only introspection of one call site.
struct CacheDiagnostics {
  CacheState state{CacheState::kEmpty};
  size_t entry_count{0};
  uint64_t miss_count{0};
  uint64_t eviction_count{0};
  uint64_t respecialization_count{0};
};

using InlineCacheStats = std::vector<CacheStats>;

// Owns the guarded attribute accesses of every compiled call site, and the
// machinery their slow paths share.
class Runtime {
 public:
  explicit Runtime(ObjectModel& model);

  DISALLOW_COPY_AND_ASSIGN(Runtime);

  ObjectModel& model() {
    return model_;
  }

  // Install an empty cache for a call site reading the attribute name.
  // Compiling the same call site again for the same attribute returns the
  // existing cache; reusing a call site id for another attribute throws
  // std::invalid_argument.  The returned handle lives as long as the Runtime.
  LoadAttrCache* compileGuardedAccess(
      const std::string& call_site,
      const std::string& name);

  // Read the cached attribute from obj.  Throws AttributeNotFound.
  Value evaluate(LoadAttrCache* cache, Object& obj);

  // Host-triggered invalidation of type and its subclasses.
  void invalidateType(Type& type);

  CacheDiagnostics diagnostics(const LoadAttrCache* cache) const;

  // nullptr if the call site was never compiled.
  LoadAttrCache* findCallSite(const std::string& call_site) const;

  size_t callSiteCount() const;

  // Collect the miss statistics of every call site that has any, and reset
  // them.
  InlineCacheStats getAndClearLoadAttrCacheStats();

 private:
  ObjectModel& model_;
  ObjectModelAdapter adapter_;
  DeoptBridge bridge_;

  mutable std::mutex mutex_;
  UnorderedMap<std::string, std::unique_ptr<LoadAttrCache>> load_attr_caches_;
};

} // namespace attrcache
