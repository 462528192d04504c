// Copyright (c) Meta Platforms, Inc. and affiliates.

#include "attrcache/Jit/runtime.h"

#include "attrcache/Common/log.h"
#include "attrcache/Jit/config.h"

#include <stdexcept>

namespace attrcache {

Runtime::Runtime(ObjectModel& model)
    : model_{model}, adapter_{model}, bridge_{adapter_} {}

LoadAttrCache* Runtime::compileGuardedAccess(
    const std::string& call_site,
    const std::string& name) {
  std::lock_guard<std::mutex> guard{mutex_};
  auto it = load_attr_caches_.find(call_site);
  if (it != load_attr_caches_.end()) {
    if (it->second->name() != name) {
      throw std::invalid_argument{fmt::format(
          "Call site '{}' already reads attribute '{}', not '{}'",
          call_site,
          it->second->name(),
          name)};
    }
    return it->second.get();
  }
  auto cache = std::make_unique<LoadAttrCache>(
      call_site, name, getConfig().attr_cache_size, bridge_);
  LoadAttrCache* result = cache.get();
  load_attr_caches_.emplace(call_site, std::move(cache));
  ATTRCACHE_DLOG("Compiled guarded access {} for '{}'", call_site, name);
  return result;
}

Value Runtime::evaluate(LoadAttrCache* cache, Object& obj) {
  ATTRCACHE_CHECK(cache != nullptr, "Evaluating a null call site");
  return LoadAttrCache::invoke(cache, obj);
}

void Runtime::invalidateType(Type& type) {
  model_.invalidateType(type);
}

CacheDiagnostics Runtime::diagnostics(const LoadAttrCache* cache) const {
  ATTRCACHE_CHECK(cache != nullptr, "Diagnostics for a null call site");
  CacheDiagnostics diag;
  diag.state = cache->state();
  diag.entry_count = cache->entryCount();
  diag.miss_count = cache->missCount();
  diag.eviction_count = cache->evictionCount();
  diag.respecialization_count = cache->respecializationCount();
  return diag;
}

LoadAttrCache* Runtime::findCallSite(const std::string& call_site) const {
  std::lock_guard<std::mutex> guard{mutex_};
  auto it = load_attr_caches_.find(call_site);
  return it == load_attr_caches_.end() ? nullptr : it->second.get();
}

size_t Runtime::callSiteCount() const {
  std::lock_guard<std::mutex> guard{mutex_};
  return load_attr_caches_.size();
}

InlineCacheStats Runtime::getAndClearLoadAttrCacheStats() {
  InlineCacheStats stats;
  std::lock_guard<std::mutex> guard{mutex_};
  for (auto& [call_site, cache] : load_attr_caches_) {
    CacheStats cache_stats = cache->cacheStats();
    if (cache_stats.misses.empty()) {
      continue;
    }
    stats.push_back(std::move(cache_stats));
    cache->clearCacheStats();
  }
  return stats;
}

} // namespace attrcache
