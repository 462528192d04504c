// Copyright (c) Meta Platforms, Inc. and affiliates.

#include "attrcache/Jit/deopt.h"

#include "attrcache/Common/log.h"
#include "attrcache/Jit/config.h"

namespace attrcache {

namespace {

const char* const kFillActionNames[] = {
#define NAME_FILL_ACTION(name) #name,
    FILL_ACTIONS(NAME_FILL_ACTION)
#undef NAME_FILL_ACTION
};

} // namespace

std::string_view fillActionName(FillAction action) {
  return kFillActionNames[static_cast<size_t>(action)];
}

Value DeoptBridge::handleMiss(
    LoadAttrCache& cache,
    Object& obj,
    CacheMissReason reason) {
  const std::string& name = cache.name();
  Resolution resolution = adapter_.resolve(obj, name);
  Type& type = *resolution.type;

  if (resolution.getattribute != nullptr) {
    cache.recordMiss(type, CacheMissReason::kCustomGetAttribute);
    return (*resolution.getattribute)(obj, name);
  }

  std::optional<Value> value;
  try {
    value = ObjectModelAdapter::load(resolution.kind, obj, name);
  } catch (const AttributeNotFound&) {
    if (resolution.fallback == nullptr) {
      cache.recordMiss(type, CacheMissReason::kAttributeNotFound);
      throw;
    }
  }

  if (!value.has_value()) {
    if (resolution.fallback != nullptr) {
      cache.recordMiss(type, CacheMissReason::kFallbackHook);
      return (*resolution.fallback)(obj, name);
    }
    cache.recordMiss(type, CacheMissReason::kAttributeNotFound);
    throw AttributeNotFound{type.name(), name};
  }

  cache.recordMiss(type, reason);
  fill(cache, resolution);
  return std::move(*value);
}

std::optional<Value> DeoptBridge::runFallback(
    LoadAttrCache& cache,
    Object& obj) {
  const std::string& name = cache.name();
  Resolution resolution = adapter_.resolve(obj, name);
  if (resolution.fallback == nullptr) {
    cache.recordMiss(*resolution.type, CacheMissReason::kAttributeNotFound);
    return std::nullopt;
  }
  cache.recordMiss(*resolution.type, CacheMissReason::kFallbackHook);
  return (*resolution.fallback)(obj, name);
}

void DeoptBridge::fill(LoadAttrCache& cache, const Resolution& resolution) {
  if (!getConfig().attr_caches || resolution.version_tag == 0 ||
      std::holds_alternative<Absent>(resolution.kind)) {
    return;
  }
  CacheEntry entry{
      resolution.generation, resolution.version_tag, resolution.kind};
  auto guard = cache.fillLock();
  FillDecision decision =
      chooseFill(cache, resolution.generation, resolution.version_tag);
  applyFill(cache, decision, entry);
  ATTRCACHE_DLOG(
      "{}: {} {} for '{}.{}' (generation {}, tag {})",
      cache.callSite(),
      fillActionName(decision.action),
      resolutionKindName(resolution.kind),
      resolution.type->name(),
      cache.name(),
      resolution.generation,
      resolution.version_tag);
}

FillDecision DeoptBridge::chooseFill(
    const LoadAttrCache& cache,
    uint64_t generation,
    uint32_t tag) {
  switch (cache.state()) {
    case CacheState::kEmpty:
      return {FillAction::kInstallMonomorphic};
    case CacheState::kMonomorphic: {
      CacheEntry current = cache.monomorphic().entry();
      if (current.generation != generation) {
        return {FillAction::kPromoteToPolymorphic};
      }
      // Another thread may have refreshed the entry already.
      if (current.version_tag == tag) {
        return {FillAction::kSkip};
      }
      return {FillAction::kRefreshMonomorphic};
    }
    case CacheState::kPolymorphic: {
      auto pos = cache.polymorphic().findGeneration(generation);
      if (!pos.has_value()) {
        return {FillAction::kInsertPolymorphic};
      }
      return {FillAction::kReplacePolymorphic, *pos};
    }
  }
  ATTRCACHE_ABORT("Bad CacheState {}", static_cast<int>(cache.state()));
}

void DeoptBridge::applyFill(
    LoadAttrCache& cache,
    const FillDecision& decision,
    const CacheEntry& entry) {
  switch (decision.action) {
    case FillAction::kInstallMonomorphic:
      cache.installMonomorphic(entry);
      break;
    case FillAction::kRefreshMonomorphic:
      cache.refreshMonomorphic(entry);
      break;
    case FillAction::kPromoteToPolymorphic:
      cache.promoteToPolymorphic(entry);
      break;
    case FillAction::kInsertPolymorphic:
      cache.insertPolymorphic(entry);
      break;
    case FillAction::kReplacePolymorphic:
      cache.replacePolymorphic(decision.pos, entry);
      break;
    case FillAction::kSkip:
      break;
  }
}

} // namespace attrcache
