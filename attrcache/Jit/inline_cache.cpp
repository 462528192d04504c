// Copyright (c) Meta Platforms, Inc. and affiliates.

#include "attrcache/Jit/inline_cache.h"

#include "attrcache/Common/log.h"
#include "attrcache/Jit/config.h"
#include "attrcache/Jit/deopt.h"

#include <fmt/format.h>

namespace attrcache {

namespace {

std::string_view kCacheMissReasons[] = {
#define NAME_REASON(reason) #reason,
    FOREACH_CACHE_MISS_REASON(NAME_REASON)
#undef NAME_REASON
};

} // namespace

std::string_view cacheMissReason(CacheMissReason reason) {
  return kCacheMissReasons[static_cast<size_t>(reason)];
}

std::string_view cacheStateName(CacheState state) {
  switch (state) {
    case CacheState::kEmpty:
      return "empty";
    case CacheState::kMonomorphic:
      return "monomorphic";
    case CacheState::kPolymorphic:
      return "polymorphic";
  }
  ATTRCACHE_ABORT("Bad CacheState {}", static_cast<int>(state));
}

CacheCell::CacheCell() {
  for (auto& word : words_) {
    word.store(0, std::memory_order_relaxed);
  }
  store(CacheEntry{});
}

bool CacheCell::load(CacheEntry& out) const {
  uint64_t raw[kWords];
  uint32_t before = seq_.load(std::memory_order_acquire);
  if (before & 1) {
    return false;
  }
  for (size_t i = 0; i < kWords; i++) {
    raw[i] = words_[i].load(std::memory_order_relaxed);
  }
  std::atomic_thread_fence(std::memory_order_acquire);
  if (seq_.load(std::memory_order_relaxed) != before) {
    return false;
  }
  std::memcpy(&out, raw, sizeof(CacheEntry));
  return true;
}

void CacheCell::store(const CacheEntry& entry) {
  uint64_t raw[kWords] = {};
  std::memcpy(raw, &entry, sizeof(CacheEntry));
  uint32_t seq = seq_.load(std::memory_order_relaxed);
  seq_.store(seq + 1, std::memory_order_relaxed);
  std::atomic_thread_fence(std::memory_order_release);
  for (size_t i = 0; i < kWords; i++) {
    words_[i].store(raw[i], std::memory_order_relaxed);
  }
  seq_.store(seq + 2, std::memory_order_release);
}

std::optional<CacheEntry> CacheSlot::lookup(uint64_t generation, uint32_t tag)
    const {
  CacheEntry entry;
  if (cell_.load(entry) && entry.matches(generation, tag)) {
    return entry;
  }
  return std::nullopt;
}

bool CacheSlot::peek(CacheEntry& out) const {
  return cell_.load(out);
}

CacheEntry CacheSlot::entry() const {
  CacheEntry entry;
  // Writers are serialized, so a writer never sees a torn copy.
  bool ok = cell_.load(entry);
  ATTRCACHE_CHECK(ok, "Torn cache entry read while holding the fill lock");
  return entry;
}

void CacheSlot::install(const CacheEntry& entry) {
  cell_.store(entry);
}

void CacheSlot::clear() {
  cell_.store(CacheEntry{});
}

PolymorphicCache::PolymorphicCache(uint32_t capacity)
    : capacity_{capacity}, cells_{std::make_unique<CacheCell[]>(capacity)} {
  ATTRCACHE_CHECK(
      capacity >= 1 && capacity <= kMaxAttrCacheSize,
      "Bad polymorphic cache capacity {}",
      capacity);
}

std::optional<CacheEntry> PolymorphicCache::lookup(
    uint64_t generation,
    uint32_t tag) const {
  uint32_t count = count_.load(std::memory_order_acquire);
  uint32_t head = head_.load(std::memory_order_acquire);
  CacheEntry entry;
  for (uint32_t i = 0; i < count; i++) {
    const CacheCell& cell = cells_[position(head, i)];
    if (cell.load(entry) && entry.matches(generation, tag)) {
      return entry;
    }
  }
  return std::nullopt;
}

std::optional<uint32_t> PolymorphicCache::findGeneration(
    uint64_t generation) const {
  uint32_t count = count_.load(std::memory_order_relaxed);
  uint32_t head = head_.load(std::memory_order_relaxed);
  CacheEntry entry;
  for (uint32_t i = 0; i < count; i++) {
    uint32_t pos = position(head, i);
    if (cells_[pos].load(entry) && entry.generation == generation) {
      return pos;
    }
  }
  return std::nullopt;
}

bool PolymorphicCache::insert(const CacheEntry& entry) {
  uint32_t count = count_.load(std::memory_order_relaxed);
  uint32_t head = head_.load(std::memory_order_relaxed);
  uint32_t pos = count == 0 ? head : (head + 1) % capacity_;
  // When full, pos holds the oldest entry.
  bool evict = count == capacity_;
  cells_[pos].store(entry);
  head_.store(pos, std::memory_order_release);
  if (!evict) {
    count_.store(count + 1, std::memory_order_release);
  }
  return evict;
}

void PolymorphicCache::replace(uint32_t pos, const CacheEntry& entry) {
  ATTRCACHE_CHECK(pos < capacity_, "Bad polymorphic cache position {}", pos);
  cells_[pos].store(entry);
}

std::vector<CacheEntry> PolymorphicCache::entries() const {
  std::vector<CacheEntry> result;
  uint32_t count = count_.load(std::memory_order_acquire);
  uint32_t head = head_.load(std::memory_order_acquire);
  CacheEntry entry;
  for (uint32_t i = 0; i < count; i++) {
    if (cells_[position(head, i)].load(entry)) {
      result.push_back(entry);
    }
  }
  return result;
}

LoadAttrCache::LoadAttrCache(
    std::string call_site,
    std::string name,
    uint32_t capacity,
    DeoptBridge& bridge)
    : call_site_{std::move(call_site)},
      name_{std::move(name)},
      bridge_{bridge},
      poly_{capacity} {
  cache_stats_.call_site = call_site_;
  cache_stats_.attr_name = name_;
}

Value LoadAttrCache::invoke(LoadAttrCache* cache, Object& obj) {
  // Entries point into type metadata.  The section keeps whatever a matching
  // entry points to alive until the load is done.
  auto section = cache->bridge_.model().readSection();
  Type* type = obj.type();
  uint32_t tag = type->versionTag();
  if (!getConfig().attr_caches || tag == 0) {
    return cache->invokeSlowPath(obj, CacheMissReason::kUncacheableType);
  }
  uint64_t generation = type->generation();
  if (auto entry = cache->lookup(generation, tag)) {
    std::optional<Value> value;
    try {
      value = ObjectModelAdapter::load(entry->kind, obj, cache->name_);
    } catch (const AttributeNotFound&) {
      // A descriptor on the cached path gave up.  The fallback hook gets the
      // same chance it gets on the slow path.
      cache->miss_count_.fetch_add(1, std::memory_order_relaxed);
      if (auto result = cache->bridge_.runFallback(*cache, obj)) {
        return std::move(*result);
      }
      throw;
    }
    if (value.has_value()) {
      return std::move(*value);
    }
    // Guard hit, but instance storage is empty.  The slow path decides between
    // the fallback hook and AttributeNotFound.
    return cache->invokeSlowPath(obj, CacheMissReason::kAttributeNotFound);
  }
  return cache->invokeSlowPath(obj, cache->classifyMiss(generation, tag));
}

Value LoadAttrCache::invokeSlowPath(Object& obj, CacheMissReason reason) {
  miss_count_.fetch_add(1, std::memory_order_relaxed);
  return bridge_.handleMiss(*this, obj, reason);
}

std::optional<CacheEntry> LoadAttrCache::lookup(
    uint64_t generation,
    uint32_t tag) const {
  switch (state()) {
    case CacheState::kEmpty:
      return std::nullopt;
    case CacheState::kMonomorphic:
      return mono_.lookup(generation, tag);
    case CacheState::kPolymorphic:
      return poly_.lookup(generation, tag);
  }
  return std::nullopt;
}

CacheMissReason LoadAttrCache::classifyMiss(uint64_t generation, uint32_t tag)
    const {
  if (tag == 0) {
    return CacheMissReason::kUncacheableType;
  }
  switch (state()) {
    case CacheState::kEmpty:
      return CacheMissReason::kEmpty;
    case CacheState::kMonomorphic: {
      // Read without the fill lock; a torn read only makes the reason less
      // precise.
      CacheEntry entry;
      if (mono_.peek(entry) && entry.generation == generation) {
        return CacheMissReason::kStaleVersion;
      }
      return CacheMissReason::kWrongType;
    }
    case CacheState::kPolymorphic:
      for (const CacheEntry& entry : poly_.entries()) {
        if (entry.generation == generation) {
          return CacheMissReason::kStaleVersion;
        }
      }
      return CacheMissReason::kWrongType;
  }
  return CacheMissReason::kWrongType;
}

size_t LoadAttrCache::entryCount() const {
  switch (state()) {
    case CacheState::kEmpty:
      return 0;
    case CacheState::kMonomorphic:
      return 1;
    case CacheState::kPolymorphic:
      return poly_.size();
  }
  return 0;
}

void LoadAttrCache::installMonomorphic(const CacheEntry& entry) {
  ATTRCACHE_DCHECK(state() == CacheState::kEmpty, "Call site already filled");
  mono_.install(entry);
  state_.store(CacheState::kMonomorphic, std::memory_order_release);
}

void LoadAttrCache::refreshMonomorphic(const CacheEntry& entry) {
  ATTRCACHE_DCHECK(
      state() == CacheState::kMonomorphic, "Call site is not monomorphic");
  mono_.install(entry);
  respecialization_count_.fetch_add(1, std::memory_order_relaxed);
}

void LoadAttrCache::promoteToPolymorphic(const CacheEntry& entry) {
  ATTRCACHE_DCHECK(
      state() == CacheState::kMonomorphic, "Call site is not monomorphic");
  // Fill the polymorphic cache completely before readers switch to it.
  poly_.insert(mono_.entry());
  poly_.insert(entry);
  state_.store(CacheState::kPolymorphic, std::memory_order_release);
}

void LoadAttrCache::insertPolymorphic(const CacheEntry& entry) {
  ATTRCACHE_DCHECK(
      state() == CacheState::kPolymorphic, "Call site is not polymorphic");
  if (poly_.insert(entry)) {
    eviction_count_.fetch_add(1, std::memory_order_relaxed);
  }
}

void LoadAttrCache::replacePolymorphic(uint32_t pos, const CacheEntry& entry) {
  ATTRCACHE_DCHECK(
      state() == CacheState::kPolymorphic, "Call site is not polymorphic");
  poly_.replace(pos, entry);
}

void LoadAttrCache::recordMiss(const Type& type, CacheMissReason reason) {
  if (!getConfig().collect_attr_cache_stats) {
    return;
  }
  std::string key = fmt::format("{}.{}", type.name(), name_);
  std::lock_guard<std::mutex> guard{stats_mutex_};
  auto& miss =
      cache_stats_.misses.insert({key, CacheMiss{0, reason}}).first->second;
  miss.count++;
  miss.reason = reason;
}

void LoadAttrCache::clearCacheStats() {
  std::lock_guard<std::mutex> guard{stats_mutex_};
  cache_stats_.misses.clear();
}

CacheStats LoadAttrCache::cacheStats() const {
  std::lock_guard<std::mutex> guard{stats_mutex_};
  return cache_stats_;
}

} // namespace attrcache
