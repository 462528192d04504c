// Copyright (c) Meta Platforms, Inc. and affiliates.

#pragma once

#include "attrcache/Common/util.h"
#include "attrcache/Jit/attr_resolution.h"
#include "attrcache/Jit/containers.h"

#include <atomic>
#include <cstdint>
#include <cstring>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <type_traits>
#include <unordered_map>
#include <vector>

namespace attrcache {

class DeoptBridge;

// A cached resolution, guarded by the identity and version tag of the type it
// was computed for.  Immutable once built; caches replace entries wholesale.
struct CacheEntry {
  // Generation id of the type.  0 marks an empty entry.
  uint64_t generation{0};
  uint32_t version_tag{0};
  ResolutionKind kind{Absent{}};

  bool empty() const {
    return generation == 0;
  }

  // Both identity and tag must match.  A tag of 0 never matches.
  bool matches(uint64_t gen, uint32_t tag) const {
    return tag != 0 && generation == gen && version_tag == tag;
  }
};

static_assert(std::is_trivially_copyable_v<CacheEntry>);

// Storage for one CacheEntry that many threads read while one thread at a time
// writes.  Readers never block: the entry is copied word by word between two
// reads of a sequence counter, and a copy that overlapped a write is thrown
// away.  Writers must be serialized by the caller.
class CacheCell {
 public:
  CacheCell();

  DISALLOW_COPY_AND_ASSIGN(CacheCell);

  // Copy the entry out.  Returns false if a concurrent write tore the copy.
  bool load(CacheEntry& out) const;

  void store(const CacheEntry& entry);

 private:
  static constexpr size_t kWords =
      (sizeof(CacheEntry) + sizeof(uint64_t) - 1) / sizeof(uint64_t);

  std::atomic<uint32_t> seq_{0};
  std::atomic<uint64_t> words_[kWords];
};

// The cache of a monomorphic call site: zero or one entry.
class CacheSlot {
 public:
  CacheSlot() = default;

  DISALLOW_COPY_AND_ASSIGN(CacheSlot);

  // Guard evaluation.  Lock-free and free of side effects.
  std::optional<CacheEntry> lookup(uint64_t generation, uint32_t tag) const;

  // Copy of the current entry, whatever its guard.  False if torn.
  bool peek(CacheEntry& out) const;

  // Current entry, for writers.  Requires the owner's fill lock.
  CacheEntry entry() const;

  void install(const CacheEntry& entry);
  void clear();

 private:
  CacheCell cell_;
};

// Bounded set of entries for a polymorphic call site.  New entries go to the
// front; when full, the oldest entry is evicted (FIFO).  Lookup scans from the
// most recent entry to the oldest.
class PolymorphicCache {
 public:
  explicit PolymorphicCache(uint32_t capacity);

  DISALLOW_COPY_AND_ASSIGN(PolymorphicCache);

  uint32_t capacity() const {
    return capacity_;
  }

  uint32_t size() const {
    return count_.load(std::memory_order_acquire);
  }

  // Guard evaluation.  Lock-free and free of side effects.
  std::optional<CacheEntry> lookup(uint64_t generation, uint32_t tag) const;

  // The rest requires the owner's fill lock.

  // Position of the entry cached for the given type generation, if any.
  std::optional<uint32_t> findGeneration(uint64_t generation) const;

  // Insert at the front.  Returns true if the oldest entry was evicted to make
  // room.
  bool insert(const CacheEntry& entry);

  // Overwrite the entry at pos in place.
  void replace(uint32_t pos, const CacheEntry& entry);

  // Entries from most to least recent.
  std::vector<CacheEntry> entries() const;

 private:
  // Position of the i-th most recent entry.
  uint32_t position(uint32_t head, uint32_t i) const {
    return (head + capacity_ - i) % capacity_;
  }

  const uint32_t capacity_;
  std::unique_ptr<CacheCell[]> cells_;
  // Position of the most recent entry.
  std::atomic<uint32_t> head_{0};
  std::atomic<uint32_t> count_{0};
};

#define FOREACH_CACHE_MISS_REASON(V) \
  V(Empty)                           \
  V(WrongType)                       \
  V(StaleVersion)                    \
  V(UncacheableType)                 \
  V(CustomGetAttribute)              \
  V(FallbackHook)                    \
  V(AttributeNotFound)

enum class CacheMissReason {
#define DECLARE_CACHE_MISS_REASON(name) k##name,
  FOREACH_CACHE_MISS_REASON(DECLARE_CACHE_MISS_REASON)
#undef DECLARE_CACHE_MISS_REASON
};

std::string_view cacheMissReason(CacheMissReason reason);

struct CacheMiss {
  int count{0};
  CacheMissReason reason{CacheMissReason::kEmpty};
};

struct CacheStats {
  std::string call_site;
  std::string attr_name;
  std::unordered_map<std::string, CacheMiss> misses;
};

enum class CacheState : uint8_t {
  kEmpty,
  kMonomorphic,
  kPolymorphic,
};

std::string_view cacheStateName(CacheState state);

// A cache for an individual guarded attribute access.
//
// The logic of LoadAttrCache::invoke is equivalent to
// ObjectModel::genericGetAttr.  A call site starts empty, becomes monomorphic
// on its first fill and polymorphic once it has seen a second type.  It never
// goes back: once polymorphic, misses are folded into the polymorphic cache
// instead of respecializing the call site for a single type.
class LoadAttrCache {
 public:
  LoadAttrCache(
      std::string call_site,
      std::string name,
      uint32_t capacity,
      DeoptBridge& bridge);

  DISALLOW_COPY_AND_ASSIGN(LoadAttrCache);

  static Value invoke(LoadAttrCache* cache, Object& obj);

  const std::string& callSite() const {
    return call_site_;
  }

  const std::string& name() const {
    return name_;
  }

  CacheState state() const {
    return state_.load(std::memory_order_acquire);
  }

  // Guard evaluation over whichever cache the current state uses.
  std::optional<CacheEntry> lookup(uint64_t generation, uint32_t tag) const;

  // Why lookup() failed for the given guard key.
  CacheMissReason classifyMiss(uint64_t generation, uint32_t tag) const;

  size_t entryCount() const;
  uint64_t missCount() const {
    return miss_count_.load(std::memory_order_relaxed);
  }
  uint64_t evictionCount() const {
    return eviction_count_.load(std::memory_order_relaxed);
  }
  uint64_t respecializationCount() const {
    return respecialization_count_.load(std::memory_order_relaxed);
  }

  // Fill operations, used by DeoptBridge.  All of them require fillLock().

  std::unique_lock<std::mutex> fillLock() {
    return std::unique_lock<std::mutex>{fill_mutex_};
  }

  const CacheSlot& monomorphic() const {
    return mono_;
  }

  const PolymorphicCache& polymorphic() const {
    return poly_;
  }

  void installMonomorphic(const CacheEntry& entry);
  void refreshMonomorphic(const CacheEntry& entry);
  void promoteToPolymorphic(const CacheEntry& entry);
  void insertPolymorphic(const CacheEntry& entry);
  void replacePolymorphic(uint32_t pos, const CacheEntry& entry);

  void recordMiss(const Type& type, CacheMissReason reason);

  void clearCacheStats();
  CacheStats cacheStats() const;

 private:
  Value invokeSlowPath(Object& obj, CacheMissReason reason);

  const std::string call_site_;
  const std::string name_;
  DeoptBridge& bridge_;

  std::atomic<CacheState> state_{CacheState::kEmpty};
  CacheSlot mono_;
  PolymorphicCache poly_;

  // Serializes writers.  Guard evaluation never takes it.
  std::mutex fill_mutex_;

  std::atomic<uint64_t> miss_count_{0};
  std::atomic<uint64_t> eviction_count_{0};
  std::atomic<uint64_t> respecialization_count_{0};

  mutable std::mutex stats_mutex_;
  CacheStats cache_stats_;
};

} // namespace attrcache
