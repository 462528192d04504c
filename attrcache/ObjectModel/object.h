// Copyright (c) Meta Platforms, Inc. and affiliates.

#pragma once

#include "attrcache/Common/util.h"
#include "attrcache/Jit/containers.h"
#include "attrcache/ObjectModel/type.h"
#include "attrcache/ObjectModel/value.h"

#include <atomic>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace attrcache {

using DictItems = UnorderedMap<std::string, Value>;

// An instance in the host object model: a type reference, a fixed slot array
// sized by the type's layout and, if the type allows it, an instance
// dictionary.
//
// The instance dictionary starts out split: values are indexed through the
// type's SharedKeys.  It becomes combined (keyed by name) when a key doesn't
// fit in the shared table, when the dictionary is replaced wholesale, or when
// the object changes type.
//
// Storage accessors take the object's own lock and never call back into user
// code.
class Object : public std::enable_shared_from_this<Object> {
 public:
  DISALLOW_COPY_AND_ASSIGN(Object);

  // Current type.  Types the object used to have stay alive as long as the
  // object does, so the returned pointer is valid while the caller holds a
  // reference to the object.
  Type* type() const {
    return type_.load(std::memory_order_acquire);
  }

  std::shared_ptr<Type> typeRef() const;

  std::optional<Value> getSlot(uint32_t index) const;
  void setSlot(uint32_t index, std::optional<Value> value);

  bool hasDict() const {
    return has_dict_;
  }

  bool isSplitDict() const;

  std::optional<Value> dictGet(std::string_view name) const;

  // Lookup with a precomputed shared key index.  Falls back to a lookup by
  // name when the dictionary is combined.
  std::optional<Value> dictGetSplit(uint32_t index, std::string_view name)
      const;

  void dictSet(const std::string& name, Value value);
  bool dictDel(const std::string& name);

  DictItems dictItems() const;

 private:
  friend class ObjectModel;

  explicit Object(std::shared_ptr<Type> type);

  // Requires mutex_.
  void combineDictLocked();

  mutable std::mutex mutex_;
  std::atomic<Type*> type_;
  std::shared_ptr<Type> type_ref_;

  std::vector<std::optional<Value>> slots_;

  const bool has_dict_;
  // Non-null while the dictionary is split.
  std::shared_ptr<SharedKeys> keys_;
  std::vector<std::optional<Value>> split_values_;
  DictItems combined_;
};

} // namespace attrcache
