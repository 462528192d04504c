// Copyright (c) Meta Platforms, Inc. and affiliates.

#pragma once

#include "attrcache/Common/util.h"
#include "attrcache/Jit/containers.h"
#include "attrcache/ObjectModel/descriptor.h"
#include "attrcache/ObjectModel/value.h"

#include <atomic>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace attrcache {

class Object;

// Hook run when normal lookup finds nothing (the host's __getattr__).
using FallbackHook =
    std::function<Value(Object& obj, const std::string& name)>;

// Hook that replaces normal lookup entirely (the host's __getattribute__).
using GetAttributeHook =
    std::function<Value(Object& obj, const std::string& name)>;

// A class-level attribute: either a plain value or a descriptor.  Immutable;
// replacing a class attribute installs a new TypeAttr.
class TypeAttr {
 public:
  explicit TypeAttr(Value value) : value_{std::move(value)} {}
  explicit TypeAttr(std::shared_ptr<Descriptor> descr)
      : descr_{std::move(descr)} {}

  DISALLOW_COPY_AND_ASSIGN(TypeAttr);

  bool isDescriptor() const {
    return descr_ != nullptr;
  }

  const Descriptor* descriptor() const {
    return descr_.get();
  }

  const std::shared_ptr<Descriptor>& descriptorRef() const {
    return descr_;
  }

  const Value& value() const {
    return value_;
  }

 private:
  Value value_;
  std::shared_ptr<Descriptor> descr_;
};

// Key table shared by the split instance dictionaries of one type.  Keys are
// only ever appended, so an index handed out stays valid for the life of the
// table.
class SharedKeys {
 public:
  static constexpr size_t kMaxSize = 30;

  SharedKeys() = default;

  DISALLOW_COPY_AND_ASSIGN(SharedKeys);

  std::optional<uint32_t> find(std::string_view name) const;

  // Return the index of name, adding it if there is room.  Returns nullopt
  // once the table is full.
  std::optional<uint32_t> findOrInsert(const std::string& name);

  std::string nameAt(uint32_t index) const;

  size_t size() const;

 private:
  mutable std::mutex mutex_;
  UnorderedMap<std::string, uint32_t> index_;
  std::vector<std::string> names_;
};

// A type in the host object model.
//
// Everything that can change after creation (namespace, bases, MRO, hooks) is
// guarded by the owning ObjectModel's metadata lock: readers hold it shared,
// ObjectModel mutations hold it exclusively.  The version tag and the
// identity fields can be read without it.
class Type : public std::enable_shared_from_this<Type> {
 public:
  ~Type();

  DISALLOW_COPY_AND_ASSIGN(Type);

  const std::string& name() const {
    return name_;
  }

  // Identity token for caches.  Never reused within a process, even when the
  // memory of a destroyed type is.
  uint64_t generation() const {
    return generation_;
  }

  // Live version tag.  0 means "never cache".
  uint32_t versionTag() const {
    return version_tag_.load(std::memory_order_acquire);
  }

  bool hasDict() const {
    return has_dict_;
  }

  // Slot layout, inherited slots first.  Fixed at creation.
  const std::vector<std::string>& slotNames() const {
    return slot_names_;
  }

  std::optional<uint32_t> slotIndex(std::string_view name) const;

  SharedKeys& sharedKeys() const {
    return *shared_keys_;
  }

  const std::shared_ptr<SharedKeys>& sharedKeysRef() const {
    return shared_keys_;
  }

  // The rest requires the metadata lock.

  const std::vector<std::shared_ptr<Type>>& bases() const {
    return bases_;
  }

  // Method resolution order, starting with this type.
  const std::vector<Type*>& mro() const {
    return mro_;
  }

  // Attribute defined directly on this type, or nullptr.
  const TypeAttr* lookupOwn(std::string_view name) const;

  // First definition of name along the MRO, or nullptr.
  const TypeAttr* lookup(std::string_view name) const;

  // Hooks found along the MRO, or nullptr.
  std::shared_ptr<const FallbackHook> fallbackHook() const;
  std::shared_ptr<const GetAttributeHook> getAttributeHook() const;

  bool isSubtypeOf(const Type& other) const;

  // Live subclasses, direct only.
  std::vector<std::shared_ptr<Type>> subclasses() const;

  // Number of times the version tag was reassigned.
  uint32_t versionBumps() const {
    return version_bumps_;
  }

 private:
  friend class ObjectModel;
  friend class VersionTagRegistry;

  Type(
      std::string name,
      std::vector<std::shared_ptr<Type>> bases,
      std::vector<std::string> own_slots,
      bool own_dict,
      std::vector<std::string> slot_names,
      bool has_dict);

  const std::string name_;
  const uint64_t generation_;
  std::atomic<uint32_t> version_tag_{0};
  uint32_t version_bumps_{0};
  // Set once the tag has been pinned to 0; it is never revived afterwards.
  bool tag_pinned_{false};

  std::vector<std::shared_ptr<Type>> bases_;
  std::vector<Type*> mro_;
  std::vector<std::weak_ptr<Type>> subclasses_;

  UnorderedMap<std::string, std::shared_ptr<const TypeAttr>> namespace_;
  std::shared_ptr<const FallbackHook> fallback_hook_;
  std::shared_ptr<const GetAttributeHook> getattribute_hook_;

  // Slots and dict requested by this type itself, as opposed to inherited.
  const std::vector<std::string> own_slots_;
  const bool own_dict_;
  const std::vector<std::string> slot_names_;
  UnorderedMap<std::string, uint32_t> slot_index_;
  const bool has_dict_;
  const std::shared_ptr<SharedKeys> shared_keys_;
};

} // namespace attrcache
