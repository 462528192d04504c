// Copyright (c) Meta Platforms, Inc. and affiliates.

#pragma once

#include "attrcache/Common/util.h"
#include "attrcache/Jit/version_tag.h"
#include "attrcache/ObjectModel/descriptor.h"
#include "attrcache/ObjectModel/errors.h"
#include "attrcache/ObjectModel/object.h"
#include "attrcache/ObjectModel/retire_list.h"
#include "attrcache/ObjectModel/type.h"
#include "attrcache/ObjectModel/value.h"

#include <cstddef>
#include <memory>
#include <optional>
#include <shared_mutex>
#include <string>
#include <vector>

namespace attrcache {

// The host object model: creates types, objects and descriptors, and performs
// every mutation of type metadata.
//
// Type metadata is guarded by a single reader/writer lock.  Attribute
// resolution holds it shared; mutations hold it exclusively and, for every
// change that can affect resolution, bump the version tag of the mutated type
// through the VersionTagRegistry before releasing it.  User hooks (descriptor
// getters and setters, fallback and __getattribute__ hooks) are always called
// without the lock held.
//
// Attributes, bases and types unlinked by a mutation go through a RetireList,
// so code that keeps raw pointers past the lock must run in a readSection().
class ObjectModel {
 public:
  explicit ObjectModel(VersionTagRegistry& registry);

  DISALLOW_COPY_AND_ASSIGN(ObjectModel);

  VersionTagRegistry& registry() {
    return registry_;
  }

  std::shared_lock<std::shared_mutex> readLock() const {
    return std::shared_lock<std::shared_mutex>{metadata_mutex_};
  }

  RetireList::ReadSection readSection() const {
    return RetireList::ReadSection{retired_};
  }

  // Unlinked metadata not yet freed.
  size_t retiredCount() const;

  // Create a type.  Without slots, instances get an instance dictionary.
  // With slots, they only get one when a base provides it.  Throws
  // std::invalid_argument for an inconsistent MRO or an instance layout
  // conflict between bases.
  std::shared_ptr<Type> makeType(
      std::string name,
      std::vector<std::shared_ptr<Type>> bases = {},
      std::optional<std::vector<std::string>> slots = std::nullopt);

  std::shared_ptr<Object> makeObject(std::shared_ptr<Type> type);

  const DescriptorClass* makeDescriptorClass(
      std::string name,
      DescriptorClass::Getter getter,
      DescriptorClass::Setter setter = nullptr);

  std::shared_ptr<Descriptor> makeDescriptor(
      const DescriptorClass* cls,
      Value payload = none());

  // Type mutation.

  void setTypeAttr(Type& type, const std::string& name, Value value);
  void setTypeAttr(
      Type& type,
      const std::string& name,
      std::shared_ptr<Descriptor> descr);
  // Throws AttributeNotFound if type doesn't define name itself.
  void delTypeAttr(Type& type, const std::string& name);

  // Change the class of a descriptor.  Every type holding it is invalidated.
  void setDescriptorClass(Descriptor& descr, const DescriptorClass* cls);

  // Throws std::invalid_argument if the new bases would change the instance
  // layout or create a cycle.
  void setBases(Type& type, std::vector<std::shared_ptr<Type>> bases);

  // Install or, with nullptr, remove a hook.
  void setFallbackHook(Type& type, FallbackHook hook);
  void setGetAttributeHook(Type& type, GetAttributeHook hook);

  // Force a new version tag on type and its subclasses.
  void invalidateType(Type& type);

  // Exhaust the version tag budget of type.
  void pinVersionTag(Type& type);

  // Object operations.

  // Full uncached attribute lookup.
  Value genericGetAttr(Object& obj, const std::string& name);

  void setAttr(Object& obj, const std::string& name, Value value);
  void delAttr(Object& obj, const std::string& name);

  // Throws std::invalid_argument if the layouts of the two types differ.
  void setClass(Object& obj, std::shared_ptr<Type> type);

  // Replace the instance dictionary.  The new one is always combined.
  void setDict(Object& obj, DictItems items);

 private:
  // Compute the C3 linearization of type from its current bases.
  static std::vector<Type*> computeMro(const Type& type);

  // Recompute the MRO of type and everything below it.  Requires the lock.
  static void updateMroHierarchy(Type& type);

  void setTypeAttrImpl(
      Type& type,
      const std::string& name,
      std::shared_ptr<const TypeAttr> attr);

  // Requires the lock held exclusively.
  void retire(std::shared_ptr<const void> object, RetireList::Garbage& garbage);

  static void addSubclass(Type& base, Type& sub);
  static void removeSubclass(Type& base, const Type& sub);

  mutable std::shared_mutex metadata_mutex_;
  VersionTagRegistry& registry_;
  std::vector<std::unique_ptr<DescriptorClass>> descr_classes_;
  // Every type ever created, to find the holders of a descriptor.
  std::vector<std::weak_ptr<Type>> types_;
  RetireList retired_;
};

} // namespace attrcache
