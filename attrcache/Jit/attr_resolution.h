// Copyright (c) Meta Platforms, Inc. and affiliates.

#pragma once

#include "attrcache/ObjectModel/object_model.h"

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace attrcache {

// How an attribute is found for instances of one type.  Every alternative is
// trivially copyable so a resolution can be stored in a cache entry and read
// back word by word.

// Fixed slot in the instance layout.
struct InstanceSlot {
  uint32_t offset;
};

enum class DictVariant : uint8_t {
  // Look up through a precomputed index into the type's shared keys.
  kSplit,
  // Look up by name.
  kCombined,
};

// Instance dictionary.  When the dictionary doesn't hold the name, a
// non-data descriptor or class attribute it shadows answers instead.
struct InstanceDict {
  DictVariant variant;
  uint32_t index;
  const TypeAttr* shadowed;
};

// Descriptor with both read and write hooks.  Wins over instance storage.
struct DataDescriptor {
  const Descriptor* descr;
};

// Descriptor with only a read hook, on a type without an instance dictionary.
struct NonDataDescriptor {
  const Descriptor* descr;
};

// Plain class attribute, on a type without an instance dictionary.
struct ClassAttribute {
  const Value* value;
};

struct Absent {};

using ResolutionKind = std::variant<
    InstanceSlot,
    InstanceDict,
    DataDescriptor,
    NonDataDescriptor,
    ClassAttribute,
    Absent>;

std::string_view resolutionKindName(const ResolutionKind& kind);

// A full resolution of one attribute on one object, taken atomically with
// respect to type mutation.
struct Resolution {
  Type* type{nullptr};
  uint64_t generation{0};
  uint32_t version_tag{0};
  ResolutionKind kind{Absent{}};
  // Set when the type overrides __getattribute__.  kind is Absent then.
  std::shared_ptr<const GetAttributeHook> getattribute;
  std::shared_ptr<const FallbackHook> fallback;
};

// Thin shim between the caches and the host object model.  Computes
// resolution kinds following the descriptor protocol:
//
//   1. The first definition of the name along the MRO, if it is a data
//      descriptor.
//   2. Instance storage: a slot, or the instance dictionary.
//   3. A non-data descriptor or plain class attribute.
//   4. Absent.
class ObjectModelAdapter {
 public:
  explicit ObjectModelAdapter(ObjectModel& model) : model_{model} {}

  ObjectModel& model() {
    return model_;
  }

  // Resolve name on the current type of obj, together with the type's
  // identity and version tag.  Takes the metadata lock shared.
  Resolution resolve(Object& obj, const std::string& name) const;

  // Type-level resolution.  Requires the metadata lock.
  static ResolutionKind resolveLocked(const Type& type, const std::string& name);

  uint32_t liveTag(const Type& type) const {
    return model_.registry().currentTag(type);
  }

  std::vector<Type*> mro(const Type& type) const;

  // Perform the access described by kind.  Returns nullopt when instance
  // storage doesn't hold the attribute and nothing at class level answers for
  // it.  Descriptor getters run here and may throw.
  static std::optional<Value>
  load(const ResolutionKind& kind, Object& obj, std::string_view name);

 private:
  ObjectModel& model_;
};

} // namespace attrcache
