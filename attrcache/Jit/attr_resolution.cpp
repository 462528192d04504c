// Copyright (c) Meta Platforms, Inc. and affiliates.

#include "attrcache/Jit/attr_resolution.h"

#include "attrcache/Common/log.h"

namespace attrcache {

namespace {

template <class... Ts>
struct overloaded : Ts... {
  using Ts::operator()...;
};
template <class... Ts>
overloaded(Ts...) -> overloaded<Ts...>;

} // namespace

std::string_view resolutionKindName(const ResolutionKind& kind) {
  return std::visit(
      overloaded{
          [](const InstanceSlot&) -> std::string_view {
            return "InstanceSlot";
          },
          [](const InstanceDict& dict) -> std::string_view {
            return dict.variant == DictVariant::kSplit ? "InstanceDict(split)"
                                                       : "InstanceDict";
          },
          [](const DataDescriptor&) -> std::string_view {
            return "DataDescriptor";
          },
          [](const NonDataDescriptor&) -> std::string_view {
            return "NonDataDescriptor";
          },
          [](const ClassAttribute&) -> std::string_view {
            return "ClassAttribute";
          },
          [](const Absent&) -> std::string_view { return "Absent"; },
      },
      kind);
}

ResolutionKind ObjectModelAdapter::resolveLocked(
    const Type& type,
    const std::string& name) {
  const TypeAttr* attr = type.lookup(name);
  if (attr != nullptr && attr->isDescriptor() &&
      attr->descriptor()->isData()) {
    return DataDescriptor{attr->descriptor()};
  }
  if (auto slot = type.slotIndex(name)) {
    return InstanceSlot{*slot};
  }
  if (type.hasDict()) {
    auto index = type.sharedKeys().find(name);
    if (index.has_value()) {
      return InstanceDict{DictVariant::kSplit, *index, attr};
    }
    return InstanceDict{DictVariant::kCombined, 0, attr};
  }
  if (attr != nullptr) {
    if (attr->isDescriptor()) {
      return NonDataDescriptor{attr->descriptor()};
    }
    return ClassAttribute{&attr->value()};
  }
  return Absent{};
}

Resolution ObjectModelAdapter::resolve(Object& obj, const std::string& name)
    const {
  auto guard = model_.readLock();
  Resolution result;
  result.type = obj.type();
  result.generation = result.type->generation();
  // Mutations bump tags under the exclusive lock, so this tag is consistent
  // with the resolution below.
  result.version_tag = liveTag(*result.type);
  result.fallback = result.type->fallbackHook();
  result.getattribute = result.type->getAttributeHook();
  if (result.getattribute == nullptr) {
    result.kind = resolveLocked(*result.type, name);
  }
  return result;
}

std::vector<Type*> ObjectModelAdapter::mro(const Type& type) const {
  auto guard = model_.readLock();
  return type.mro();
}

std::optional<Value> ObjectModelAdapter::load(
    const ResolutionKind& kind,
    Object& obj,
    std::string_view name) {
  return std::visit(
      overloaded{
          [&](const InstanceSlot& slot) { return obj.getSlot(slot.offset); },
          [&](const InstanceDict& dict) -> std::optional<Value> {
            auto value = dict.variant == DictVariant::kSplit
                ? obj.dictGetSplit(dict.index, name)
                : obj.dictGet(name);
            if (value.has_value() || dict.shadowed == nullptr) {
              return value;
            }
            if (dict.shadowed->isDescriptor()) {
              return dict.shadowed->descriptor()->get(obj);
            }
            return dict.shadowed->value();
          },
          [&](const DataDescriptor& descr) -> std::optional<Value> {
            return descr.descr->get(obj);
          },
          [&](const NonDataDescriptor& descr) -> std::optional<Value> {
            return descr.descr->get(obj);
          },
          [&](const ClassAttribute& attr) -> std::optional<Value> {
            return *attr.value;
          },
          [&](const Absent&) -> std::optional<Value> { return std::nullopt; },
      },
      kind);
}

} // namespace attrcache
