// Copyright (c) Meta Platforms, Inc. and affiliates.

#include "attrcache/ObjectModel/object_model.h"

#include "attrcache/Common/log.h"

#include <algorithm>
#include <deque>
#include <mutex>
#include <stdexcept>
#include <utility>

namespace attrcache {

namespace {

struct Layout {
  std::vector<std::string> slot_names;
  bool has_dict{false};
};

// Combine the instance layouts of bases with the slots a type declares
// itself.  At most one base may contribute slots.
Layout computeLayout(
    const std::string& name,
    const std::vector<std::shared_ptr<Type>>& bases,
    const std::vector<std::string>& own_slots,
    bool own_dict) {
  Layout layout;
  const Type* solid_base = nullptr;
  for (const auto& base : bases) {
    layout.has_dict |= base->hasDict();
    if (base->slotNames().empty()) {
      continue;
    }
    if (solid_base == nullptr) {
      solid_base = base.get();
      layout.slot_names = base->slotNames();
    } else if (base->slotNames() != solid_base->slotNames()) {
      throw std::invalid_argument{fmt::format(
          "'{}': multiple bases have instance lay-out conflict ('{}' and "
          "'{}')",
          name,
          solid_base->name(),
          base->name())};
    }
  }
  for (const std::string& slot : own_slots) {
    if (std::find(layout.slot_names.begin(), layout.slot_names.end(), slot) ==
        layout.slot_names.end()) {
      layout.slot_names.push_back(slot);
    }
  }
  layout.has_dict |= own_dict;
  return layout;
}

std::string joinNames(const std::vector<std::shared_ptr<Type>>& types) {
  std::string result;
  for (const auto& type : types) {
    if (!result.empty()) {
      result += ", ";
    }
    result += type->name();
  }
  return result;
}

} // namespace

ObjectModel::ObjectModel(VersionTagRegistry& registry) : registry_{registry} {}

size_t ObjectModel::retiredCount() const {
  auto guard = readLock();
  return retired_.size();
}

void ObjectModel::retire(
    std::shared_ptr<const void> object,
    RetireList::Garbage& garbage) {
  retired_.retire(std::move(object));
  retired_.collect(garbage);
}

std::vector<Type*> ObjectModel::computeMro(const Type& type) {
  std::vector<std::deque<Type*>> seqs;
  for (const auto& base : type.bases_) {
    seqs.emplace_back(base->mro_.begin(), base->mro_.end());
  }
  std::deque<Type*> bases;
  for (const auto& base : type.bases_) {
    bases.push_back(base.get());
  }
  seqs.push_back(std::move(bases));

  std::vector<Type*> result{const_cast<Type*>(&type)};
  auto in_tail = [&](Type* candidate) {
    for (const auto& seq : seqs) {
      if (std::find(seq.begin() + (seq.empty() ? 0 : 1), seq.end(), candidate) !=
          seq.end()) {
        return true;
      }
    }
    return false;
  };

  for (;;) {
    seqs.erase(
        std::remove_if(
            seqs.begin(), seqs.end(), [](auto& seq) { return seq.empty(); }),
        seqs.end());
    if (seqs.empty()) {
      return result;
    }
    Type* next = nullptr;
    for (const auto& seq : seqs) {
      if (!in_tail(seq.front())) {
        next = seq.front();
        break;
      }
    }
    if (next == nullptr) {
      throw std::invalid_argument{fmt::format(
          "Cannot create a consistent method resolution order (MRO) for bases "
          "{}",
          joinNames(type.bases_))};
    }
    if (next == &type) {
      throw std::invalid_argument{fmt::format(
          "'{}': a base class causes an inheritance cycle", type.name())};
    }
    result.push_back(next);
    for (auto& seq : seqs) {
      if (!seq.empty() && seq.front() == next) {
        seq.pop_front();
      }
    }
  }
}

void ObjectModel::updateMroHierarchy(Type& type) {
  UnorderedSet<Type*> visited;
  std::deque<std::shared_ptr<Type>> worklist;
  type.mro_ = computeMro(type);
  visited.insert(&type);
  for (auto& sub : type.subclasses()) {
    worklist.push_back(std::move(sub));
  }
  while (!worklist.empty()) {
    std::shared_ptr<Type> current = std::move(worklist.front());
    worklist.pop_front();
    if (!visited.insert(current.get()).second) {
      continue;
    }
    current->mro_ = computeMro(*current);
    for (auto& sub : current->subclasses()) {
      worklist.push_back(std::move(sub));
    }
  }
}

void ObjectModel::addSubclass(Type& base, Type& sub) {
  auto& subs = base.subclasses_;
  subs.erase(
      std::remove_if(
          subs.begin(), subs.end(), [](auto& weak) { return weak.expired(); }),
      subs.end());
  subs.push_back(sub.weak_from_this());
}

void ObjectModel::removeSubclass(Type& base, const Type& sub) {
  auto& subs = base.subclasses_;
  subs.erase(
      std::remove_if(
          subs.begin(),
          subs.end(),
          [&](auto& weak) {
            auto locked = weak.lock();
            return locked == nullptr || locked.get() == &sub;
          }),
      subs.end());
}

std::shared_ptr<Type> ObjectModel::makeType(
    std::string name,
    std::vector<std::shared_ptr<Type>> bases,
    std::optional<std::vector<std::string>> slots) {
  for (size_t i = 0; i < bases.size(); i++) {
    ATTRCACHE_CHECK(bases[i] != nullptr, "Null base for type '{}'", name);
    for (size_t j = i + 1; j < bases.size(); j++) {
      if (bases[i] == bases[j]) {
        throw std::invalid_argument{
            fmt::format("duplicate base class {}", bases[i]->name())};
      }
    }
  }

  std::vector<std::string> own_slots;
  bool own_dict = !slots.has_value();
  if (slots.has_value()) {
    for (std::string& slot : *slots) {
      if (slot == "__dict__") {
        own_dict = true;
        continue;
      }
      if (std::find(own_slots.begin(), own_slots.end(), slot) !=
          own_slots.end()) {
        throw std::invalid_argument{fmt::format(
            "'{}': duplicate slot name '{}' in __slots__", name, slot)};
      }
      own_slots.push_back(std::move(slot));
    }
  }

  std::unique_lock<std::shared_mutex> guard{metadata_mutex_};
  Layout layout = computeLayout(name, bases, own_slots, own_dict);
  std::shared_ptr<Type> type{new Type{
      std::move(name),
      std::move(bases),
      std::move(own_slots),
      own_dict,
      std::move(layout.slot_names),
      layout.has_dict}};
  type->mro_ = computeMro(*type);
  for (const auto& base : type->bases_) {
    addSubclass(*base, *type);
  }
  registry_.assign(*type);

  types_.erase(
      std::remove_if(
          types_.begin(),
          types_.end(),
          [](auto& weak) { return weak.expired(); }),
      types_.end());
  types_.push_back(type);

  ATTRCACHE_DLOG(
      "Created type '{}' (generation {}, tag {})",
      type->name(),
      type->generation(),
      type->versionTag());
  return type;
}

std::shared_ptr<Object> ObjectModel::makeObject(std::shared_ptr<Type> type) {
  ATTRCACHE_CHECK(type != nullptr, "Cannot create an object without a type");
  return std::shared_ptr<Object>{new Object{std::move(type)}};
}

const DescriptorClass* ObjectModel::makeDescriptorClass(
    std::string name,
    DescriptorClass::Getter getter,
    DescriptorClass::Setter setter) {
  auto cls = std::make_unique<DescriptorClass>(
      std::move(name), std::move(getter), std::move(setter));
  std::unique_lock<std::shared_mutex> guard{metadata_mutex_};
  descr_classes_.push_back(std::move(cls));
  return descr_classes_.back().get();
}

std::shared_ptr<Descriptor> ObjectModel::makeDescriptor(
    const DescriptorClass* cls,
    Value payload) {
  return std::make_shared<Descriptor>(cls, std::move(payload));
}

void ObjectModel::setTypeAttrImpl(
    Type& type,
    const std::string& name,
    std::shared_ptr<const TypeAttr> attr) {
  // Declared before the guard so it is destroyed after the lock is released.
  RetireList::Garbage garbage;
  std::unique_lock<std::shared_mutex> guard{metadata_mutex_};
  auto it = type.namespace_.find(name);
  std::shared_ptr<const TypeAttr> old_attr;
  if (it != type.namespace_.end()) {
    old_attr = std::exchange(it->second, std::move(attr));
  } else {
    type.namespace_.emplace(name, std::move(attr));
  }
  registry_.bump(type);
  if (old_attr != nullptr) {
    retire(std::move(old_attr), garbage);
  }
}

void ObjectModel::setTypeAttr(Type& type, const std::string& name, Value value) {
  setTypeAttrImpl(type, name, std::make_shared<const TypeAttr>(std::move(value)));
}

void ObjectModel::setTypeAttr(
    Type& type,
    const std::string& name,
    std::shared_ptr<Descriptor> descr) {
  ATTRCACHE_CHECK(descr != nullptr, "Null descriptor for '{}'", name);
  setTypeAttrImpl(type, name, std::make_shared<const TypeAttr>(std::move(descr)));
}

void ObjectModel::delTypeAttr(Type& type, const std::string& name) {
  RetireList::Garbage garbage;
  std::unique_lock<std::shared_mutex> guard{metadata_mutex_};
  auto it = type.namespace_.find(name);
  if (it == type.namespace_.end()) {
    throw AttributeNotFound::onType(type.name(), name);
  }
  std::shared_ptr<const TypeAttr> old_attr = std::move(it->second);
  type.namespace_.erase(it);
  registry_.bump(type);
  retire(std::move(old_attr), garbage);
}

void ObjectModel::setDescriptorClass(
    Descriptor& descr,
    const DescriptorClass* cls) {
  ATTRCACHE_CHECK(cls != nullptr, "Descriptor needs a class");
  std::unique_lock<std::shared_mutex> guard{metadata_mutex_};
  descr.setDescrClass(cls);
  for (const auto& weak : types_) {
    auto type = weak.lock();
    if (type == nullptr) {
      continue;
    }
    for (const auto& [name, attr] : type->namespace_) {
      if (attr->descriptor() == &descr) {
        ATTRCACHE_DLOG(
            "Descriptor '{}.{}' changed class to '{}'",
            type->name(),
            name,
            cls->name());
        registry_.bump(*type);
        break;
      }
    }
  }
}

void ObjectModel::setBases(
    Type& type,
    std::vector<std::shared_ptr<Type>> bases) {
  RetireList::Garbage garbage;
  std::unique_lock<std::shared_mutex> guard{metadata_mutex_};
  for (const auto& base : bases) {
    ATTRCACHE_CHECK(base != nullptr, "Null base for type '{}'", type.name());
    if (base->isSubtypeOf(type)) {
      throw std::invalid_argument{fmt::format(
          "a __bases__ item causes an inheritance cycle ('{}' is a subclass "
          "of '{}')",
          base->name(),
          type.name())};
    }
  }
  Layout layout =
      computeLayout(type.name(), bases, type.own_slots_, type.own_dict_);
  if (layout.slot_names != type.slot_names_ ||
      layout.has_dict != type.has_dict_) {
    throw std::invalid_argument{fmt::format(
        "__bases__ assignment: '{}' object layout differs from '{}'",
        joinNames(bases),
        joinNames(type.bases_))};
  }

  std::vector<std::shared_ptr<Type>> old_bases = std::move(type.bases_);
  type.bases_ = std::move(bases);
  try {
    updateMroHierarchy(type);
  } catch (const std::invalid_argument&) {
    type.bases_ = std::move(old_bases);
    updateMroHierarchy(type);
    throw;
  }

  for (const auto& base : old_bases) {
    removeSubclass(*base, type);
  }
  for (const auto& base : type.bases_) {
    addSubclass(*base, type);
  }
  registry_.bump(type);
  for (auto& base : old_bases) {
    retire(std::move(base), garbage);
  }
}

void ObjectModel::setFallbackHook(Type& type, FallbackHook hook) {
  std::unique_lock<std::shared_mutex> guard{metadata_mutex_};
  type.fallback_hook_ = hook == nullptr
      ? nullptr
      : std::make_shared<const FallbackHook>(std::move(hook));
  registry_.bump(type);
}

void ObjectModel::setGetAttributeHook(Type& type, GetAttributeHook hook) {
  std::unique_lock<std::shared_mutex> guard{metadata_mutex_};
  type.getattribute_hook_ = hook == nullptr
      ? nullptr
      : std::make_shared<const GetAttributeHook>(std::move(hook));
  registry_.bump(type);
}

void ObjectModel::invalidateType(Type& type) {
  std::unique_lock<std::shared_mutex> guard{metadata_mutex_};
  registry_.bump(type);
}

void ObjectModel::pinVersionTag(Type& type) {
  std::unique_lock<std::shared_mutex> guard{metadata_mutex_};
  registry_.pin(type);
}

Value ObjectModel::genericGetAttr(Object& obj, const std::string& name) {
  auto section = readSection();
  Type* type;
  const TypeAttr* attr = nullptr;
  std::optional<uint32_t> slot;
  std::shared_ptr<const GetAttributeHook> getattribute;
  std::shared_ptr<const FallbackHook> fallback;
  {
    auto guard = readLock();
    type = obj.type();
    getattribute = type->getAttributeHook();
    fallback = type->fallbackHook();
    attr = type->lookup(name);
    slot = type->slotIndex(name);
  }

  if (getattribute != nullptr) {
    return (*getattribute)(obj, name);
  }

  try {
    if (attr != nullptr && attr->isDescriptor() &&
        attr->descriptor()->isData()) {
      return attr->descriptor()->get(obj);
    }
    if (slot.has_value()) {
      if (auto value = obj.getSlot(*slot)) {
        return *value;
      }
      throw AttributeNotFound{type->name(), name};
    }
    if (auto value = obj.dictGet(name)) {
      return *value;
    }
    if (attr != nullptr) {
      return attr->isDescriptor() ? attr->descriptor()->get(obj)
                                  : attr->value();
    }
    throw AttributeNotFound{type->name(), name};
  } catch (const AttributeNotFound&) {
    if (fallback == nullptr) {
      throw;
    }
  }
  return (*fallback)(obj, name);
}

void ObjectModel::setAttr(Object& obj, const std::string& name, Value value) {
  auto section = readSection();
  Type* type;
  const TypeAttr* attr = nullptr;
  std::optional<uint32_t> slot;
  {
    auto guard = readLock();
    type = obj.type();
    attr = type->lookup(name);
    slot = type->slotIndex(name);
  }

  if (attr != nullptr && attr->isDescriptor() &&
      attr->descriptor()->isData()) {
    attr->descriptor()->set(obj, value);
    return;
  }
  if (slot.has_value()) {
    obj.setSlot(*slot, std::move(value));
    return;
  }
  if (obj.hasDict()) {
    obj.dictSet(name, std::move(value));
    return;
  }
  throw AttributeNotFound{type->name(), name};
}

void ObjectModel::delAttr(Object& obj, const std::string& name) {
  auto section = readSection();
  Type* type;
  const TypeAttr* attr = nullptr;
  std::optional<uint32_t> slot;
  {
    auto guard = readLock();
    type = obj.type();
    attr = type->lookup(name);
    slot = type->slotIndex(name);
  }

  if (attr != nullptr && attr->isDescriptor() &&
      attr->descriptor()->isData()) {
    throw std::logic_error{fmt::format(
        "cannot delete '{}' of '{}' object through descriptor '{}'",
        name,
        type->name(),
        attr->descriptor()->descrClass()->name())};
  }
  if (slot.has_value()) {
    if (!obj.getSlot(*slot).has_value()) {
      throw AttributeNotFound{type->name(), name};
    }
    obj.setSlot(*slot, std::nullopt);
    return;
  }
  if (!obj.dictDel(name)) {
    throw AttributeNotFound{type->name(), name};
  }
}

void ObjectModel::setClass(Object& obj, std::shared_ptr<Type> type) {
  ATTRCACHE_CHECK(type != nullptr, "Cannot assign a null __class__");
  RetireList::Garbage garbage;
  std::unique_lock<std::shared_mutex> guard{metadata_mutex_};
  Type* old_type = obj.type();
  if (old_type == type.get()) {
    return;
  }
  if (old_type->slotNames() != type->slotNames() ||
      old_type->hasDict() != type->hasDict()) {
    throw std::invalid_argument{fmt::format(
        "__class__ assignment: '{}' object layout differs from '{}'",
        type->name(),
        old_type->name())};
  }

  std::lock_guard<std::mutex> obj_guard{obj.mutex_};
  // The split dictionary is keyed by the old type's shared keys.
  obj.combineDictLocked();
  std::shared_ptr<Type> old_ref = std::exchange(obj.type_ref_, std::move(type));
  obj.type_.store(obj.type_ref_.get(), std::memory_order_release);
  retire(std::move(old_ref), garbage);
}

void ObjectModel::setDict(Object& obj, DictItems items) {
  if (!obj.hasDict()) {
    throw std::invalid_argument{fmt::format(
        "'{}' object has no attribute '__dict__'", obj.type()->name())};
  }
  std::lock_guard<std::mutex> obj_guard{obj.mutex_};
  obj.keys_.reset();
  obj.split_values_.clear();
  obj.combined_ = std::move(items);
}

} // namespace attrcache
