// Copyright (c) Meta Platforms, Inc. and affiliates.

#include "attrcache/ObjectModel/type.h"

#include "attrcache/Common/log.h"

#include <algorithm>

namespace attrcache {

namespace {

// Generation ids start at 1 so that 0 can mark an empty cache entry.
std::atomic<uint64_t> s_next_generation{1};

} // namespace

std::optional<uint32_t> SharedKeys::find(std::string_view name) const {
  std::lock_guard<std::mutex> guard{mutex_};
  auto it = index_.find(std::string{name});
  if (it == index_.end()) {
    return std::nullopt;
  }
  return it->second;
}

std::optional<uint32_t> SharedKeys::findOrInsert(const std::string& name) {
  std::lock_guard<std::mutex> guard{mutex_};
  auto it = index_.find(name);
  if (it != index_.end()) {
    return it->second;
  }
  if (names_.size() >= kMaxSize) {
    return std::nullopt;
  }
  auto index = static_cast<uint32_t>(names_.size());
  names_.push_back(name);
  index_.emplace(name, index);
  return index;
}

std::string SharedKeys::nameAt(uint32_t index) const {
  std::lock_guard<std::mutex> guard{mutex_};
  ATTRCACHE_CHECK(index < names_.size(), "Shared key {} out of range", index);
  return names_[index];
}

size_t SharedKeys::size() const {
  std::lock_guard<std::mutex> guard{mutex_};
  return names_.size();
}

Type::Type(
    std::string name,
    std::vector<std::shared_ptr<Type>> bases,
    std::vector<std::string> own_slots,
    bool own_dict,
    std::vector<std::string> slot_names,
    bool has_dict)
    : name_{std::move(name)},
      generation_{s_next_generation.fetch_add(1, std::memory_order_relaxed)},
      bases_{std::move(bases)},
      own_slots_{std::move(own_slots)},
      own_dict_{own_dict},
      slot_names_{std::move(slot_names)},
      has_dict_{has_dict},
      shared_keys_{std::make_shared<SharedKeys>()} {
  for (uint32_t i = 0; i < slot_names_.size(); i++) {
    slot_index_.emplace(slot_names_[i], i);
  }
}

Type::~Type() {
  ATTRCACHE_DLOG("Destroying type '{}' (generation {})", name_, generation_);
}

std::optional<uint32_t> Type::slotIndex(std::string_view name) const {
  auto it = slot_index_.find(std::string{name});
  if (it == slot_index_.end()) {
    return std::nullopt;
  }
  return it->second;
}

const TypeAttr* Type::lookupOwn(std::string_view name) const {
  auto it = namespace_.find(std::string{name});
  if (it == namespace_.end()) {
    return nullptr;
  }
  return it->second.get();
}

const TypeAttr* Type::lookup(std::string_view name) const {
  for (const Type* type : mro_) {
    if (const TypeAttr* attr = type->lookupOwn(name)) {
      return attr;
    }
  }
  return nullptr;
}

std::shared_ptr<const FallbackHook> Type::fallbackHook() const {
  for (const Type* type : mro_) {
    if (type->fallback_hook_ != nullptr) {
      return type->fallback_hook_;
    }
  }
  return nullptr;
}

std::shared_ptr<const GetAttributeHook> Type::getAttributeHook() const {
  for (const Type* type : mro_) {
    if (type->getattribute_hook_ != nullptr) {
      return type->getattribute_hook_;
    }
  }
  return nullptr;
}

bool Type::isSubtypeOf(const Type& other) const {
  return std::find(mro_.begin(), mro_.end(), &other) != mro_.end();
}

std::vector<std::shared_ptr<Type>> Type::subclasses() const {
  std::vector<std::shared_ptr<Type>> result;
  for (const auto& weak : subclasses_) {
    if (auto sub = weak.lock()) {
      result.push_back(std::move(sub));
    }
  }
  return result;
}

} // namespace attrcache
