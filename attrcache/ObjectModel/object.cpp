// Copyright (c) Meta Platforms, Inc. and affiliates.

#include "attrcache/ObjectModel/object.h"

#include "attrcache/Common/log.h"

namespace attrcache {

Object::Object(std::shared_ptr<Type> type)
    : type_{type.get()},
      type_ref_{type},
      slots_(type->slotNames().size()),
      has_dict_{type->hasDict()},
      keys_{type->hasDict() ? type->sharedKeysRef() : nullptr} {}

std::shared_ptr<Type> Object::typeRef() const {
  std::lock_guard<std::mutex> guard{mutex_};
  return type_ref_;
}

std::optional<Value> Object::getSlot(uint32_t index) const {
  std::lock_guard<std::mutex> guard{mutex_};
  ATTRCACHE_CHECK(index < slots_.size(), "Slot index {} out of range", index);
  return slots_[index];
}

void Object::setSlot(uint32_t index, std::optional<Value> value) {
  std::lock_guard<std::mutex> guard{mutex_};
  ATTRCACHE_CHECK(index < slots_.size(), "Slot index {} out of range", index);
  slots_[index] = std::move(value);
}

bool Object::isSplitDict() const {
  std::lock_guard<std::mutex> guard{mutex_};
  return keys_ != nullptr;
}

std::optional<Value> Object::dictGet(std::string_view name) const {
  std::lock_guard<std::mutex> guard{mutex_};
  if (!has_dict_) {
    return std::nullopt;
  }
  if (keys_ != nullptr) {
    auto index = keys_->find(name);
    if (!index.has_value() || *index >= split_values_.size()) {
      return std::nullopt;
    }
    return split_values_[*index];
  }
  auto it = combined_.find(std::string{name});
  if (it == combined_.end()) {
    return std::nullopt;
  }
  return it->second;
}

std::optional<Value> Object::dictGetSplit(
    uint32_t index,
    std::string_view name) const {
  {
    std::lock_guard<std::mutex> guard{mutex_};
    if (keys_ != nullptr) {
      if (index >= split_values_.size()) {
        return std::nullopt;
      }
      return split_values_[index];
    }
  }
  return dictGet(name);
}

void Object::dictSet(const std::string& name, Value value) {
  std::lock_guard<std::mutex> guard{mutex_};
  ATTRCACHE_CHECK(has_dict_, "Object has no instance dictionary");
  if (keys_ != nullptr) {
    auto index = keys_->findOrInsert(name);
    if (index.has_value()) {
      if (*index >= split_values_.size()) {
        split_values_.resize(*index + 1);
      }
      split_values_[*index] = std::move(value);
      return;
    }
    ATTRCACHE_DLOG(
        "Shared keys of '{}' are full, combining instance dictionary",
        type()->name());
    combineDictLocked();
  }
  combined_.insert_or_assign(name, std::move(value));
}

bool Object::dictDel(const std::string& name) {
  std::lock_guard<std::mutex> guard{mutex_};
  if (!has_dict_) {
    return false;
  }
  if (keys_ != nullptr) {
    auto index = keys_->find(name);
    if (!index.has_value() || *index >= split_values_.size() ||
        !split_values_[*index].has_value()) {
      return false;
    }
    split_values_[*index].reset();
    return true;
  }
  return combined_.erase(name) > 0;
}

DictItems Object::dictItems() const {
  std::lock_guard<std::mutex> guard{mutex_};
  if (keys_ == nullptr) {
    return combined_;
  }
  DictItems items;
  for (uint32_t i = 0; i < split_values_.size(); i++) {
    if (split_values_[i].has_value()) {
      items.emplace(keys_->nameAt(i), *split_values_[i]);
    }
  }
  return items;
}

void Object::combineDictLocked() {
  if (keys_ == nullptr) {
    return;
  }
  for (uint32_t i = 0; i < split_values_.size(); i++) {
    if (split_values_[i].has_value()) {
      combined_.insert_or_assign(keys_->nameAt(i), std::move(*split_values_[i]));
    }
  }
  split_values_.clear();
  keys_.reset();
}

} // namespace attrcache
