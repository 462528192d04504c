// Copyright (c) Meta Platforms, Inc. and affiliates.

#pragma once

#include "attrcache/Common/util.h"
#include "attrcache/ObjectModel/value.h"

#include <atomic>
#include <functional>
#include <string>

namespace attrcache {

class Descriptor;
class Object;

// The behaviour shared by a family of descriptors: a read hook and an optional
// write hook.  A class that defines both produces data descriptors, which take
// precedence over instance storage; a read-only class produces non-data
// descriptors, which instance storage shadows.
//
// Descriptor classes are owned by the ObjectModel that created them and live
// as long as it does.
class DescriptorClass {
 public:
  using Getter = std::function<Value(const Descriptor& descr, Object& obj)>;
  using Setter = std::function<
      void(const Descriptor& descr, Object& obj, const Value& value)>;

  DescriptorClass(std::string name, Getter getter, Setter setter = nullptr);

  DISALLOW_COPY_AND_ASSIGN(DescriptorClass);

  const std::string& name() const {
    return name_;
  }

  bool isData() const {
    return setter_ != nullptr;
  }

  Value get(const Descriptor& descr, Object& obj) const;
  void set(const Descriptor& descr, Object& obj, const Value& value) const;

 private:
  std::string name_;
  Getter getter_;
  Setter setter_;
};

// A descriptor instance stored in a type's namespace.  Its class can be
// swapped at runtime through ObjectModel::setDescriptorClass(), which may turn
// a data descriptor into a non-data one or vice versa.
class Descriptor {
 public:
  Descriptor(const DescriptorClass* cls, Value payload);

  DISALLOW_COPY_AND_ASSIGN(Descriptor);

  const DescriptorClass* descrClass() const {
    return cls_.load(std::memory_order_acquire);
  }

  bool isData() const {
    return descrClass()->isData();
  }

  // Per-instance state handed to the class hooks.
  const Value& payload() const {
    return payload_;
  }

  Value get(Object& obj) const {
    return descrClass()->get(*this, obj);
  }

  void set(Object& obj, const Value& value) const {
    descrClass()->set(*this, obj, value);
  }

 private:
  friend class ObjectModel;

  void setDescrClass(const DescriptorClass* cls) {
    cls_.store(cls, std::memory_order_release);
  }

  std::atomic<const DescriptorClass*> cls_;
  const Value payload_;
};

} // namespace attrcache
