// Copyright (c) Meta Platforms, Inc. and affiliates.

#include "attrcache/ObjectModel/descriptor.h"

#include "attrcache/Common/log.h"

#include <stdexcept>

namespace attrcache {

DescriptorClass::DescriptorClass(
    std::string name,
    Getter getter,
    Setter setter)
    : name_{std::move(name)},
      getter_{std::move(getter)},
      setter_{std::move(setter)} {
  ATTRCACHE_CHECK(
      getter_ != nullptr, "Descriptor class '{}' needs a getter", name_);
}

Value DescriptorClass::get(const Descriptor& descr, Object& obj) const {
  return getter_(descr, obj);
}

void DescriptorClass::set(
    const Descriptor& descr,
    Object& obj,
    const Value& value) const {
  if (setter_ == nullptr) {
    throw std::logic_error{
        fmt::format("'{}' descriptor is read-only", name_)};
  }
  setter_(descr, obj, value);
}

Descriptor::Descriptor(const DescriptorClass* cls, Value payload)
    : cls_{cls}, payload_{std::move(payload)} {
  ATTRCACHE_CHECK(cls != nullptr, "Descriptor needs a class");
}

} // namespace attrcache
