// Copyright (c) Meta Platforms, Inc. and affiliates.

#pragma once

#include <stdexcept>
#include <string>

namespace attrcache {

// Raised when an attribute lookup finds nothing after full resolution and no
// fallback hook produced a value.
class AttributeNotFound : public std::runtime_error {
 public:
  AttributeNotFound(std::string type_name, std::string attr_name);

  // Same, for a lookup on the type object itself rather than an instance.
  static AttributeNotFound onType(std::string type_name, std::string attr_name);

  // Raised from inside a descriptor getter, which does not know the name it
  // is stored under.  Carries the getter's own message.
  static AttributeNotFound fromGetter(
      std::string type_name,
      const std::string& message);

  const std::string& typeName() const {
    return type_name_;
  }

  const std::string& attrName() const {
    return attr_name_;
  }

 private:
  AttributeNotFound(
      std::string type_name,
      std::string attr_name,
      const std::string& message);

  std::string type_name_;
  std::string attr_name_;
};

} // namespace attrcache
