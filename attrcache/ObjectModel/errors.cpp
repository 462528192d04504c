// Copyright (c) Meta Platforms, Inc. and affiliates.

#include "attrcache/ObjectModel/errors.h"

#include <fmt/format.h>

namespace attrcache {

AttributeNotFound::AttributeNotFound(
    std::string type_name,
    std::string attr_name)
    : std::runtime_error{fmt::format(
          "'{}' object has no attribute '{}'",
          type_name,
          attr_name)},
      type_name_{std::move(type_name)},
      attr_name_{std::move(attr_name)} {}

AttributeNotFound::AttributeNotFound(
    std::string type_name,
    std::string attr_name,
    const std::string& message)
    : std::runtime_error{message},
      type_name_{std::move(type_name)},
      attr_name_{std::move(attr_name)} {}

AttributeNotFound AttributeNotFound::onType(
    std::string type_name,
    std::string attr_name) {
  auto message = fmt::format(
      "type object '{}' has no attribute '{}'", type_name, attr_name);
  return AttributeNotFound{
      std::move(type_name), std::move(attr_name), message};
}

AttributeNotFound AttributeNotFound::fromGetter(
    std::string type_name,
    const std::string& message) {
  return AttributeNotFound{std::move(type_name), "", message};
}

} // namespace attrcache
