// Copyright (c) Meta Platforms, Inc. and affiliates.

#pragma once

#include <fmt/format.h>

#include <cstdint>
#include <string>
#include <variant>

namespace attrcache {

// An attribute value stored in the host object model: None, bool, int, float
// or str.
using Value = std::variant<std::monostate, bool, int64_t, double, std::string>;

inline Value none() {
  return Value{};
}

inline bool isNone(const Value& value) {
  return std::holds_alternative<std::monostate>(value);
}

// Format a value the way the host language would print its repr.
std::string repr(const Value& value);

} // namespace attrcache

template <>
struct fmt::formatter<attrcache::Value> : fmt::formatter<std::string_view> {
  template <typename FormatContext>
  auto format(const attrcache::Value& value, FormatContext& ctx) const {
    return fmt::formatter<std::string_view>::format(
        attrcache::repr(value), ctx);
  }
};
