// Copyright (c) Meta Platforms, Inc. and affiliates.

#include "attrcache/ObjectModel/value.h"

namespace attrcache {

namespace {

struct ReprVisitor {
  std::string operator()(std::monostate) const {
    return "None";
  }
  std::string operator()(bool b) const {
    return b ? "True" : "False";
  }
  std::string operator()(int64_t i) const {
    return fmt::format("{}", i);
  }
  std::string operator()(double d) const {
    return fmt::format("{}", d);
  }
  std::string operator()(const std::string& s) const {
    return fmt::format("'{}'", s);
  }
};

} // namespace

std::string repr(const Value& value) {
  return std::visit(ReprVisitor{}, value);
}

} // namespace attrcache
