// Copyright (c) Meta Platforms, Inc. and affiliates.

#pragma once

#include "attrcache/Jit/containers.h"

#include <cstdint>
#include <functional>
#include <string>
#include <string_view>
#include <vector>

namespace attrcache {

// X-options as passed on the command line, mapping each option name to its
// value.  A bare `-X name` maps to the empty string.
using XOptions = UnorderedMap<std::string, std::string>;

// Reads attrcache options from X-options, falling back to environment
// variables, and hands each value found to the option's setter.  Values that
// don't parse or are out of range are logged and leave the setting alone.
class FlagProcessor {
 public:
  // On/off option.  A bare `-X name` turns it on, otherwise the value must be
  // an integer and anything but 0 means on.
  void addSwitch(
      std::string name,
      std::string env_var,
      std::function<void(bool)> setter,
      std::string description);

  // Unsigned option accepted in [min, max].  A bare `-X name` means 1.
  void addUnsigned(
      std::string name,
      std::string env_var,
      std::string param,
      uint32_t min,
      uint32_t max,
      std::function<void(uint32_t)> setter,
      std::string description,
      bool hidden = false);

  // Option taking its value verbatim.
  void addString(
      std::string name,
      std::string env_var,
      std::string param,
      std::function<void(const std::string&)> setter,
      std::string description);

  // Apply every registered option, X-option first.  X-options that start
  // with prefix but match no option produce a warning.
  void setFlags(const XOptions& xoptions, std::string_view prefix) const;

  std::string xOptionHelpMessage() const;

  bool hasOptions() const {
    return !options_.empty();
  }

  bool canHandle(std::string_view name) const;

 private:
  struct Option {
    std::string name;
    std::string env_var;
    // Shown as `name=<param>` in the help.  Empty for switches.
    std::string param;
    std::string description;
    bool hidden{false};
    std::function<void(const std::string&)> apply;
  };

  void add(Option option);

  std::vector<Option> options_;
};

} // namespace attrcache
