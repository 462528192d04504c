// Copyright (c) Meta Platforms, Inc. and affiliates.

#include "attrcache/Jit/flag_processor.h"

#include "attrcache/Common/log.h"

#include <fmt/format.h>

#include <charconv>
#include <cstdlib>
#include <utility>

namespace attrcache {

namespace {

constexpr std::string_view kIndent = "         ";
constexpr std::string_view kContinuationIndent = "             ";
constexpr size_t kLineLength = 80;

template <typename T>
bool parseInteger(const std::string& value, T& out) {
  const char* end = value.data() + value.size();
  auto result = std::from_chars(value.data(), end, out);
  return result.ec == std::errc{} && result.ptr == end;
}

// Append text to out as indented lines of at most kLineLength columns,
// breaking only on spaces.
void appendWrapped(std::string& out, std::string_view text) {
  size_t column = 0;
  bool first = true;
  while (!text.empty()) {
    size_t space = text.find(' ');
    std::string_view word = text.substr(0, space);
    text = space == std::string_view::npos ? std::string_view{}
                                           : text.substr(space + 1);
    if (word.empty()) {
      continue;
    }
    if (first) {
      out += kIndent;
      column = kIndent.size();
    } else if (column + 1 + word.size() > kLineLength) {
      out += '\n';
      out += kContinuationIndent;
      column = kContinuationIndent.size();
    } else {
      out += ' ';
      column++;
    }
    out += word;
    column += word.size();
    first = false;
  }
  out += '\n';
}

} // namespace

void FlagProcessor::add(Option option) {
  ATTRCACHE_CHECK(!option.name.empty(), "Option needs a name");
  ATTRCACHE_CHECK(
      !option.description.empty(), "Option {} needs a description", option.name);
  ATTRCACHE_CHECK(!canHandle(option.name), "Duplicate option {}", option.name);
  options_.push_back(std::move(option));
}

void FlagProcessor::addSwitch(
    std::string name,
    std::string env_var,
    std::function<void(bool)> setter,
    std::string description) {
  auto apply = [name, setter = std::move(setter)](const std::string& value) {
    int64_t number = 1;
    if (!value.empty() && !parseInteger(value, number)) {
      ATTRCACHE_LOG("Invalid value for {}: {}", name, value);
      return;
    }
    setter(number != 0);
  };
  add(Option{
      std::move(name),
      std::move(env_var),
      "",
      std::move(description),
      false,
      std::move(apply)});
}

void FlagProcessor::addUnsigned(
    std::string name,
    std::string env_var,
    std::string param,
    uint32_t min,
    uint32_t max,
    std::function<void(uint32_t)> setter,
    std::string description,
    bool hidden) {
  auto apply = [name, min, max, setter = std::move(setter)](
                   const std::string& value) {
    uint32_t number = 1;
    if (!value.empty() && !parseInteger(value, number)) {
      ATTRCACHE_LOG("Invalid unsigned value for {}: {}", name, value);
      return;
    }
    if (number < min || number > max) {
      ATTRCACHE_LOG(
          "{} must be between {} and {}, got {}; ignoring it",
          name,
          min,
          max,
          number);
      return;
    }
    setter(number);
  };
  add(Option{
      std::move(name),
      std::move(env_var),
      std::move(param),
      std::move(description),
      hidden,
      std::move(apply)});
}

void FlagProcessor::addString(
    std::string name,
    std::string env_var,
    std::string param,
    std::function<void(const std::string&)> setter,
    std::string description) {
  add(Option{
      std::move(name),
      std::move(env_var),
      std::move(param),
      std::move(description),
      false,
      std::move(setter)});
}

bool FlagProcessor::canHandle(std::string_view name) const {
  for (const Option& option : options_) {
    if (option.name == name) {
      return true;
    }
  }
  return false;
}

void FlagProcessor::setFlags(const XOptions& xoptions, std::string_view prefix)
    const {
  for (const Option& option : options_) {
    auto it = xoptions.find(option.name);
    if (it != xoptions.end()) {
      ATTRCACHE_DLOG("-X {} given: {}", option.name, option.description);
      option.apply(it->second);
      continue;
    }
    if (option.env_var.empty()) {
      continue;
    }
    const char* value = std::getenv(option.env_var.c_str());
    if (value != nullptr && value[0] != '\0') {
      ATTRCACHE_DLOG("{} set: {}", option.env_var, option.description);
      option.apply(value);
    }
  }

  for (const auto& [name, value] : xoptions) {
    if (name.starts_with(prefix) && !canHandle(name)) {
      ATTRCACHE_LOG("Warning: attrcache cannot handle X-option {}", name);
    }
  }
}

std::string FlagProcessor::xOptionHelpMessage() const {
  std::string message =
      "-X opt : set attrcache-specific option. The following options are "
      "available:\n\n";
  for (const Option& option : options_) {
    if (option.hidden) {
      continue;
    }
    std::string suffix =
        option.param.empty() ? "" : fmt::format("=<{}>", option.param);
    std::string line = fmt::format(
        "-X {}{}: {}", option.name, suffix, option.description);
    if (!option.env_var.empty()) {
      line += fmt::format("; also {}{}", option.env_var, suffix);
    }
    appendWrapped(message, line);
    message += '\n';
  }
  return message;
}

} // namespace attrcache
