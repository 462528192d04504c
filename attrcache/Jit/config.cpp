// Copyright (c) Meta Platforms, Inc. and affiliates.

#include "attrcache/Jit/config.h"

namespace attrcache {

namespace {

Config s_config;

} // namespace

const Config& getConfig() {
  return s_config;
}

Config& getMutableConfig() {
  return s_config;
}

void resetConfig() {
  if (s_config.log.output_file != nullptr &&
      s_config.log.output_file != stderr &&
      s_config.log.output_file != stdout) {
    std::fclose(s_config.log.output_file);
  }
  s_config = Config{};
}

bool isInitialized() {
  return getConfig().state != State::kNotInitialized;
}

} // namespace attrcache
