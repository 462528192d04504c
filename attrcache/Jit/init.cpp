// Copyright (c) Meta Platforms, Inc. and affiliates.

#include "attrcache/Jit/init.h"

#include "attrcache/Common/log.h"
#include "attrcache/Jit/config.h"

#include <fmt/format.h>

#include <unistd.h>

#include <cerrno>
#include <cstring>
#include <iostream>
#include <limits>

namespace attrcache {

namespace {

bool attrcache_help = false;

} // namespace

void setLogFile(const std::string& log_filename) {
  // Redirect logging to a file if configured.
  const char* kPidMarker = "{pid}";
  std::string pid_filename = log_filename;
  auto marker_pos = pid_filename.find(kPidMarker);
  if (marker_pos != std::string::npos) {
    pid_filename.replace(
        marker_pos, std::strlen(kPidMarker), fmt::format("{}", getpid()));
  }
  FILE* file = std::fopen(pid_filename.c_str(), "w");
  if (file == nullptr) {
    ATTRCACHE_LOG(
        "Couldn't open log file {} ({}), logging to stderr",
        pid_filename,
        std::strerror(errno));
  } else {
    getMutableConfig().log.filename = pid_filename;
    getMutableConfig().log.output_file = file;
  }
}

FlagProcessor initFlagProcessor() {
  attrcache_help = false;

  FlagProcessor flag_processor;

  flag_processor.addSwitch(
      "attrcache-debug",
      "PYTHONATTRCACHEDEBUG",
      [](bool on) { getMutableConfig().log.debug = on; },
      "attrcache debug and extra logging");

  flag_processor.addString(
      "attrcache-log-file",
      "PYTHONATTRCACHELOGFILE",
      "filename",
      [](const std::string& log_filename) { setLogFile(log_filename); },
      "write log entries to <filename> rather than stderr");

  flag_processor.addSwitch(
      "attrcache-disable",
      "PYTHONATTRCACHEDISABLE",
      [](bool on) { getMutableConfig().attr_caches = !on; },
      "disable attribute caches; every access does a full lookup");

  flag_processor.addUnsigned(
      "attrcache-size",
      "PYTHONATTRCACHESIZE",
      "entries",
      1,
      kMaxAttrCacheSize,
      [](uint32_t size) { getMutableConfig().attr_cache_size = size; },
      "number of entries in the polymorphic cache of a call site");

  flag_processor.addSwitch(
      "attrcache-stats",
      "PYTHONATTRCACHESTATS",
      [](bool on) { getMutableConfig().collect_attr_cache_stats = on; },
      "collect attribute cache miss statistics");

  flag_processor.addUnsigned(
      "attrcache-version-bump-limit",
      "PYTHONATTRCACHEVERSIONBUMPLIMIT",
      "count",
      0,
      std::numeric_limits<uint32_t>::max(),
      [](uint32_t limit) { getMutableConfig().type_version_bump_limit = limit; },
      "number of version tag changes a type may go through before it stops "
      "being cached");

  flag_processor.addUnsigned(
      "attrcache-max-version-tag",
      "PYTHONATTRCACHEMAXVERSIONTAG",
      "tag",
      1,
      std::numeric_limits<uint32_t>::max(),
      [](uint32_t tag) { getMutableConfig().max_version_tag = tag; },
      "largest version tag handed out before every type that changes stops "
      "being cached",
      /*hidden=*/true);

  flag_processor.addSwitch(
      "attrcache-help",
      "",
      [](bool on) { attrcache_help = on; },
      "print all available attrcache flags and exits");

  return flag_processor;
}

int initialize(const XOptions& xoptions) {
  if (isInitialized()) {
    return 0;
  }

  resetConfig();

  FlagProcessor flag_processor = initFlagProcessor();
  flag_processor.setFlags(xoptions, "attrcache-");
  if (attrcache_help) {
    std::cout << flag_processor.xOptionHelpMessage() << '\n';
    // Return rather than exit here so the caller decides what to do.
    return -2;
  }

  getMutableConfig().state = State::kRunning;
  ATTRCACHE_DLOG(
      "attrcache initialized: caches {}, size {}, stats {}",
      getConfig().attr_caches ? "enabled" : "disabled",
      getConfig().attr_cache_size,
      getConfig().collect_attr_cache_stats);
  return 0;
}

void finalize() {
  if (!isInitialized()) {
    return;
  }
  resetConfig();
}

} // namespace attrcache
