// Copyright (c) Meta Platforms, Inc. and affiliates.

#pragma once

#include "attrcache/Jit/config.h"

#include <fmt/format.h>

#include <cstdio>
#include <cstdlib>
#include <mutex>

namespace attrcache {

// Serializes writes to the log output across threads.
std::mutex& logMutex();

#define ATTRCACHE_LOG(...)                                           \
  {                                                                  \
    FILE* _output = attrcache::getConfig().log.output_file;          \
    std::lock_guard<std::mutex> _log_guard{attrcache::logMutex()};   \
    fmt::print(_output, "attrcache: {}:{} -- ", __FILE__, __LINE__); \
    fmt::print(_output, __VA_ARGS__);                                \
    fmt::print(_output, "\n");                                       \
    std::fflush(_output);                                            \
  }

#define ATTRCACHE_LOGIF(PRED, ...) \
  if (PRED) {                      \
    ATTRCACHE_LOG(__VA_ARGS__);    \
  }

#define ATTRCACHE_DLOG(...) \
  ATTRCACHE_LOGIF(attrcache::getConfig().log.debug, __VA_ARGS__)

#define ATTRCACHE_CHECK(COND, ...)                      \
  {                                                     \
    if (!(COND)) {                                      \
      fmt::print(                                       \
          stderr,                                       \
          "attrcache: {}:{} -- Assertion failed: {}\n", \
          __FILE__,                                     \
          __LINE__,                                     \
          #COND);                                       \
      ATTRCACHE_ABORT_IMPL(__VA_ARGS__);                \
    }                                                   \
  }

#define ATTRCACHE_ABORT(...)                                               \
  {                                                                        \
    fmt::print(stderr, "attrcache: {}:{} -- Abort\n", __FILE__, __LINE__); \
    ATTRCACHE_ABORT_IMPL(__VA_ARGS__);                                     \
  }

#define ATTRCACHE_ABORT_IMPL(...)    \
  {                                  \
    fmt::print(stderr, __VA_ARGS__); \
    fmt::print(stderr, "\n");        \
    std::fflush(stderr);             \
    std::abort();                    \
  }

#ifdef ATTRCACHE_DEBUG
#define ATTRCACHE_DABORT(...) ATTRCACHE_ABORT(__VA_ARGS__)
#define ATTRCACHE_DCHECK(COND, ...) ATTRCACHE_CHECK((COND), __VA_ARGS__)
#else
#define ATTRCACHE_DABORT(...)     \
  if (0) {                        \
    ATTRCACHE_ABORT(__VA_ARGS__); \
  }
#define ATTRCACHE_DCHECK(COND, ...)       \
  if (0) {                                \
    ATTRCACHE_CHECK((COND), __VA_ARGS__); \
  }
#endif

} // namespace attrcache
