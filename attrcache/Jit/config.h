// Copyright (c) Meta Platforms, Inc. and affiliates.

#pragma once

#include <cstddef>
#include <cstdint>
#include <cstdio>
#include <limits>
#include <string>

namespace attrcache {

// Lifetime of the attribute cache runtime:
//
//   NotInitialized <----+
//        |              |
//        v              |
//     Running ----------+
enum class State : uint8_t {
  kNotInitialized,
  kRunning,
};

struct LogOptions {
  // Log general debug messages: cache fills, promotions, evictions and
  // version tag changes.
  bool debug{false};

  // Name of the file logs are redirected to, empty for stderr.
  std::string filename;

  // The file where to write logs to.
  FILE* output_file{stderr};
};

// Collection of configuration values for attribute caches.
//
// Note: It's fine to store non-trivially destructible objects like std::string
// in this.  It is *not fine* to store host objects in this because it has
// process lifetime and outlives every ObjectModel.
struct Config {
  // Current lifetime state.
  State state{State::kNotInitialized};
  // Use inline caches for attribute accesses.  When disabled every access
  // goes through the full resolution path and nothing is cached.
  bool attr_caches{true};
  // Collect stats information about attribute cache misses.
  bool collect_attr_cache_stats{false};
  // Size (in number of entries) of the polymorphic part of a LoadAttrCache.
  uint32_t attr_cache_size{4};
  // Number of times a single type can have its version tag reassigned before
  // it is pinned to 0 and stops being cacheable.
  uint32_t type_version_bump_limit{1000};
  // Largest version tag the registry will hand out.  Exhausting this space
  // pins every further bumped type to 0.
  uint32_t max_version_tag{std::numeric_limits<uint32_t>::max()};
  LogOptions log;
};

// The hard upper bound on Config::attr_cache_size.
constexpr uint32_t kMaxAttrCacheSize = 16;

// Get the global configuration.
const Config& getConfig();

// Get the global configuration, for modification.
Config& getMutableConfig();

// Reset the configuration back to its defaults.  Closes a redirected log file.
void resetConfig();

// Check if the runtime has been initialized.
bool isInitialized();

} // namespace attrcache
