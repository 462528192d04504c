// Copyright (c) Meta Platforms, Inc. and affiliates.

#include "attrcache/Jit/version_tag.h"

#include "attrcache/Common/log.h"
#include "attrcache/Jit/config.h"
#include "attrcache/Jit/containers.h"
#include "attrcache/ObjectModel/type.h"

#include <vector>

namespace attrcache {

VersionTagRegistry::VersionTagRegistry()
    : VersionTagRegistry{
          getConfig().type_version_bump_limit,
          getConfig().max_version_tag} {}

VersionTagRegistry::VersionTagRegistry(uint32_t bump_limit, uint32_t max_tag)
    : bump_limit_{bump_limit}, max_tag_{max_tag} {}

uint32_t VersionTagRegistry::currentTag(const Type& type) const {
  return type.versionTag();
}

uint32_t VersionTagRegistry::nextTag() {
  uint32_t tag = next_tag_.load(std::memory_order_relaxed);
  do {
    if (tag == 0 || tag > max_tag_) {
      return 0;
    }
    // Wrapping around to 0 marks the space as exhausted.
  } while (!next_tag_.compare_exchange_weak(
      tag, tag + 1, std::memory_order_relaxed));
  return tag;
}

void VersionTagRegistry::assign(Type& type) {
  uint32_t tag = nextTag();
  if (tag == 0) {
    ATTRCACHE_DLOG(
        "Version tags exhausted, '{}' starts out uncacheable", type.name());
    type.tag_pinned_ = true;
  }
  type.version_tag_.store(tag, std::memory_order_release);
}

void VersionTagRegistry::pin(Type& type) {
  if (!type.tag_pinned_) {
    ATTRCACHE_DLOG(
        "Pinning version tag of '{}' (generation {}) to 0",
        type.name(),
        type.generation());
  }
  type.tag_pinned_ = true;
  type.version_tag_.store(0, std::memory_order_release);
}

bool VersionTagRegistry::isPinned(const Type& type) const {
  return type.tag_pinned_;
}

void VersionTagRegistry::bumpOne(Type& type) {
  if (type.tag_pinned_) {
    return;
  }
  if (type.version_bumps_ >= bump_limit_) {
    ATTRCACHE_DLOG(
        "'{}' exceeded its budget of {} version tag bumps",
        type.name(),
        bump_limit_);
    pin(type);
    return;
  }
  type.version_bumps_++;
  uint32_t tag = nextTag();
  if (tag == 0) {
    pin(type);
    return;
  }
  ATTRCACHE_DLOG(
      "Version tag of '{}': {} -> {}", type.name(), type.versionTag(), tag);
  type.version_tag_.store(tag, std::memory_order_release);
}

void VersionTagRegistry::bump(Type& type) {
  // Diamond hierarchies reach some subclasses along several paths; each type
  // is bumped once.
  UnorderedSet<Type*> visited;
  std::vector<std::shared_ptr<Type>> worklist;
  // Keep subclasses alive while walking; the root is owned by the caller.
  bumpOne(type);
  visited.insert(&type);
  for (auto& sub : type.subclasses()) {
    worklist.push_back(std::move(sub));
  }
  while (!worklist.empty()) {
    std::shared_ptr<Type> current = std::move(worklist.back());
    worklist.pop_back();
    if (!visited.insert(current.get()).second) {
      continue;
    }
    bumpOne(*current);
    for (auto& sub : current->subclasses()) {
      worklist.push_back(std::move(sub));
    }
  }
}

} // namespace attrcache
