// Copyright (c) Meta Platforms, Inc. and affiliates.

#pragma once

#include "attrcache/Common/util.h"

#include <atomic>
#include <cstdint>

namespace attrcache {

class Type;

// Hands out and invalidates per-type version tags.
//
// A tag is a single atomically published integer on the type.  Any change
// that can affect attribute resolution on a type or one of its ancestors gives
// the type (and every live subclass) a fresh tag, so a cache entry keyed on
// the old tag can never match again.
//
// Tag 0 is reserved for "never cache".  A type is pinned to 0 once it has been
// bumped more than the configured budget allows, or once the global tag space
// is exhausted.  Pinned types never get a valid tag back.
//
// assign(), bump() and pin() must be called with the object model's metadata
// lock held exclusively.  currentTag() may be called from any thread.
class VersionTagRegistry {
 public:
  // Budgets taken from the global Config.
  VersionTagRegistry();
  VersionTagRegistry(uint32_t bump_limit, uint32_t max_tag);

  DISALLOW_COPY_AND_ASSIGN(VersionTagRegistry);

  uint32_t currentTag(const Type& type) const;

  // Give a newly created type its first tag.
  void assign(Type& type);

  // Reassign the tag of type and, recursively, of all its live subclasses.
  void bump(Type& type);

  // Permanently pin the tag of type to 0.  Subclasses are unaffected.
  void pin(Type& type);

  bool isPinned(const Type& type) const;

  uint32_t bumpLimit() const {
    return bump_limit_;
  }

  uint32_t maxTag() const {
    return max_tag_;
  }

 private:
  // Return a tag never handed out before, or 0 when the space is exhausted.
  uint32_t nextTag();

  void bumpOne(Type& type);

  const uint32_t bump_limit_;
  const uint32_t max_tag_;
  std::atomic<uint32_t> next_tag_{1};
};

} // namespace attrcache
