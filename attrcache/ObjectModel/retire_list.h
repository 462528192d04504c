// Copyright (c) Meta Platforms, Inc. and affiliates.

#pragma once

#include "attrcache/Common/util.h"

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <memory>
#include <vector>

namespace attrcache {

// Type metadata unlinked by a mutation, kept alive until no lock-free reader
// can still be using it.
//
// Readers that follow raw pointers into type metadata without holding the
// metadata lock (cache hits, and the lookups behind them) do so inside a
// ReadSection.  Each section registers in the current epoch.  Metadata is
// retired with the epoch it was unlinked in and freed once the epoch has moved
// two steps past it: the first step needs every section from the epoch before
// to end, the second every section from the retiring epoch itself.  Sections
// that start later already see the version tag bump that made the retired
// metadata unreachable.
//
// retire() and collect() require the metadata lock held exclusively.  Sections
// can be entered from any thread and may nest.  Writers never wait for
// readers; a long section only delays reclamation.
class RetireList {
 public:
  using Garbage = std::vector<std::shared_ptr<const void>>;

  class ReadSection {
   public:
    explicit ReadSection(const RetireList& list)
        : list_{list}, epoch_{list.enter()} {}

    ~ReadSection() {
      list_.exit(epoch_);
    }

    DISALLOW_COPY_AND_ASSIGN(ReadSection);

   private:
    const RetireList& list_;
    const uint64_t epoch_;
  };

  RetireList() = default;

  DISALLOW_COPY_AND_ASSIGN(RetireList);

  void retire(std::shared_ptr<const void> object);

  // Advance the epoch if the previous one has no readers left, and move
  // everything retired at least two epochs ago into garbage.  Destroy garbage
  // after releasing the metadata lock; freeing a value can run arbitrary
  // code.
  void collect(Garbage& garbage);

  // Number of objects waiting to be freed.
  size_t size() const {
    return retired_.size();
  }

  uint64_t epoch() const {
    return epoch_.load(std::memory_order_acquire);
  }

 private:
  struct Retired {
    uint64_t epoch;
    std::shared_ptr<const void> object;
  };

  uint64_t enter() const;
  void exit(uint64_t epoch) const;

  std::atomic<uint64_t> epoch_{0};
  // Active sections, by parity of the epoch they entered in.
  mutable std::atomic<int64_t> readers_[2]{};
  std::deque<Retired> retired_;
};

} // namespace attrcache
