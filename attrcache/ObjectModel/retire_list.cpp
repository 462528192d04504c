// Copyright (c) Meta Platforms, Inc. and affiliates.

#include "attrcache/ObjectModel/retire_list.h"

#include <utility>

namespace attrcache {

uint64_t RetireList::enter() const {
  for (;;) {
    uint64_t epoch = epoch_.load(std::memory_order_seq_cst);
    readers_[epoch & 1].fetch_add(1, std::memory_order_seq_cst);
    // The epoch may have advanced between the load and the increment, in
    // which case the count went to a parity the writer already checked.
    if (epoch_.load(std::memory_order_seq_cst) == epoch) {
      return epoch;
    }
    readers_[epoch & 1].fetch_sub(1, std::memory_order_seq_cst);
  }
}

void RetireList::exit(uint64_t epoch) const {
  readers_[epoch & 1].fetch_sub(1, std::memory_order_release);
}

void RetireList::retire(std::shared_ptr<const void> object) {
  retired_.push_back(
      Retired{epoch_.load(std::memory_order_relaxed), std::move(object)});
}

void RetireList::collect(Garbage& garbage) {
  uint64_t epoch = epoch_.load(std::memory_order_relaxed);
  // Sections of epoch - 1 count under the same parity as epoch + 1.
  if (readers_[(epoch + 1) & 1].load(std::memory_order_seq_cst) == 0) {
    epoch++;
    epoch_.store(epoch, std::memory_order_seq_cst);
  }
  while (!retired_.empty() && retired_.front().epoch + 2 <= epoch) {
    garbage.push_back(std::move(retired_.front().object));
    retired_.pop_front();
  }
}

} // namespace attrcache
