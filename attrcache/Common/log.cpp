// Copyright (c) Meta Platforms, Inc. and affiliates.

#include "attrcache/Common/log.h"

namespace attrcache {

std::mutex& logMutex() {
  static std::mutex mutex;
  return mutex;
}

} // namespace attrcache
