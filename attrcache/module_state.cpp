// Copyright (c) Meta Platforms, Inc. and affiliates.

#include "attrcache/module_state.h"

namespace attrcache {

ModuleState* getModuleState(BorrowedRef<> module) {
  return static_cast<ModuleState*>(PyModule_GetState(module));
}

} // namespace attrcache
