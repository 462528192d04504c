// Copyright (c) Meta Platforms, Inc. and affiliates.

#pragma once

#include "attrcache/python.h"

#include "attrcache/Common/ref.h"
#include "attrcache/Jit/inline_cache.h"

namespace attrcache {

class ModuleState;

// Python handle of a compiled call site.  The cache itself belongs to the
// Runtime in the module state, which the handle keeps alive.
struct CallSiteObject {
  PyObject_HEAD
  PyObject* module;
  LoadAttrCache* cache;
};

Ref<> wrapCallSite(ModuleState* state, LoadAttrCache* cache);

// Throws std::logic_error if obj is not a CallSite.
LoadAttrCache* unwrapCallSite(ModuleState* state, BorrowedRef<> obj);

int initCallSiteType(ModuleState* state, BorrowedRef<> module);

} // namespace attrcache
