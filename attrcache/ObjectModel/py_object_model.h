// Copyright (c) Meta Platforms, Inc. and affiliates.

#pragma once

#include "attrcache/python.h"

#include "attrcache/Common/ref.h"
#include "attrcache/ObjectModel/object_model.h"

#include <memory>

namespace attrcache {

class ModuleState;

// Python wrappers around the host object model.  Every wrapper holds a
// reference to the _attrcache module so the model outlives it.

struct HostTypeObject {
  PyObject_HEAD
  PyObject* module;
  std::shared_ptr<Type> type;
};

struct HostObjectObject {
  PyObject_HEAD
  PyObject* module;
  std::shared_ptr<Object> obj;
};

struct DescrClassObject {
  PyObject_HEAD
  PyObject* module;
  const DescriptorClass* cls;
};

// Convert between Python objects and Values.  toValue() throws
// std::logic_error for anything but None, bool, int, float and str;
// fromValue() throws PythonError if allocation fails.
Value toValue(BorrowedRef<> obj);
Ref<> fromValue(const Value& value);

Ref<> wrapType(ModuleState* state, std::shared_ptr<Type> type);
Ref<> wrapObject(ModuleState* state, std::shared_ptr<Object> obj);
Ref<> wrapDescrClass(ModuleState* state, const DescriptorClass* cls);

// Throw std::logic_error if obj is not of the expected wrapper type.
std::shared_ptr<Type> unwrapType(ModuleState* state, BorrowedRef<> obj);
std::shared_ptr<Object> unwrapObject(ModuleState* state, BorrowedRef<> obj);
const DescriptorClass* unwrapDescrClass(ModuleState* state, BorrowedRef<> obj);

// Hooks that call into Python.  The callables are kept alive by the hooks.
DescriptorClass::Getter makeDescrGetter(ModuleState* state, BorrowedRef<> get);
DescriptorClass::Setter makeDescrSetter(ModuleState* state, BorrowedRef<> set);
FallbackHook makeFallbackHook(ModuleState* state, BorrowedRef<> func);
GetAttributeHook makeGetAttributeHook(ModuleState* state, BorrowedRef<> func);

// Create the HostType, HostObject and DescriptorClass types and add them to
// module.  Returns -1 with a Python exception set on failure.
int initObjectModelTypes(ModuleState* state, BorrowedRef<> module);

} // namespace attrcache
