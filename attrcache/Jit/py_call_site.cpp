// Copyright (c) Meta Platforms, Inc. and affiliates.

#include "attrcache/Jit/py_call_site.h"

#include "attrcache/Common/py_error.h"
#include "attrcache/module_state.h"

#include <fmt/format.h>

#include <stdexcept>

namespace attrcache {

namespace {

void CallSite_dealloc(CallSiteObject* self) {
  Py_CLEAR(self->module);
  PyTypeObject* tp = Py_TYPE(self);
  tp->tp_free(self);
  Py_DECREF(tp);
}

PyObject* CallSite_repr(CallSiteObject* self) {
  return PyUnicode_FromFormat(
      "<CallSite '%s' loading '%s'>",
      self->cache->callSite().c_str(),
      self->cache->name().c_str());
}

PyObject* CallSite_get_call_site(CallSiteObject* self, void*) {
  return PyUnicode_FromString(self->cache->callSite().c_str());
}

PyObject* CallSite_get_name(CallSiteObject* self, void*) {
  return PyUnicode_FromString(self->cache->name().c_str());
}

PyObject* CallSite_get_state(CallSiteObject* self, void*) {
  auto name = cacheStateName(self->cache->state());
  return PyUnicode_FromStringAndSize(name.data(), name.size());
}

PyGetSetDef CallSite_getsetlist[] = {
    {"call_site",
     reinterpret_cast<getter>(CallSite_get_call_site),
     nullptr,
     nullptr},
    {"name", reinterpret_cast<getter>(CallSite_get_name), nullptr, nullptr},
    {"state", reinterpret_cast<getter>(CallSite_get_state), nullptr, nullptr},
    {nullptr} /* Sentinel */
};

PyType_Slot callsite_slots[] = {
    {Py_tp_dealloc, reinterpret_cast<void*>(CallSite_dealloc)},
    {Py_tp_repr, reinterpret_cast<void*>(CallSite_repr)},
    {Py_tp_getset, CallSite_getsetlist},
    {0, nullptr} /* Sentinel */
};

PyType_Spec CallSite_spec = {
    .name = "_attrcache.CallSite",
    .basicsize = sizeof(CallSiteObject),
    .flags = Py_TPFLAGS_DEFAULT | Py_TPFLAGS_IMMUTABLETYPE |
        Py_TPFLAGS_DISALLOW_INSTANTIATION,
    .slots = callsite_slots,
};

} // namespace

Ref<> wrapCallSite(ModuleState* state, LoadAttrCache* cache) {
  BorrowedRef<PyTypeObject> type = state->callSiteType();
  PyObject* raw = type->tp_alloc(type, 0);
  if (raw == nullptr) {
    throw PythonError::fetch();
  }
  auto self = reinterpret_cast<CallSiteObject*>(raw);
  self->module = Ref<>::create(state->module()).release();
  self->cache = cache;
  return Ref<>::steal(raw);
}

LoadAttrCache* unwrapCallSite(ModuleState* state, BorrowedRef<> obj) {
  BorrowedRef<PyTypeObject> type = state->callSiteType();
  if (!PyObject_TypeCheck(obj, type)) {
    throw std::logic_error{fmt::format(
        "expected {}, got '{}'", type->tp_name, Py_TYPE(obj.get())->tp_name)};
  }
  return reinterpret_cast<CallSiteObject*>(obj.get())->cache;
}

int initCallSiteType(ModuleState* state, BorrowedRef<> module) {
  auto type = Ref<PyTypeObject>::steal(
      PyType_FromModuleAndSpec(module, &CallSite_spec, nullptr));
  if (type == nullptr) {
    return -1;
  }
  if (PyModule_AddObjectRef(
          module, "CallSite", reinterpret_cast<PyObject*>(type.get())) < 0) {
    return -1;
  }
  state->setCallSiteType(std::move(type));
  return 0;
}

} // namespace attrcache
