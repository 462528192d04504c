// Copyright (c) Meta Platforms, Inc. and affiliates.

#include "attrcache/ObjectModel/py_object_model.h"

#include "attrcache/Common/log.h"
#include "attrcache/Common/py_error.h"
#include "attrcache/module_state.h"

#include <fmt/format.h>

#include <new>
#include <stdexcept>
#include <string>
#include <vector>

namespace attrcache {

namespace {

// Keeps a Python callable alive inside a copyable std::function.
using SharedCallable = std::shared_ptr<Ref<>>;

SharedCallable shareCallable(BorrowedRef<> func) {
  if (!PyCallable_Check(func)) {
    throw std::logic_error{fmt::format(
        "expected a callable, got '{}'", Py_TYPE(func.get())->tp_name)};
  }
  return std::make_shared<Ref<>>(Ref<>::create(func));
}

Ref<> checkedResult(PyObject* result) {
  if (result == nullptr) {
    throw PythonError::fetch();
  }
  return Ref<>::steal(result);
}

// An AttributeError from a descriptor getter means the attribute is missing,
// so the type's fallback hook still gets to run.  Anything else propagates as
// a PythonError.
[[noreturn]] void raiseGetterError(Object& obj) {
  if (!PyErr_ExceptionMatches(PyExc_AttributeError)) {
    throw PythonError::fetch();
  }
  PyObject* type = nullptr;
  PyObject* value = nullptr;
  PyObject* traceback = nullptr;
  PyErr_Fetch(&type, &value, &traceback);
  PyErr_NormalizeException(&type, &value, &traceback);
  auto exc_type = Ref<>::steal(type);
  auto exc_value = Ref<>::steal(value);
  auto exc_traceback = Ref<>::steal(traceback);

  std::string message;
  if (exc_value != nullptr) {
    auto str = Ref<>::steal(PyObject_Str(exc_value));
    const char* utf8 = str == nullptr ? nullptr : PyUnicode_AsUTF8(str);
    if (utf8 != nullptr) {
      message = utf8;
    } else {
      PyErr_Clear();
    }
  }
  throw AttributeNotFound::fromGetter(obj.type()->name(), message);
}

std::string toName(BorrowedRef<> obj) {
  if (!PyUnicode_Check(obj)) {
    throw std::logic_error{fmt::format(
        "attribute name must be str, not '{}'", Py_TYPE(obj.get())->tp_name)};
  }
  Py_ssize_t size = 0;
  const char* utf8 = PyUnicode_AsUTF8AndSize(obj, &size);
  if (utf8 == nullptr) {
    throw PythonError::fetch();
  }
  return std::string{utf8, static_cast<size_t>(size)};
}

ModuleState* stateOf(PyObject* module) {
  ModuleState* state = getModuleState(module);
  if (state == nullptr) {
    throw std::runtime_error{"_attrcache module state is gone"};
  }
  return state;
}

// Shared by every wrapper: release the C++ members, the module reference and
// the memory, then the reference heap type instances hold on their type.
template <typename T, typename DestroyMembers>
void deallocWrapper(T* self, DestroyMembers destroy) {
  destroy(self);
  Py_CLEAR(self->module);
  PyTypeObject* tp = Py_TYPE(self);
  tp->tp_free(self);
  Py_DECREF(tp);
}

template <typename T>
T* allocWrapper(ModuleState* state, BorrowedRef<PyTypeObject> type) {
  PyObject* raw = type->tp_alloc(type, 0);
  if (raw == nullptr) {
    throw PythonError::fetch();
  }
  auto self = reinterpret_cast<T*>(raw);
  self->module = Ref<>::create(state->module()).release();
  return self;
}

template <typename T>
T* checkWrapper(BorrowedRef<> obj, BorrowedRef<PyTypeObject> type) {
  if (!PyObject_TypeCheck(obj, type)) {
    throw std::logic_error{fmt::format(
        "expected {}, got '{}'", type->tp_name, Py_TYPE(obj.get())->tp_name)};
  }
  return reinterpret_cast<T*>(obj.get());
}

// HostType

void HostType_dealloc(HostTypeObject* self) {
  deallocWrapper(
      self, [](HostTypeObject* s) { s->type.~shared_ptr<Type>(); });
}

PyObject* HostType_repr(HostTypeObject* self) {
  return PyUnicode_FromFormat(
      "<HostType '%s'>", self->type->name().c_str());
}

PyObject* HostType_set_attr(HostTypeObject* self, PyObject* args) {
  PyObject* name;
  PyObject* value;
  if (!PyArg_ParseTuple(args, "UO:set_attr", &name, &value)) {
    return nullptr;
  }
  return translateExceptions<PyObject*>(nullptr, [&]() -> PyObject* {
    stateOf(self->module)->model().setTypeAttr(
        *self->type, toName(name), toValue(value));
    Py_RETURN_NONE;
  });
}

PyObject* HostType_del_attr(HostTypeObject* self, PyObject* name) {
  return translateExceptions<PyObject*>(nullptr, [&]() -> PyObject* {
    stateOf(self->module)->model().delTypeAttr(*self->type, toName(name));
    Py_RETURN_NONE;
  });
}

PyObject* HostType_set_descriptor(HostTypeObject* self, PyObject* args) {
  PyObject* name;
  PyObject* descr_class;
  PyObject* payload = Py_None;
  if (!PyArg_ParseTuple(
          args, "UO|O:set_descriptor", &name, &descr_class, &payload)) {
    return nullptr;
  }
  return translateExceptions<PyObject*>(nullptr, [&]() -> PyObject* {
    ModuleState* state = stateOf(self->module);
    ObjectModel& model = state->model();
    auto descr = model.makeDescriptor(
        unwrapDescrClass(state, descr_class), toValue(payload));
    model.setTypeAttr(*self->type, toName(name), std::move(descr));
    Py_RETURN_NONE;
  });
}

PyObject* HostType_retype_descriptor(HostTypeObject* self, PyObject* args) {
  PyObject* name;
  PyObject* descr_class;
  if (!PyArg_ParseTuple(args, "UO:retype_descriptor", &name, &descr_class)) {
    return nullptr;
  }
  return translateExceptions<PyObject*>(nullptr, [&]() -> PyObject* {
    ModuleState* state = stateOf(self->module);
    ObjectModel& model = state->model();
    std::string attr_name = toName(name);
    const DescriptorClass* cls = unwrapDescrClass(state, descr_class);
    std::shared_ptr<Descriptor> descr;
    {
      auto guard = model.readLock();
      const TypeAttr* attr = self->type->lookupOwn(attr_name);
      if (attr == nullptr) {
        throw AttributeNotFound::onType(self->type->name(), attr_name);
      }
      descr = attr->descriptorRef();
    }
    if (descr == nullptr) {
      throw std::logic_error{fmt::format(
          "'{}.{}' is not a descriptor", self->type->name(), attr_name)};
    }
    model.setDescriptorClass(*descr, cls);
    Py_RETURN_NONE;
  });
}

PyObject* HostType_set_bases(HostTypeObject* self, PyObject* bases) {
  return translateExceptions<PyObject*>(nullptr, [&]() -> PyObject* {
    ModuleState* state = stateOf(self->module);
    if (!PyTuple_Check(bases)) {
      throw std::logic_error{"bases must be a tuple"};
    }
    std::vector<std::shared_ptr<Type>> new_bases;
    for (Py_ssize_t i = 0; i < PyTuple_GET_SIZE(bases); i++) {
      new_bases.push_back(unwrapType(state, PyTuple_GET_ITEM(bases, i)));
    }
    state->model().setBases(*self->type, std::move(new_bases));
    Py_RETURN_NONE;
  });
}

PyObject* HostType_set_getattr(HostTypeObject* self, PyObject* func) {
  return translateExceptions<PyObject*>(nullptr, [&]() -> PyObject* {
    ModuleState* state = stateOf(self->module);
    state->model().setFallbackHook(
        *self->type,
        func == Py_None ? nullptr : makeFallbackHook(state, func));
    Py_RETURN_NONE;
  });
}

PyObject* HostType_set_getattribute(HostTypeObject* self, PyObject* func) {
  return translateExceptions<PyObject*>(nullptr, [&]() -> PyObject* {
    ModuleState* state = stateOf(self->module);
    state->model().setGetAttributeHook(
        *self->type,
        func == Py_None ? nullptr : makeGetAttributeHook(state, func));
    Py_RETURN_NONE;
  });
}

PyObject*
HostType_new_instance(HostTypeObject* self, PyObject* args, PyObject* kwargs) {
  if (PyTuple_GET_SIZE(args) != 0) {
    PyErr_SetString(PyExc_TypeError, "new() takes keyword arguments only");
    return nullptr;
  }
  return translateExceptions<PyObject*>(nullptr, [&]() -> PyObject* {
    ModuleState* state = stateOf(self->module);
    ObjectModel& model = state->model();
    auto obj = model.makeObject(self->type);
    if (kwargs != nullptr) {
      PyObject* key;
      PyObject* value;
      Py_ssize_t pos = 0;
      while (PyDict_Next(kwargs, &pos, &key, &value)) {
        model.setAttr(*obj, toName(key), toValue(value));
      }
    }
    return wrapObject(state, std::move(obj)).release();
  });
}

PyObject* HostType_get_name(HostTypeObject* self, void*) {
  return PyUnicode_FromString(self->type->name().c_str());
}

PyObject* HostType_get_version_tag(HostTypeObject* self, void*) {
  return PyLong_FromUnsignedLong(self->type->versionTag());
}

PyObject* HostType_get_generation(HostTypeObject* self, void*) {
  return PyLong_FromUnsignedLongLong(self->type->generation());
}

PyObject* HostType_get_mro(HostTypeObject* self, void*) {
  return translateExceptions<PyObject*>(nullptr, [&]() -> PyObject* {
    ModuleState* state = stateOf(self->module);
    std::vector<std::shared_ptr<Type>> mro;
    {
      auto guard = state->model().readLock();
      for (Type* type : self->type->mro()) {
        mro.push_back(type->shared_from_this());
      }
    }
    auto result = Ref<>::steal(PyTuple_New(mro.size()));
    if (result == nullptr) {
      throw PythonError::fetch();
    }
    for (size_t i = 0; i < mro.size(); i++) {
      PyTuple_SET_ITEM(
          result.get(), i, wrapType(state, std::move(mro[i])).release());
    }
    return result.release();
  });
}

PyObject* HostType_richcompare(PyObject* a, PyObject* b, int op) {
  if (Py_TYPE(a) != Py_TYPE(b) || (op != Py_EQ && op != Py_NE)) {
    Py_RETURN_NOTIMPLEMENTED;
  }
  bool same = reinterpret_cast<HostTypeObject*>(a)->type ==
      reinterpret_cast<HostTypeObject*>(b)->type;
  return PyBool_FromLong(op == Py_EQ ? same : !same);
}

Py_hash_t HostType_hash(HostTypeObject* self) {
  return static_cast<Py_hash_t>(self->type->generation());
}

PyMethodDef HostType_methods[] = {
    {"set_attr",
     reinterpret_cast<PyCFunction>(HostType_set_attr),
     METH_VARARGS,
     PyDoc_STR("set_attr(name, value): set a class attribute")},
    {"del_attr",
     reinterpret_cast<PyCFunction>(HostType_del_attr),
     METH_O,
     PyDoc_STR("del_attr(name): delete a class attribute")},
    {"set_descriptor",
     reinterpret_cast<PyCFunction>(HostType_set_descriptor),
     METH_VARARGS,
     PyDoc_STR("set_descriptor(name, descr_class, payload=None): install a "
               "descriptor instance of descr_class")},
    {"retype_descriptor",
     reinterpret_cast<PyCFunction>(HostType_retype_descriptor),
     METH_VARARGS,
     PyDoc_STR("retype_descriptor(name, descr_class): change the class of "
               "the descriptor stored under name")},
    {"set_bases",
     reinterpret_cast<PyCFunction>(HostType_set_bases),
     METH_O,
     PyDoc_STR("set_bases(bases): reassign __bases__")},
    {"set_getattr",
     reinterpret_cast<PyCFunction>(HostType_set_getattr),
     METH_O,
     PyDoc_STR("set_getattr(func): install func(obj, name) as the fallback "
               "lookup hook, or remove it with None")},
    {"set_getattribute",
     reinterpret_cast<PyCFunction>(HostType_set_getattribute),
     METH_O,
     PyDoc_STR("set_getattribute(func): override every attribute lookup with "
               "func(obj, name), or remove the override with None")},
    {"new",
     reinterpret_cast<PyCFunction>(HostType_new_instance),
     METH_VARARGS | METH_KEYWORDS,
     PyDoc_STR("new(**attrs): create an instance")},
    {nullptr, nullptr} /* Sentinel */
};

PyGetSetDef HostType_getsetlist[] = {
    {"name", reinterpret_cast<getter>(HostType_get_name), nullptr, nullptr},
    {"version_tag",
     reinterpret_cast<getter>(HostType_get_version_tag),
     nullptr,
     nullptr},
    {"generation",
     reinterpret_cast<getter>(HostType_get_generation),
     nullptr,
     nullptr},
    {"mro", reinterpret_cast<getter>(HostType_get_mro), nullptr, nullptr},
    {nullptr} /* Sentinel */
};

PyType_Slot hosttype_slots[] = {
    {Py_tp_dealloc, reinterpret_cast<void*>(HostType_dealloc)},
    {Py_tp_repr, reinterpret_cast<void*>(HostType_repr)},
    {Py_tp_richcompare, reinterpret_cast<void*>(HostType_richcompare)},
    {Py_tp_hash, reinterpret_cast<void*>(HostType_hash)},
    {Py_tp_methods, HostType_methods},
    {Py_tp_getset, HostType_getsetlist},
    {0, nullptr} /* Sentinel */
};

PyType_Spec HostType_spec = {
    .name = "_attrcache.HostType",
    .basicsize = sizeof(HostTypeObject),
    .flags = Py_TPFLAGS_DEFAULT | Py_TPFLAGS_IMMUTABLETYPE |
        Py_TPFLAGS_DISALLOW_INSTANTIATION,
    .slots = hosttype_slots,
};

// HostObject

void HostObject_dealloc(HostObjectObject* self) {
  deallocWrapper(
      self, [](HostObjectObject* s) { s->obj.~shared_ptr<Object>(); });
}

PyObject* HostObject_repr(HostObjectObject* self) {
  return PyUnicode_FromFormat(
      "<HostObject of '%s'>", self->obj->type()->name().c_str());
}

PyObject* HostObject_get(HostObjectObject* self, PyObject* name) {
  return translateExceptions<PyObject*>(nullptr, [&]() -> PyObject* {
    Value value =
        stateOf(self->module)->model().genericGetAttr(*self->obj, toName(name));
    return fromValue(value).release();
  });
}

PyObject* HostObject_set(HostObjectObject* self, PyObject* args) {
  PyObject* name;
  PyObject* value;
  if (!PyArg_ParseTuple(args, "UO:set", &name, &value)) {
    return nullptr;
  }
  return translateExceptions<PyObject*>(nullptr, [&]() -> PyObject* {
    stateOf(self->module)->model().setAttr(
        *self->obj, toName(name), toValue(value));
    Py_RETURN_NONE;
  });
}

PyObject* HostObject_delete(HostObjectObject* self, PyObject* name) {
  return translateExceptions<PyObject*>(nullptr, [&]() -> PyObject* {
    stateOf(self->module)->model().delAttr(*self->obj, toName(name));
    Py_RETURN_NONE;
  });
}

PyObject* HostObject_set_class(HostObjectObject* self, PyObject* type) {
  return translateExceptions<PyObject*>(nullptr, [&]() -> PyObject* {
    ModuleState* state = stateOf(self->module);
    state->model().setClass(*self->obj, unwrapType(state, type));
    Py_RETURN_NONE;
  });
}

PyObject* HostObject_set_dict(HostObjectObject* self, PyObject* dict) {
  return translateExceptions<PyObject*>(nullptr, [&]() -> PyObject* {
    if (!PyDict_Check(dict)) {
      throw std::logic_error{"__dict__ must be set to a dictionary"};
    }
    DictItems items;
    PyObject* key;
    PyObject* value;
    Py_ssize_t pos = 0;
    while (PyDict_Next(dict, &pos, &key, &value)) {
      items.insert_or_assign(toName(key), toValue(value));
    }
    stateOf(self->module)->model().setDict(*self->obj, std::move(items));
    Py_RETURN_NONE;
  });
}

PyObject* HostObject_get_type(HostObjectObject* self, void*) {
  return translateExceptions<PyObject*>(nullptr, [&]() -> PyObject* {
    return wrapType(stateOf(self->module), self->obj->typeRef()).release();
  });
}

PyMethodDef HostObject_methods[] = {
    {"get",
     reinterpret_cast<PyCFunction>(HostObject_get),
     METH_O,
     PyDoc_STR("get(name): uncached attribute lookup")},
    {"set",
     reinterpret_cast<PyCFunction>(HostObject_set),
     METH_VARARGS,
     PyDoc_STR("set(name, value): assign an attribute")},
    {"delete",
     reinterpret_cast<PyCFunction>(HostObject_delete),
     METH_O,
     PyDoc_STR("delete(name): delete an attribute")},
    {"set_class",
     reinterpret_cast<PyCFunction>(HostObject_set_class),
     METH_O,
     PyDoc_STR("set_class(type): reassign __class__")},
    {"set_dict",
     reinterpret_cast<PyCFunction>(HostObject_set_dict),
     METH_O,
     PyDoc_STR("set_dict(dict): replace __dict__")},
    {nullptr, nullptr} /* Sentinel */
};

PyGetSetDef HostObject_getsetlist[] = {
    {"type", reinterpret_cast<getter>(HostObject_get_type), nullptr, nullptr},
    {nullptr} /* Sentinel */
};

PyType_Slot hostobject_slots[] = {
    {Py_tp_dealloc, reinterpret_cast<void*>(HostObject_dealloc)},
    {Py_tp_repr, reinterpret_cast<void*>(HostObject_repr)},
    {Py_tp_methods, HostObject_methods},
    {Py_tp_getset, HostObject_getsetlist},
    {0, nullptr} /* Sentinel */
};

PyType_Spec HostObject_spec = {
    .name = "_attrcache.HostObject",
    .basicsize = sizeof(HostObjectObject),
    .flags = Py_TPFLAGS_DEFAULT | Py_TPFLAGS_IMMUTABLETYPE |
        Py_TPFLAGS_DISALLOW_INSTANTIATION,
    .slots = hostobject_slots,
};

// DescriptorClass

void DescrClass_dealloc(DescrClassObject* self) {
  deallocWrapper(self, [](DescrClassObject*) {});
}

PyObject* DescrClass_repr(DescrClassObject* self) {
  return PyUnicode_FromFormat(
      "<DescriptorClass '%s' (%s)>",
      self->cls->name().c_str(),
      self->cls->isData() ? "data" : "non-data");
}

PyObject* DescrClass_get_is_data(DescrClassObject* self, void*) {
  return PyBool_FromLong(self->cls->isData());
}

PyGetSetDef DescrClass_getsetlist[] = {
    {"is_data",
     reinterpret_cast<getter>(DescrClass_get_is_data),
     nullptr,
     nullptr},
    {nullptr} /* Sentinel */
};

PyType_Slot descrclass_slots[] = {
    {Py_tp_dealloc, reinterpret_cast<void*>(DescrClass_dealloc)},
    {Py_tp_repr, reinterpret_cast<void*>(DescrClass_repr)},
    {Py_tp_getset, DescrClass_getsetlist},
    {0, nullptr} /* Sentinel */
};

PyType_Spec DescrClass_spec = {
    .name = "_attrcache.DescriptorClass",
    .basicsize = sizeof(DescrClassObject),
    .flags = Py_TPFLAGS_DEFAULT | Py_TPFLAGS_IMMUTABLETYPE |
        Py_TPFLAGS_DISALLOW_INSTANTIATION,
    .slots = descrclass_slots,
};

Ref<PyTypeObject> makeType(BorrowedRef<> module, PyType_Spec* spec) {
  return Ref<PyTypeObject>::steal(
      PyType_FromModuleAndSpec(module, spec, nullptr));
}

} // namespace

Value toValue(BorrowedRef<> obj) {
  if (obj == Py_None) {
    return none();
  }
  if (PyBool_Check(obj)) {
    return obj == Py_True;
  }
  if (PyLong_Check(obj)) {
    long long value = PyLong_AsLongLong(obj);
    if (value == -1 && PyErr_Occurred()) {
      throw PythonError::fetch();
    }
    return static_cast<int64_t>(value);
  }
  if (PyFloat_Check(obj)) {
    return PyFloat_AS_DOUBLE(obj.get());
  }
  if (PyUnicode_Check(obj)) {
    return toName(obj);
  }
  throw std::logic_error{fmt::format(
      "attribute values must be None, bool, int, float or str, not '{}'",
      Py_TYPE(obj.get())->tp_name)};
}

Ref<> fromValue(const Value& value) {
  PyObject* result = std::visit(
      [](const auto& v) -> PyObject* {
        using T = std::decay_t<decltype(v)>;
        if constexpr (std::is_same_v<T, std::monostate>) {
          return Py_NewRef(Py_None);
        } else if constexpr (std::is_same_v<T, bool>) {
          return PyBool_FromLong(v);
        } else if constexpr (std::is_same_v<T, int64_t>) {
          return PyLong_FromLongLong(v);
        } else if constexpr (std::is_same_v<T, double>) {
          return PyFloat_FromDouble(v);
        } else {
          return PyUnicode_FromStringAndSize(v.data(), v.size());
        }
      },
      value);
  return checkedResult(result);
}

Ref<> wrapType(ModuleState* state, std::shared_ptr<Type> type) {
  auto self = allocWrapper<HostTypeObject>(state, state->hostTypeType());
  new (&self->type) std::shared_ptr<Type>(std::move(type));
  return Ref<>::steal(reinterpret_cast<PyObject*>(self));
}

Ref<> wrapObject(ModuleState* state, std::shared_ptr<Object> obj) {
  auto self = allocWrapper<HostObjectObject>(state, state->hostObjectType());
  new (&self->obj) std::shared_ptr<Object>(std::move(obj));
  return Ref<>::steal(reinterpret_cast<PyObject*>(self));
}

Ref<> wrapDescrClass(ModuleState* state, const DescriptorClass* cls) {
  auto self = allocWrapper<DescrClassObject>(state, state->descrClassType());
  self->cls = cls;
  return Ref<>::steal(reinterpret_cast<PyObject*>(self));
}

std::shared_ptr<Type> unwrapType(ModuleState* state, BorrowedRef<> obj) {
  return checkWrapper<HostTypeObject>(obj, state->hostTypeType())->type;
}

std::shared_ptr<Object> unwrapObject(ModuleState* state, BorrowedRef<> obj) {
  return checkWrapper<HostObjectObject>(obj, state->hostObjectType())->obj;
}

const DescriptorClass* unwrapDescrClass(
    ModuleState* state,
    BorrowedRef<> obj) {
  return checkWrapper<DescrClassObject>(obj, state->descrClassType())->cls;
}

DescriptorClass::Getter makeDescrGetter(ModuleState* state, BorrowedRef<> get) {
  SharedCallable func = shareCallable(get);
  return [state, func](const Descriptor& descr, Object& obj) -> Value {
    Ref<> payload = fromValue(descr.payload());
    Ref<> wrapped = wrapObject(state, obj.shared_from_this());
    auto result = Ref<>::steal(PyObject_CallFunctionObjArgs(
        func->get(), payload.get(), wrapped.get(), nullptr));
    if (result == nullptr) {
      raiseGetterError(obj);
    }
    return toValue(result);
  };
}

DescriptorClass::Setter makeDescrSetter(ModuleState* state, BorrowedRef<> set) {
  SharedCallable func = shareCallable(set);
  return [state, func](
             const Descriptor& descr, Object& obj, const Value& value) {
    Ref<> payload = fromValue(descr.payload());
    Ref<> wrapped = wrapObject(state, obj.shared_from_this());
    Ref<> py_value = fromValue(value);
    checkedResult(PyObject_CallFunctionObjArgs(
        func->get(), payload.get(), wrapped.get(), py_value.get(), nullptr));
  };
}

FallbackHook makeFallbackHook(ModuleState* state, BorrowedRef<> func) {
  SharedCallable callable = shareCallable(func);
  return [state, callable](Object& obj, const std::string& name) -> Value {
    Ref<> wrapped = wrapObject(state, obj.shared_from_this());
    Ref<> py_name = checkedResult(
        PyUnicode_FromStringAndSize(name.data(), name.size()));
    Ref<> result = checkedResult(PyObject_CallFunctionObjArgs(
        callable->get(), wrapped.get(), py_name.get(), nullptr));
    return toValue(result);
  };
}

GetAttributeHook makeGetAttributeHook(ModuleState* state, BorrowedRef<> func) {
  // Same calling convention as the fallback hook.
  return makeFallbackHook(state, func);
}

int initObjectModelTypes(ModuleState* state, BorrowedRef<> module) {
  struct {
    PyType_Spec* spec;
    void (ModuleState::*setter)(Ref<PyTypeObject>);
    const char* name;
  } types[] = {
      {&HostType_spec, &ModuleState::setHostTypeType, "HostType"},
      {&HostObject_spec, &ModuleState::setHostObjectType, "HostObject"},
      {&DescrClass_spec, &ModuleState::setDescrClassType, "DescriptorClass"},
  };
  for (auto& entry : types) {
    Ref<PyTypeObject> type = makeType(module, entry.spec);
    if (type == nullptr) {
      return -1;
    }
    if (PyModule_AddObjectRef(
            module, entry.name, reinterpret_cast<PyObject*>(type.get())) <
        0) {
      return -1;
    }
    (state->*entry.setter)(std::move(type));
  }
  return 0;
}

} // namespace attrcache
