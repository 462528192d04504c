// Copyright (c) Meta Platforms, Inc. and affiliates.

#include "attrcache/python.h"

#include "attrcache/Common/log.h"
#include "attrcache/Common/py_error.h"
#include "attrcache/Common/ref.h"
#include "attrcache/Jit/config.h"
#include "attrcache/Jit/init.h"
#include "attrcache/Jit/py_call_site.h"
#include "attrcache/ObjectModel/py_object_model.h"
#include "attrcache/module_state.h"

#include <fmt/format.h>

#include <cstdlib>
#include <new>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

namespace attrcache {

namespace {

ModuleState* moduleState(PyObject* module) {
  ModuleState* state = getModuleState(module);
  if (state == nullptr) {
    throw std::runtime_error{"_attrcache is not initialized"};
  }
  return state;
}

std::string stringArg(BorrowedRef<> obj, const char* what) {
  if (!PyUnicode_Check(obj)) {
    throw std::logic_error{fmt::format(
        "{} must be str, not '{}'", what, Py_TYPE(obj.get())->tp_name)};
  }
  const char* utf8 = PyUnicode_AsUTF8(obj);
  if (utf8 == nullptr) {
    throw PythonError::fetch();
  }
  return utf8;
}

// Raise if obj is not a (possibly empty) sequence of str.
std::vector<std::string> stringList(BorrowedRef<> obj, const char* what) {
  auto seq = Ref<>::steal(PySequence_Fast(obj, what));
  if (seq == nullptr) {
    throw PythonError::fetch();
  }
  std::vector<std::string> result;
  for (Py_ssize_t i = 0; i < PySequence_Fast_GET_SIZE(seq.get()); i++) {
    result.push_back(stringArg(PySequence_Fast_GET_ITEM(seq.get(), i), what));
  }
  return result;
}

void setItem(BorrowedRef<> dict, const char* key, Ref<> value) {
  if (value == nullptr || PyDict_SetItemString(dict, key, value) < 0) {
    throw PythonError::fetch();
  }
}

PyDoc_STRVAR(
    make_type_doc,
    "make_type(name, bases=(), slots=None)\n"
    "--\n"
    "\n"
    "Create a host type.  Without slots, instances carry an instance\n"
    "dictionary.  Listing '__dict__' among the slots adds one.");
PyObject* make_type(PyObject* module, PyObject* args, PyObject* kwargs) {
  static const char* kwlist[] = {"name", "bases", "slots", nullptr};
  PyObject* name;
  PyObject* bases = nullptr;
  PyObject* slots = Py_None;
  if (!PyArg_ParseTupleAndKeywords(
          args,
          kwargs,
          "U|OO:make_type",
          const_cast<char**>(kwlist),
          &name,
          &bases,
          &slots)) {
    return nullptr;
  }
  return translateExceptions<PyObject*>(nullptr, [&]() -> PyObject* {
    ModuleState* state = moduleState(module);
    std::vector<std::shared_ptr<Type>> base_types;
    if (bases != nullptr) {
      auto seq = Ref<>::steal(PySequence_Fast(bases, "bases must be a tuple"));
      if (seq == nullptr) {
        throw PythonError::fetch();
      }
      for (Py_ssize_t i = 0; i < PySequence_Fast_GET_SIZE(seq.get()); i++) {
        base_types.push_back(
            unwrapType(state, PySequence_Fast_GET_ITEM(seq.get(), i)));
      }
    }
    std::optional<std::vector<std::string>> slot_names;
    if (slots != Py_None) {
      slot_names = stringList(slots, "slots must be a sequence of str");
    }
    auto type = state->model().makeType(
        stringArg(name, "name"), std::move(base_types), std::move(slot_names));
    return wrapType(state, std::move(type)).release();
  });
}

PyDoc_STRVAR(
    make_descriptor_class_doc,
    "make_descriptor_class(name, get, set=None)\n"
    "--\n"
    "\n"
    "Create a descriptor class.  get(payload, obj) computes the value;\n"
    "set(payload, obj, value), when given, makes it a data descriptor.");
PyObject*
make_descriptor_class(PyObject* module, PyObject* args, PyObject* kwargs) {
  static const char* kwlist[] = {"name", "get", "set", nullptr};
  PyObject* name;
  PyObject* get;
  PyObject* set = Py_None;
  if (!PyArg_ParseTupleAndKeywords(
          args,
          kwargs,
          "UO|O:make_descriptor_class",
          const_cast<char**>(kwlist),
          &name,
          &get,
          &set)) {
    return nullptr;
  }
  return translateExceptions<PyObject*>(nullptr, [&]() -> PyObject* {
    ModuleState* state = moduleState(module);
    DescriptorClass::Setter setter;
    if (set != Py_None) {
      setter = makeDescrSetter(state, set);
    }
    const DescriptorClass* cls = state->model().makeDescriptorClass(
        stringArg(name, "name"),
        makeDescrGetter(state, get),
        std::move(setter));
    return wrapDescrClass(state, cls).release();
  });
}

PyObject* compile_guarded_access(PyObject* module, PyObject* args) {
  PyObject* call_site;
  PyObject* name;
  if (!PyArg_ParseTuple(args, "UU:compile_guarded_access", &call_site, &name)) {
    return nullptr;
  }
  return translateExceptions<PyObject*>(nullptr, [&]() -> PyObject* {
    ModuleState* state = moduleState(module);
    LoadAttrCache* cache = state->runtime().compileGuardedAccess(
        stringArg(call_site, "call_site"), stringArg(name, "name"));
    return wrapCallSite(state, cache).release();
  });
}

PyObject* evaluate(PyObject* module, PyObject* args) {
  PyObject* site;
  PyObject* obj;
  if (!PyArg_ParseTuple(args, "OO:evaluate", &site, &obj)) {
    return nullptr;
  }
  return translateExceptions<PyObject*>(nullptr, [&]() -> PyObject* {
    ModuleState* state = moduleState(module);
    LoadAttrCache* cache = unwrapCallSite(state, site);
    std::shared_ptr<Object> target = unwrapObject(state, obj);
    return fromValue(state->runtime().evaluate(cache, *target)).release();
  });
}

PyObject* invalidate_type(PyObject* module, PyObject* type) {
  return translateExceptions<PyObject*>(nullptr, [&]() -> PyObject* {
    ModuleState* state = moduleState(module);
    state->runtime().invalidateType(*unwrapType(state, type));
    Py_RETURN_NONE;
  });
}

PyObject* exhaust_version_tag(PyObject* module, PyObject* type) {
  return translateExceptions<PyObject*>(nullptr, [&]() -> PyObject* {
    ModuleState* state = moduleState(module);
    state->model().pinVersionTag(*unwrapType(state, type));
    Py_RETURN_NONE;
  });
}

PyObject* diagnostics(PyObject* module, PyObject* site) {
  return translateExceptions<PyObject*>(nullptr, [&]() -> PyObject* {
    ModuleState* state = moduleState(module);
    CacheDiagnostics diag =
        state->runtime().diagnostics(unwrapCallSite(state, site));
    auto result = Ref<>::steal(PyDict_New());
    if (result == nullptr) {
      throw PythonError::fetch();
    }
    auto state_name = cacheStateName(diag.state);
    setItem(
        result,
        "state",
        Ref<>::steal(
            PyUnicode_FromStringAndSize(state_name.data(), state_name.size())));
    setItem(result, "entry_count", Ref<>::steal(PyLong_FromSize_t(diag.entry_count)));
    setItem(
        result,
        "miss_count",
        Ref<>::steal(PyLong_FromUnsignedLongLong(diag.miss_count)));
    setItem(
        result,
        "eviction_count",
        Ref<>::steal(PyLong_FromUnsignedLongLong(diag.eviction_count)));
    setItem(
        result,
        "respecialization_count",
        Ref<>::steal(PyLong_FromUnsignedLongLong(diag.respecialization_count)));
    return result.release();
  });
}

PyObject* get_and_clear_cache_stats(PyObject* module, PyObject*) {
  return translateExceptions<PyObject*>(nullptr, [&]() -> PyObject* {
    ModuleState* state = moduleState(module);
    InlineCacheStats stats = state->runtime().getAndClearLoadAttrCacheStats();
    auto result = Ref<>::steal(PyList_New(0));
    if (result == nullptr) {
      throw PythonError::fetch();
    }
    for (const CacheStats& site_stats : stats) {
      auto misses = Ref<>::steal(PyDict_New());
      if (misses == nullptr) {
        throw PythonError::fetch();
      }
      for (const auto& [key, miss] : site_stats.misses) {
        auto entry = Ref<>::steal(PyDict_New());
        if (entry == nullptr) {
          throw PythonError::fetch();
        }
        auto reason = cacheMissReason(miss.reason);
        setItem(entry, "count", Ref<>::steal(PyLong_FromLong(miss.count)));
        setItem(
            entry,
            "reason",
            Ref<>::steal(
                PyUnicode_FromStringAndSize(reason.data(), reason.size())));
        setItem(misses, key.c_str(), std::move(entry));
      }
      auto site = Ref<>::steal(PyDict_New());
      if (site == nullptr) {
        throw PythonError::fetch();
      }
      setItem(
          site,
          "call_site",
          Ref<>::steal(PyUnicode_FromString(site_stats.call_site.c_str())));
      setItem(
          site,
          "attr_name",
          Ref<>::steal(PyUnicode_FromString(site_stats.attr_name.c_str())));
      setItem(site, "misses", std::move(misses));
      if (PyList_Append(result, site) < 0) {
        throw PythonError::fetch();
      }
    }
    return result.release();
  });
}

PyObject* is_enabled(PyObject*, PyObject*) {
  return PyBool_FromLong(getConfig().attr_caches);
}

// Entries whose name or value can't be encoded as UTF-8 (lone surrogates
// from the command line) are skipped.
XOptions readXOptions() {
  XOptions xoptions;
  PyObject* dict = PySys_GetXOptions();
  if (dict == nullptr) {
    throw PythonError::fetch();
  }
  PyObject* key;
  PyObject* value;
  Py_ssize_t pos = 0;
  while (PyDict_Next(dict, &pos, &key, &value)) {
    if (!PyUnicode_Check(key)) {
      continue;
    }
    const char* option = PyUnicode_AsUTF8(key);
    if (option == nullptr) {
      PyErr_Clear();
      continue;
    }
    // "-X name" without a value shows up as True.
    const char* option_value = "";
    if (PyUnicode_Check(value)) {
      option_value = PyUnicode_AsUTF8(value);
      if (option_value == nullptr) {
        PyErr_Clear();
        if (std::string_view{option}.starts_with("attrcache-")) {
          ATTRCACHE_LOG(
              "Warning: ignoring X-option {}, its value is not valid UTF-8",
              option);
        }
        continue;
      }
    }
    xoptions.emplace(option, option_value);
  }
  return xoptions;
}

void module_free(void* module) {
  ModuleState* state = getModuleState(static_cast<PyObject*>(module));
  state->ModuleState::~ModuleState();
  finalize();
}

PyMethodDef _attrcache_methods[] = {
    {"make_type",
     reinterpret_cast<PyCFunction>(make_type),
     METH_VARARGS | METH_KEYWORDS,
     make_type_doc},
    {"make_descriptor_class",
     reinterpret_cast<PyCFunction>(make_descriptor_class),
     METH_VARARGS | METH_KEYWORDS,
     make_descriptor_class_doc},
    {"compile_guarded_access",
     compile_guarded_access,
     METH_VARARGS,
     PyDoc_STR(
         "compile_guarded_access(call_site, name): install an empty cache for "
         "a call site loading the attribute name.")},
    {"evaluate",
     evaluate,
     METH_VARARGS,
     PyDoc_STR("evaluate(site, obj): load the site's attribute from obj "
               "through its cache.")},
    {"invalidate_type",
     invalidate_type,
     METH_O,
     PyDoc_STR("Give a type and all of its subclasses new version tags.")},
    {"exhaust_version_tag",
     exhaust_version_tag,
     METH_O,
     PyDoc_STR("Use up the version tag budget of a type, leaving it "
               "permanently uncacheable.")},
    {"diagnostics",
     diagnostics,
     METH_O,
     PyDoc_STR("Return the state and counters of a call site as a dict.")},
    {"get_and_clear_cache_stats",
     get_and_clear_cache_stats,
     METH_NOARGS,
     PyDoc_STR("Return and reset the cache miss statistics of every call "
               "site.  Only collected with -X attrcache-stats.")},
    {"is_enabled",
     is_enabled,
     METH_NOARGS,
     PyDoc_STR("Return whether attribute caches are enabled.")},
    {nullptr, nullptr, 0, nullptr}};

struct PyModuleDef _attrcache_module = {
    PyModuleDef_HEAD_INIT,
    "_attrcache",
    PyDoc_STR("Inline attribute caches over a host object model."),
    /*m_size=*/sizeof(ModuleState),
    _attrcache_methods,
    /*m_slots=*/nullptr,
    /*m_traverse=*/nullptr,
    /*m_clear=*/nullptr,
    /*m_free=*/module_free,
};

int attrcache_init(BorrowedRef<> module) {
  // The state will be destroyed in module_free(), which gets called even if
  // this function exits early with an error.
  void* state_mem = PyModule_GetState(module);
  auto state = new (state_mem) ModuleState();
  state->setModule(module);

  if (initObjectModelTypes(state, module) < 0 ||
      initCallSiteType(state, module) < 0) {
    return -1;
  }
  ATTRCACHE_DLOG("_attrcache initialized");
  return 0;
}

} // namespace

} // namespace attrcache

PyMODINIT_FUNC PyInit__attrcache() {
  // The module state sizes its version tag registry from the Config, so
  // options are read before the module exists.
  int init_ret = attrcache::translateExceptions<int>(-1, []() {
    return attrcache::initialize(attrcache::readXOptions());
  });
  if (init_ret == -2) {
    // Help was printed.
    exit(1);
  }
  if (init_ret != 0) {
    return nullptr;
  }

  // Deliberate single-phase initialization.
  auto module = attrcache::Ref<>::steal(
      PyModule_Create(&attrcache::_attrcache_module));
  if (module == nullptr) {
    attrcache::finalize();
    return nullptr;
  }
  if (attrcache::attrcache_init(module) < 0) {
    return nullptr;
  }
  return module.release();
}
