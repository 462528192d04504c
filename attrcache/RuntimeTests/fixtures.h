// Copyright (c) Meta Platforms, Inc. and affiliates.
#pragma once

#include "attrcache/python.h"

#include <gtest/gtest.h>

#include "attrcache/Common/ref.h"
#include "attrcache/Jit/config.h"
#include "attrcache/Jit/runtime.h"
#include "attrcache/Jit/version_tag.h"
#include "attrcache/ObjectModel/object_model.h"
#include "attrcache/module_state.h"

#include <fmt/format.h>

#include <limits>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#define THROW(...)                                      \
  {                                                     \
    if (PyErr_Occurred()) {                             \
      PyErr_Print();                                    \
    }                                                   \
    throw std::runtime_error{fmt::format(__VA_ARGS__)}; \
  }

inline attrcache::Value intValue(int64_t value) {
  return attrcache::Value{value};
}

inline attrcache::Value strValue(const char* value) {
  return attrcache::Value{std::string{value}};
}

// Fixture for tests of the object model and the caches, without an
// interpreter.  Every test gets its own registry, object model and runtime,
// and starts from the default Config.
class AttrCacheTest : public ::testing::Test {
 public:
  AttrCacheTest() : AttrCacheTest{1000} {}

  explicit AttrCacheTest(uint32_t bump_limit)
      : registry_{bump_limit, std::numeric_limits<uint32_t>::max()},
        model_{registry_},
        runtime_{model_} {}

  void SetUp() override {
    attrcache::resetConfig();
  }

  void TearDown() override {
    attrcache::resetConfig();
  }

  // A type whose instances store the given names in slots and have no
  // instance dictionary.
  std::shared_ptr<attrcache::Type> makeSlotType(
      const std::string& name,
      std::vector<std::string> slots,
      std::vector<std::shared_ptr<attrcache::Type>> bases = {}) {
    return model_.makeType(name, std::move(bases), std::move(slots));
  }

  // An instance of type with each (name, value) pair assigned.
  std::shared_ptr<attrcache::Object> makeObject(
      std::shared_ptr<attrcache::Type> type,
      std::vector<std::pair<std::string, attrcache::Value>> attrs = {}) {
    auto obj = model_.makeObject(std::move(type));
    for (auto& [name, value] : attrs) {
      model_.setAttr(*obj, name, std::move(value));
    }
    return obj;
  }

  // A descriptor class whose getter returns the payload and counts its calls.
  const attrcache::DescriptorClass* makePayloadDescriptorClass(
      const std::string& name,
      bool is_data,
      int* calls = nullptr) {
    attrcache::DescriptorClass::Setter setter;
    if (is_data) {
      setter = [](const attrcache::Descriptor&,
                  attrcache::Object&,
                  const attrcache::Value&) {};
    }
    return model_.makeDescriptorClass(
        name,
        [calls](const attrcache::Descriptor& descr, attrcache::Object&) {
          if (calls != nullptr) {
            ++*calls;
          }
          return descr.payload();
        },
        std::move(setter));
  }

  attrcache::Value evaluate(
      attrcache::LoadAttrCache* cache,
      attrcache::Object& obj) {
    return runtime_.evaluate(cache, obj);
  }

 protected:
  attrcache::VersionTagRegistry registry_;
  attrcache::ObjectModel model_;
  attrcache::Runtime runtime_;
};

// Fixture running Python code against the _attrcache extension module in a
// freshly initialized interpreter.
class RuntimeTest : public ::testing::Test {
 public:
  void SetUp() override {
    ASSERT_FALSE(attrcache::isInitialized())
        << "Haven't called Py_Initialize yet but attrcache is running";

    Py_Initialize();
    ASSERT_TRUE(Py_IsInitialized());

    globals_ = MakeGlobals();
    ASSERT_NE(globals_, nullptr);

    auto module = attrcache::Ref<>::steal(PyImport_ImportModule("_attrcache"));
    ASSERT_NE(module, nullptr) << "Could not import _attrcache";
    ASSERT_NE(attrcache::getModuleState(module), nullptr)
        << "_attrcache has not initialized properly";
    ASSERT_TRUE(attrcache::isInitialized());
    ASSERT_EQ(PyDict_SetItemString(globals_, "_attrcache", module), 0);
  }

  void TearDown() override {
    globals_.reset();
    int result = Py_FinalizeEx();
    ASSERT_EQ(result, 0) << "Failed finalizing the interpreter";
    ASSERT_EQ(attrcache::getConfig().state, attrcache::State::kNotInitialized)
        << "attrcache should be finalized with Py_FinalizeEx";
  }

  // Compile src with the CPython compiler and run it in the test's globals.
  void runCode(const char* src) {
    const char* filename = "fake_runtime_tests_filename.py";
    auto code =
        attrcache::Ref<>::steal(Py_CompileString(src, filename, Py_file_input));
    if (code == nullptr) {
      THROW("Failed to compile code");
    }
    auto result =
        attrcache::Ref<>::steal(PyEval_EvalCode(code, globals_, globals_));
    if (result == nullptr) {
      THROW("Failed to execute code");
    }
  }

  attrcache::Ref<> MakeGlobals() {
    auto module = attrcache::Ref<>::steal(PyModule_New("attrcachetestmodule"));
    if (module == nullptr) {
      return module;
    }
    auto globals = attrcache::Ref<>::create(PyModule_GetDict(module));
    if (PyDict_SetItemString(globals, "__builtins__", PyEval_GetBuiltins()) <
        0) {
      return attrcache::Ref<>{};
    }
    return globals;
  }

  // Borrowed reference to a global, or nullptr.
  PyObject* getGlobal(const char* name) {
    return PyDict_GetItemString(globals_, name);
  }

 protected:
  attrcache::Ref<> globals_;
};
