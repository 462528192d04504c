// Copyright (c) Meta Platforms, Inc. and affiliates.

#include "attrcache/Common/py_error.h"

#include "attrcache/Common/log.h"

namespace attrcache {

PythonError::PythonError(std::shared_ptr<State> state, const std::string& message)
    : std::runtime_error{message}, state_{std::move(state)} {}

PythonError PythonError::fetch() {
  PyObject* type = nullptr;
  PyObject* value = nullptr;
  PyObject* traceback = nullptr;
  PyErr_Fetch(&type, &value, &traceback);
  ATTRCACHE_CHECK(type != nullptr, "No Python exception is set");
  PyErr_NormalizeException(&type, &value, &traceback);

  auto state = std::make_shared<State>();
  state->type = Ref<>::steal(type);
  state->value = Ref<>::steal(value);
  state->traceback = Ref<>::steal(traceback);

  std::string message = reinterpret_cast<PyTypeObject*>(type)->tp_name;
  if (state->value != nullptr) {
    auto str = Ref<>::steal(PyObject_Str(state->value));
    const char* utf8 = str == nullptr ? nullptr : PyUnicode_AsUTF8(str);
    if (utf8 != nullptr) {
      message = fmt::format("{}: {}", message, utf8);
    } else {
      // Formatting the message is best effort; keep the original exception.
      PyErr_Clear();
    }
  }
  return PythonError{std::move(state), message};
}

void PythonError::restore() const {
  PyObject* type = state_->type.get();
  PyObject* value = state_->value.get();
  PyObject* traceback = state_->traceback.get();
  Py_XINCREF(type);
  Py_XINCREF(value);
  Py_XINCREF(traceback);
  PyErr_Restore(type, value, traceback);
}

} // namespace attrcache
