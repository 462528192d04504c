// Copyright (c) Meta Platforms, Inc. and affiliates.

#pragma once

#include "attrcache/python.h"

#include "attrcache/Common/ref.h"
#include "attrcache/ObjectModel/errors.h"

#include <memory>
#include <stdexcept>
#include <string>

namespace attrcache {

// A Python exception travelling through C++ code, e.g. one raised by a Python
// descriptor getter called from the object model.  Re-raised verbatim at the
// Python boundary.
class PythonError : public std::runtime_error {
 public:
  // Take the currently raised Python exception.  One must be set.
  static PythonError fetch();

  // Raise the exception again in the interpreter.
  void restore() const;

 private:
  struct State {
    Ref<> type;
    Ref<> value;
    Ref<> traceback;
  };

  PythonError(std::shared_ptr<State> state, const std::string& message);

  std::shared_ptr<State> state_;
};

// Call func and return its result.  A C++ exception escaping func is turned
// into a raised Python exception and error_value is returned instead:
// AttributeNotFound becomes AttributeError, std::invalid_argument ValueError,
// other std::logic_errors TypeError, and anything else RuntimeError.
template <typename T, typename Func>
T translateExceptions(T error_value, Func&& func) {
  try {
    return func();
  } catch (const PythonError& err) {
    err.restore();
  } catch (const AttributeNotFound& err) {
    PyErr_SetString(PyExc_AttributeError, err.what());
  } catch (const std::invalid_argument& err) {
    PyErr_SetString(PyExc_ValueError, err.what());
  } catch (const std::logic_error& err) {
    PyErr_SetString(PyExc_TypeError, err.what());
  } catch (const std::exception& err) {
    PyErr_SetString(PyExc_RuntimeError, err.what());
  }
  return error_value;
}

} // namespace attrcache
