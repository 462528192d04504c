// Copyright (c) Meta Platforms, Inc. and affiliates.

#pragma once

#include "attrcache/python.h"

#include <cstddef>
#include <functional>
#include <type_traits>

namespace attrcache {

template <typename T>
class RefBase {
 public:
  RefBase() = default;
  RefBase(std::nullptr_t) {}

  operator T*() const {
    return ptr_;
  }

  template <typename X = T>
  operator std::enable_if_t<!std::is_same_v<X, PyObject>, PyObject*>() const {
    return reinterpret_cast<PyObject*>(ptr_);
  }

  T* release() {
    auto ref = ptr_;
    ptr_ = nullptr;
    return ref;
  }

  T* get() const {
    return ptr_;
  }

  T* operator->() const {
    return ptr_;
  }

  bool operator==(std::nullptr_t) const {
    return ptr_ == nullptr;
  }

  bool operator!=(std::nullptr_t) const {
    return ptr_ != nullptr;
  }

 protected:
  T* ptr_{nullptr};
};

// BorrowedRef holds a borrowed reference to a PyObject.  It codifies in the
// type system that the holder doesn't own the reference.
template <
    typename T = PyObject,
    typename = std::enable_if_t<!std::is_pointer_v<T>>>
class BorrowedRef : public RefBase<T> {
 public:
  using RefBase<T>::RefBase;

  BorrowedRef(T* obj) {
    ptr_ = obj;
  }

  template <
      typename X = T,
      typename = std::enable_if_t<!std::is_same_v<X, PyObject>>>
  BorrowedRef(PyObject* ptr) : BorrowedRef(reinterpret_cast<X*>(ptr)) {}

  BorrowedRef(const RefBase<T>& other) {
    ptr_ = other.get();
  }

  BorrowedRef& operator=(const RefBase<T>& other) {
    ptr_ = other.get();
    return *this;
  }

  void reset(T* obj = nullptr) {
    ptr_ = obj;
  }

 private:
  using RefBase<T>::ptr_;
};

// Ref owns a reference to a PyObject and decrefs it when destroyed.
//
// A Ref cannot be copied; it uniquely owns its reference.  Ownership can be
// transferred via a move, or a BorrowedRef can be constructed from a Ref.
//
// Use Ref<>::steal() to take over a new reference returned by the runtime,
// and Ref<>::create() to make a new reference from a borrowed one:
//
//   auto value = Ref<>::steal(PyLong_FromLong(100));
//   auto item = Ref<>::create(PyTuple_GET_ITEM(args, 0));
template <
    typename T = PyObject,
    typename = std::enable_if_t<!std::is_pointer_v<T>>>
class Ref : public RefBase<T> {
 public:
  using RefBase<T>::RefBase;

  ~Ref() {
    Py_XDECREF(ptr_);
    ptr_ = nullptr;
  }

  Ref(Ref&& other) {
    ptr_ = other.ptr_;
    other.ptr_ = nullptr;
  }

  Ref& operator=(Ref&& other) {
    if (this == &other) {
      return *this;
    }
    Py_XDECREF(ptr_);
    ptr_ = other.ptr_;
    other.ptr_ = nullptr;
    return *this;
  }

  void reset(T* obj = nullptr) {
    Py_XINCREF(obj);
    Py_XDECREF(ptr_);
    ptr_ = obj;
  }

  static Ref steal(T* obj) {
    return Ref(obj, StealTag{});
  }

  static Ref create(T* obj) {
    return Ref(obj, CreateTag{});
  }

  template <
      typename X = T,
      typename = std::enable_if_t<!std::is_same_v<X, PyObject>>>
  static Ref steal(PyObject* obj) {
    return Ref(reinterpret_cast<T*>(obj), StealTag{});
  }

  template <
      typename X = T,
      typename = std::enable_if_t<!std::is_same_v<X, PyObject>>>
  static Ref create(PyObject* obj) {
    return Ref(reinterpret_cast<T*>(obj), CreateTag{});
  }

  // Stealing from another Ref doesn't make sense; either move it or explicitly
  // copy it.
  template <typename V>
  static Ref steal(const Ref<V>&) = delete;

 private:
  Ref(const Ref&) = delete;
  Ref& operator=(const Ref&) = delete;

  enum class StealTag {};
  Ref(T* obj, StealTag) {
    ptr_ = obj;
  }

  enum class CreateTag {};
  Ref(T* obj, CreateTag) {
    ptr_ = obj;
    Py_XINCREF(ptr_);
  }

  using RefBase<T>::ptr_;
};

} // namespace attrcache
