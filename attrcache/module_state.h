// Copyright (c) Meta Platforms, Inc. and affiliates.

#pragma once

#include "attrcache/python.h"

#include "attrcache/Common/ref.h"
#include "attrcache/Jit/runtime.h"
#include "attrcache/Jit/version_tag.h"
#include "attrcache/ObjectModel/object_model.h"

namespace attrcache {

// State of one _attrcache module instance: the host object model that Python
// scripts populate, the runtime holding their call sites, and the Python
// types wrapping both.
//
// CPython owns the lifetime of the module; every wrapper object keeps a
// reference to it, so this outlives everything that points into it.
class ModuleState {
 public:
  ModuleState() : model_{registry_}, runtime_{model_} {}

  DISALLOW_COPY_AND_ASSIGN(ModuleState);

  VersionTagRegistry& registry() {
    return registry_;
  }

  ObjectModel& model() {
    return model_;
  }

  Runtime& runtime() {
    return runtime_;
  }

  BorrowedRef<PyTypeObject> hostTypeType() const {
    return host_type_type_;
  }

  void setHostTypeType(Ref<PyTypeObject> type) {
    host_type_type_ = std::move(type);
  }

  BorrowedRef<PyTypeObject> hostObjectType() const {
    return host_object_type_;
  }

  void setHostObjectType(Ref<PyTypeObject> type) {
    host_object_type_ = std::move(type);
  }

  BorrowedRef<PyTypeObject> descrClassType() const {
    return descr_class_type_;
  }

  void setDescrClassType(Ref<PyTypeObject> type) {
    descr_class_type_ = std::move(type);
  }

  BorrowedRef<PyTypeObject> callSiteType() const {
    return call_site_type_;
  }

  void setCallSiteType(Ref<PyTypeObject> type) {
    call_site_type_ = std::move(type);
  }

  // The module object this state belongs to.  Borrowed.
  BorrowedRef<> module() const {
    return module_;
  }

  void setModule(BorrowedRef<> module) {
    module_ = module;
  }

 private:
  VersionTagRegistry registry_;
  ObjectModel model_;
  Runtime runtime_;

  BorrowedRef<> module_;
  Ref<PyTypeObject> host_type_type_;
  Ref<PyTypeObject> host_object_type_;
  Ref<PyTypeObject> descr_class_type_;
  Ref<PyTypeObject> call_site_type_;
};

// The state stored in an _attrcache module object.
ModuleState* getModuleState(BorrowedRef<> module);

} // namespace attrcache
