// Copyright (c) Meta Platforms, Inc. and affiliates.

// Use this include instead of Python.h.  Python.h must come before any
// standard header, and pulling in structmember.h here keeps every binding
// file on the same set of declarations.

#pragma once

#define PY_SSIZE_T_CLEAN
#include <Python.h>

#include <structmember.h>
