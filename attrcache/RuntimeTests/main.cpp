// Copyright (c) Meta Platforms, Inc. and affiliates.
#include <gtest/gtest.h>

#include "attrcache/python.h"

#include <sys/resource.h>

#include <cstdlib>
#include <iostream>

PyMODINIT_FUNC PyInit__attrcache();

int main(int argc, char* argv[]) {
  if (PyImport_AppendInittab("_attrcache", PyInit__attrcache) != 0) {
    PyErr_Print();
    std::cerr << "Error: could not add to inittab\n";
    return 1;
  }

  ::testing::InitGoogleTest(&argc, argv);

  std::cout << "Python Version: " << PY_MAJOR_VERSION << "." << PY_MINOR_VERSION
            << std::endl;

  wchar_t* argv0 = Py_DecodeLocale(argv[0], nullptr);
  if (argv0 == nullptr) {
    std::cerr << "Py_DecodeLocale() failed to allocate\n";
    std::abort();
  }
  Py_SetProgramName(argv0);

  // Particularly with ASAN, we might need a really large stack size.
  struct rlimit rl;
  rl.rlim_cur = RLIM_INFINITY;
  rl.rlim_max = RLIM_INFINITY;
  setrlimit(RLIMIT_STACK, &rl);

  int result = RUN_ALL_TESTS();

  PyMem_RawFree(argv0);
  return result;
}
