// Copyright (c) Meta Platforms, Inc. and affiliates.

#pragma once

#include "attrcache/Jit/flag_processor.h"

#include <string>

namespace attrcache {

// Build a FlagProcessor with every attrcache option bound to the global
// Config.  Flags are inspected in order of definition.
FlagProcessor initFlagProcessor();

// Redirect logging to a file.  A "{pid}" marker in the name is replaced with
// the process id.
void setLogFile(const std::string& log_filename);

// Reset the global Config, fill it from X-options and the environment, and
// move to the running state.
//
// Returns 0 on success, or -2 if attrcache-help was given, in which case the
// option help was printed to stdout and the state is left unchanged.
int initialize(const XOptions& xoptions);

// Leave the running state and restore the default Config.
void finalize();

} // namespace attrcache
