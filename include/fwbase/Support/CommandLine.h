#pragma once

//
// This file is distributed under the MIT License. See LICENSE.md for details.
//

#include "llvm/Support/CommandLine.h"

/// Category collecting all the options of fwbase, every other option is hidden
extern llvm::cl::OptionCategory MainCategory;
