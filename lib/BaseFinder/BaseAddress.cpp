/// \file BaseAddress.cpp

//
// This file is distributed under the MIT License. See LICENSE.md for details.
//

#include "llvm/ADT/StringExtras.h"

#include "fwbase/BaseFinder/BaseAddress.h"

using namespace fwbase;

std::string BaseAddress::toString() const {
  std::string Result = Negative ? "-0x" : "0x";
  Result += llvm::utohexstr(Magnitude, /* LowerCase */ true);
  return Result;
}
