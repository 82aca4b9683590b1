/// \file Errors.cpp
/// The errors that can be produced while looking for the base address.

//
// This file is distributed under the MIT License. See LICENSE.md for details.
//

#include "llvm/Support/Error.h"
#include "llvm/Support/raw_ostream.h"

#include "fwbase/BaseFinder/Errors.h"

using namespace llvm;
using namespace fwbase;

char InputError::ID;

void InputError::log(raw_ostream &OS) const {
  OS << "Invalid input: " << Message;
}

std::error_code InputError::convertToErrorCode() const {
  return inconvertibleErrorCode();
}

char InsufficientDataError::ID;

void InsufficientDataError::log(raw_ostream &OS) const {
  OS << "Not enough data to correlate: found " << StringCount
     << " strings and " << PointerCount << " pointer candidates";
}

std::error_code InsufficientDataError::convertToErrorCode() const {
  return inconvertibleErrorCode();
}

char InvalidModulusError::ID;

void InvalidModulusError::log(raw_ostream &OS) const {
  OS << "Invalid modulus " << Modulus << ": " << Reason;
}

std::error_code InvalidModulusError::convertToErrorCode() const {
  return inconvertibleErrorCode();
}

char InsufficientRangeError::ID;

void InsufficientRangeError::log(raw_ostream &OS) const {
  OS << "Cannot cover the address space: " << Message;
}

std::error_code InsufficientRangeError::convertToErrorCode() const {
  return inconvertibleErrorCode();
}

char AmbiguousResultError::ID;

void AmbiguousResultError::log(raw_ostream &OS) const {
  OS << "No candidate base reached the agreement threshold (" << Threshold
     << "/" << ModuliCount << ")";
  if (Best)
    OS << ", best candidate " << Best->toString() << " with agreement "
       << Agreement << "/" << ModuliCount;
  else
    OS << ", no consistent candidate";
}

std::error_code AmbiguousResultError::convertToErrorCode() const {
  return inconvertibleErrorCode();
}
