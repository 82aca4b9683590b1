#pragma once

//
// This file is distributed under the MIT License. See LICENSE.md for details.
//

#include <vector>

#include "llvm/ADT/Twine.h"
#include "llvm/Support/Error.h"

namespace fwbase {

template<typename... Ts>
inline llvm::Error createError(char const *Fmt, const Ts &...Vals) {
  return llvm::createStringError(llvm::inconvertibleErrorCode(), Fmt, Vals...);
}

inline llvm::Error createError(const llvm::Twine &S) {
  return llvm::createStringError(llvm::inconvertibleErrorCode(), S);
}

/// Merges all the errors in \p Errors in a single one, successes are dropped
inline llvm::Error joinErrors(std::vector<llvm::Error> &Errors) {
  llvm::Error Result = llvm::Error::success();
  for (llvm::Error &Error : Errors)
    Result = llvm::joinErrors(std::move(Result), std::move(Error));
  Errors.clear();
  return Result;
}

} // namespace fwbase
