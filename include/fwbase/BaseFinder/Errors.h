#pragma once

//
// This file is distributed under the MIT License. See LICENSE.md for details.
//

#include <optional>
#include <string>

#include "llvm/ADT/Twine.h"
#include "llvm/Support/Error.h"
#include "llvm/Support/raw_ostream.h"

#include "fwbase/BaseFinder/BaseAddress.h"

namespace fwbase {

/// Error produced when the input file can't be read or the parameters are
/// inconsistent
class InputError : public llvm::ErrorInfo<InputError> {
public:
  static char ID;

private:
  std::string Message;

public:
  InputError(const llvm::Twine &Message) : Message(Message.str()) {}

public:
  std::error_code convertToErrorCode() const override;
  void log(llvm::raw_ostream &OS) const override;
};

/// Error produced when there are not enough strings or pointers to correlate
class InsufficientDataError : public llvm::ErrorInfo<InsufficientDataError> {
public:
  static char ID;

private:
  uint64_t StringCount;
  uint64_t PointerCount;

public:
  InsufficientDataError(uint64_t StringCount, uint64_t PointerCount) :
    StringCount(StringCount), PointerCount(PointerCount) {}

public:
  uint64_t stringCount() const { return StringCount; }
  uint64_t pointerCount() const { return PointerCount; }

  std::error_code convertToErrorCode() const override;
  void log(llvm::raw_ostream &OS) const override;
};

/// Error produced when a modulus can't be used to build a residue vector
class InvalidModulusError : public llvm::ErrorInfo<InvalidModulusError> {
public:
  static char ID;

private:
  uint64_t Modulus;
  std::string Reason;

public:
  InvalidModulusError(uint64_t Modulus, const llvm::Twine &Reason) :
    Modulus(Modulus), Reason(Reason.str()) {}

public:
  uint64_t modulus() const { return Modulus; }

  std::error_code convertToErrorCode() const override;
  void log(llvm::raw_ostream &OS) const override;
};

/// Error produced when no set of moduli can cover the address space
class InsufficientRangeError : public llvm::ErrorInfo<InsufficientRangeError> {
public:
  static char ID;

private:
  std::string Message;

public:
  InsufficientRangeError(const llvm::Twine &Message) :
    Message(Message.str()) {}

public:
  std::error_code convertToErrorCode() const override;
  void log(llvm::raw_ostream &OS) const override;
};

/// Error produced when no candidate base collects enough agreement across
/// the moduli
///
/// It carries the best candidate found so far, if any, so that it can be
/// reported to the user together with its (low) agreement ratio.
class AmbiguousResultError : public llvm::ErrorInfo<AmbiguousResultError> {
public:
  static char ID;

private:
  std::optional<BaseAddress> Best;
  unsigned Agreement;
  unsigned ModuliCount;
  unsigned Threshold;

public:
  AmbiguousResultError(std::optional<BaseAddress> Best,
                       unsigned Agreement,
                       unsigned ModuliCount,
                       unsigned Threshold) :
    Best(Best),
    Agreement(Agreement),
    ModuliCount(ModuliCount),
    Threshold(Threshold) {}

public:
  const std::optional<BaseAddress> &best() const { return Best; }
  unsigned agreement() const { return Agreement; }
  unsigned moduliCount() const { return ModuliCount; }
  unsigned threshold() const { return Threshold; }

  std::error_code convertToErrorCode() const override;
  void log(llvm::raw_ostream &OS) const override;
};

} // namespace fwbase
