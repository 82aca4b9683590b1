#pragma once

//
// This file is distributed under the MIT License. See LICENSE.md for details.
//

#include <cstdint>

#include "llvm/ADT/APInt.h"
#include "llvm/ADT/ArrayRef.h"
#include "llvm/ADT/SmallVector.h"
#include "llvm/Support/Error.h"

namespace fwbase {

struct ModulusRequest {
  uint64_t FileLength = 0;
  /// Pointer width in bytes
  unsigned PointerWidth = 8;
  /// Each modulus is at least FileLength * SlackFactor
  double SlackFactor = 1.0;
  /// Number of moduli on top of the ones needed to cover the address space
  unsigned Redundancy = 3;
};

struct ModulusSet {
  /// Pairwise coprime moduli, in selection order
  llvm::SmallVector<uint64_t, 8> Moduli;
  /// The first CoveringCount moduli alone cover the address range
  unsigned CoveringCount = 0;
  /// Smallest number of moduli whose product covers the address range
  unsigned MinimumDetermining = 0;
  /// Bit width suitable for the product of all the moduli and for the range
  unsigned BitWidth = 0;

  size_t size() const { return Moduli.size(); }

  /// \return the product of all the moduli, BitWidth bits wide
  llvm::APInt product() const;
};

/// Number of distinct base addresses to tell apart: 2^(8 * PointerWidth) for
/// the non-negative ones plus FileLength for the negative ones
llvm::APInt
addressRange(unsigned PointerWidth, uint64_t FileLength, unsigned BitWidth);

/// Smallest acceptable modulus: larger than the file and than
/// FileLength * SlackFactor
uint64_t minimumModulus(uint64_t FileLength, double SlackFactor);

bool arePairwiseCoprime(llvm::ArrayRef<uint64_t> Moduli);

/// Chooses the smallest odd, pairwise coprime moduli of at least
/// minimumModulus() whose product covers the address space, plus Redundancy
/// extra ones
///
/// Fails with InsufficientRangeError if a modulus would exceed MaxModulus.
llvm::Expected<ModulusSet> selectModuli(const ModulusRequest &Request);

} // namespace fwbase
