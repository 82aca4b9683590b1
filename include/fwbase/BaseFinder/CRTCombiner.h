#pragma once

//
// This file is distributed under the MIT License. See LICENSE.md for details.
//

#include <cstdint>
#include <vector>

#include "llvm/ADT/APInt.h"
#include "llvm/ADT/ArrayRef.h"
#include "llvm/ADT/SmallVector.h"
#include "llvm/Support/Error.h"

#include "fwbase/BaseFinder/BaseAddress.h"
#include "fwbase/BaseFinder/ModularCorrelator.h"

namespace fwbase {

/// Incremental solver of a system of congruences X = R_i (mod N_i)
///
/// The moduli must be pairwise coprime and smaller than 2^32. Value() is always
/// the unique solution in [0, product()).
class CRTAccumulator {
private:
  llvm::APInt Value;
  llvm::APInt Product;

public:
  explicit CRTAccumulator(unsigned BitWidth) :
    Value(BitWidth, 0), Product(BitWidth, 1) {}

public:
  /// Adds the congruence X = \p Residue (mod \p Modulus)
  void add(uint64_t Residue, uint64_t Modulus);

  const llvm::APInt &value() const { return Value; }
  const llvm::APInt &product() const { return Product; }
};

/// \return the unique X in [0, prod(Moduli)) with X = Residues[I] (mod
///         Moduli[I]) for each I, BitWidth bits wide
llvm::APInt reconstruct(llvm::ArrayRef<uint64_t> Residues,
                        llvm::ArrayRef<uint64_t> Moduli,
                        unsigned BitWidth);

/// The residues of a modulus that are worth combining
struct ModulusCandidates {
  uint64_t Modulus = 0;
  /// Sorted by decreasing score. Empty if the modulus carries no signal.
  llvm::SmallVector<Peak, 4> Peaks;

  /// \return the peak with residue \p Residue, if any
  const Peak *find(uint64_t Residue) const;
};

struct CombinerConstraints {
  /// Pointer width in bytes, bounds the non-negative bases
  unsigned PointerWidth = 8;
  /// Bounds the negative bases
  uint64_t FileLength = 0;
  /// Fewest moduli determining a base on their own (see ModulusSet)
  unsigned MinimumDetermining = 0;
  /// Bit width for the arithmetic (see ModulusSet)
  unsigned BitWidth = 0;
  /// Agreeing moduli required on top of the MinimumDetermining ones
  unsigned Confirmations = 2;
  /// Stop exploring combinations after this many search steps
  uint64_t MaxSteps = uint64_t(1) << 22;
};

struct CombinedCandidate {
  BaseAddress Base;
  /// Base reduced in [0, product of all the moduli)
  llvm::APInt Canonical;
  /// Moduli whose candidates contain the residue of Base
  llvm::SmallVector<uint64_t, 8> AgreeingModuli;
  /// Sum of the scores of the agreeing residues
  uint64_t Score = 0;

  unsigned agreement() const { return AgreeingModuli.size(); }
};

struct CombinationResult {
  /// All the candidates found, best first
  std::vector<CombinedCandidate> Ranked;
  unsigned ModuliCount = 0;
  unsigned Threshold = 0;
  /// The search was interrupted by CombinerConstraints::MaxSteps
  bool Truncated = false;

  const CombinedCandidate &best() const { return Ranked.front(); }
};

/// Number of agreeing moduli required to accept a base: a strict majority of
/// \p ModuliCount and \p Confirmations moduli more than the ones needed to
/// determine the base, as long as there are enough moduli
unsigned agreementThreshold(unsigned ModuliCount,
                            unsigned MinimumDetermining,
                            unsigned Confirmations);

/// Reconstructs the bases consistent with the per-modulus candidates and ranks
/// them by cross-modulus agreement
///
/// Fails with AmbiguousResultError if the best candidate does not reach
/// agreementThreshold().
llvm::Expected<CombinationResult>
combine(llvm::ArrayRef<ModulusCandidates> Candidates,
        const CombinerConstraints &Constraints);

} // namespace fwbase
