#pragma once

//
// This file is distributed under the MIT License. See LICENSE.md for details.
//

#include <cstdint>
#include <vector>

#include "llvm/Support/Error.h"

#include "fwbase/BaseFinder/ResidueVector.h"

namespace fwbase {

/// Largest distance between a transform output and its nearest integer that
/// is still considered an exact count
inline constexpr double RoundingTolerance = 0.25;

/// A residue scoring high for a given modulus, i.e., a candidate for the base
/// address modulo that modulus
struct Peak {
  uint64_t Residue = 0;
  uint64_t Score = 0;

  bool operator==(const Peak &) const = default;
};

/// Circular cross-correlation of the strings and pointers residue vectors
///
/// Scores[R] is the number of (string, pointer) pairs such that
/// String + R == Pointer modulo Modulus.
struct Correlation {
  uint64_t Modulus = 0;
  std::vector<uint64_t> Scores;
  double MaxRoundingError = 0.0;
};

/// \return the number of samples of the transforms used to correlate residue
/// vectors modulo \p Modulus: the smallest power of two at least 2 * Modulus
uint64_t transformLength(uint64_t Modulus);

/// A priori bound of the floating point error of the transform-based
/// correlation of \p Strings and \p Pointers
double estimateTransformError(const ResidueVector &Strings,
                              const ResidueVector &Pointers);

/// Computes the circular cross-correlation in the frequency domain
///
/// Runs in O(n log n) for any modulus n, the transforms have power of two
/// lengths. Both vectors must have the same modulus. Fails if the floating point error
/// (estimated or measured) exceeds RoundingTolerance.
llvm::Expected<Correlation> correlate(const ResidueVector &Strings,
                                      const ResidueVector &Pointers);

/// Computes the circular cross-correlation by definition, in quadratic time
Correlation correlateDirect(const ResidueVector &Strings,
                            const ResidueVector &Pointers);

/// Selects the \p Count highest scoring residues of \p Correlation, sorted by
/// decreasing score and increasing residue
///
/// All the residues tied for the highest score are retained, even if they are
/// more than \p Count.
std::vector<Peak> findPeaks(const Correlation &Correlation, unsigned Count);

} // namespace fwbase
