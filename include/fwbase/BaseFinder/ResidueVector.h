#pragma once

//
// This file is distributed under the MIT License. See LICENSE.md for details.
//

#include <cstdint>
#include <vector>

#include "llvm/ADT/ArrayRef.h"
#include "llvm/Support/Error.h"

namespace fwbase {

/// Largest supported modulus
///
/// A modulus n is correlated through a transform of the next power of two at
/// least 2 * n, whose plans the backend keys by twice the length in an `int`.
inline constexpr uint64_t MaxModulus = uint64_t(1) << 28;

/// Histogram of a set of integers reduced modulo Modulus
///
/// Counts[I] is the number of values congruent to I modulo Modulus.
struct ResidueVector {
  uint64_t Modulus = 0;
  std::vector<uint64_t> Counts;

  /// \return the number of values accumulated in the vector
  uint64_t total() const;

  /// \return the sum of squares of the counts, i.e., the squared L2 norm
  double squaredNorm() const;
};

/// Builds the residue vector of \p Values modulo \p Modulus
///
/// Fails with InvalidModulusError if \p Modulus is zero or larger than
/// MaxModulus.
llvm::Expected<ResidueVector>
buildResidueVector(llvm::ArrayRef<uint64_t> Values, uint64_t Modulus);

} // namespace fwbase
