/// \file ResidueVector.cpp

//
// This file is distributed under the MIT License. See LICENSE.md for details.
//

#include <numeric>

#include "fwbase/BaseFinder/Errors.h"
#include "fwbase/BaseFinder/ResidueVector.h"

using namespace llvm;
using namespace fwbase;

uint64_t ResidueVector::total() const {
  return std::accumulate(Counts.begin(), Counts.end(), uint64_t(0));
}

double ResidueVector::squaredNorm() const {
  double Result = 0.0;
  for (uint64_t Count : Counts)
    Result += static_cast<double>(Count) * static_cast<double>(Count);
  return Result;
}

Expected<ResidueVector> fwbase::buildResidueVector(ArrayRef<uint64_t> Values,
                                                   uint64_t Modulus) {
  if (Modulus == 0)
    return make_error<InvalidModulusError>(Modulus, "must be positive");

  if (Modulus > MaxModulus)
    return make_error<InvalidModulusError>(Modulus,
                                           "exceeds the largest supported "
                                           "transform size");

  ResidueVector Result;
  Result.Modulus = Modulus;
  Result.Counts.assign(Modulus, 0);
  for (uint64_t Value : Values)
    ++Result.Counts[Value % Modulus];

  return Result;
}
