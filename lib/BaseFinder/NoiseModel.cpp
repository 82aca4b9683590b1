/// \file NoiseModel.cpp

//
// This file is distributed under the MIT License. See LICENSE.md for details.
//

#include <algorithm>
#include <cmath>
#include <complex>

#include "fwbase/BaseFinder/ModularCorrelator.h"
#include "fwbase/BaseFinder/NoiseModel.h"
#include "fwbase/Support/Assert.h"

using namespace fwbase;

NoiseModel::NoiseModel(uint64_t StringCount,
                       uint64_t PointerCount,
                       uint64_t Modulus) :
  StringCount(StringCount), PointerCount(PointerCount), Modulus(Modulus) {
  fwbase_assert(Modulus > 0);
}

double NoiseModel::hitProbability() const {
  double P = static_cast<double>(PointerCount) / static_cast<double>(Modulus);
  return std::min(1.0, P);
}

double NoiseModel::floor() const {
  return static_cast<double>(StringCount) * hitProbability();
}

double NoiseModel::standardDeviation() const {
  double P = hitProbability();
  return std::sqrt(static_cast<double>(StringCount) * P * (1.0 - P));
}

double NoiseModel::threshold(double Z) const {
  return std::max(1.0, floor() + Z * standardDeviation());
}

double NoiseModel::expectedSpuriousPeaks(uint64_t Score) const {
  double P = hitProbability();
  if (Score == 0)
    return static_cast<double>(Modulus);
  if (Score > StringCount or P == 0.0)
    return 0.0;
  if (P == 1.0)
    return static_cast<double>(Modulus);

  // Upper tail of Binomial(StringCount, P), term by term in log space
  double N = static_cast<double>(StringCount);
  double LogP = std::log(P);
  double LogQ = std::log1p(-P);
  double Mean = N * P;
  double Tail = 0.0;
  for (uint64_t K = Score; K <= StringCount; ++K) {
    double Kd = static_cast<double>(K);
    double LogTerm = std::lgamma(N + 1.0) - std::lgamma(Kd + 1.0)
                     - std::lgamma(N - Kd + 1.0) + Kd * LogP
                     + (N - Kd) * LogQ;
    double Term = std::exp(LogTerm);
    Tail += Term;

    // Past the mode the terms only shrink
    if (Kd > Mean and Term < Tail * 1e-12)
      break;
  }

  return static_cast<double>(Modulus) * std::min(1.0, Tail);
}

double fwbase::recommendedSlackFactor(unsigned Alignment) {
  fwbase_assert(Alignment > 0);
  return std::clamp(16.0 / static_cast<double>(Alignment), 1.0, 4.0);
}

uint64_t fwbase::estimateCorrelationMemory(uint64_t Modulus) {
  // The two integer residue vectors plus, over the padded length, a real
  // sample buffer and two complex spectra
  uint64_t Length = transformLength(Modulus);
  return Modulus * 2 * sizeof(uint64_t)
         + Length * (sizeof(double) + 2 * sizeof(std::complex<double>));
}
