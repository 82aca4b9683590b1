/// \file ModularCorrelator.cpp
/// Circular cross-correlation of residue vectors through the FFT.

//
// This file is distributed under the MIT License. See LICENSE.md for details.
//

#include <algorithm>
#include <cinttypes>
#include <cmath>
#include <complex>
#include <limits>
#include <queue>

#include "llvm/Support/MathExtras.h"

#include "unsupported/Eigen/FFT"

#include "fwbase/BaseFinder/ModularCorrelator.h"
#include "fwbase/BaseFinder/ResidueVector.h"
#include "fwbase/Support/Assert.h"
#include "fwbase/Support/Error.h"

using namespace llvm;
using namespace fwbase;

using Complex = std::complex<double>;

uint64_t fwbase::transformLength(uint64_t Modulus) {
  if (Modulus == 0)
    return 0;
  return PowerOf2Ceil(2 * Modulus);
}

double fwbase::estimateTransformError(const ResidueVector &Strings,
                                      const ResidueVector &Pointers) {
  fwbase_assert(Strings.Modulus == Pointers.Modulus);

  // Forward and inverse transforms accumulate O(eps * log2(L)) relative error
  // each, the factor 8 covers the two forward transforms and the inverse one
  double Stages = std::max(1.0,
                           std::log2(transformLength(Strings.Modulus)));
  double Epsilon = std::numeric_limits<double>::epsilon();
  return 8.0 * Epsilon * Stages * std::sqrt(Strings.squaredNorm())
         * std::sqrt(Pointers.squaredNorm());
}

/// Transforms \p Residues zero-padded to \p Length samples
static std::vector<Complex> toSpectrum(Eigen::FFT<double> &FFT,
                                       const ResidueVector &Residues,
                                       uint64_t Length) {
  std::vector<double> Samples(Length, 0.0);
  std::copy(Residues.Counts.begin(), Residues.Counts.end(), Samples.begin());
  std::vector<Complex> Spectrum;
  FFT.fwd(Spectrum, Samples);
  return Spectrum;
}

Expected<Correlation> fwbase::correlate(const ResidueVector &Strings,
                                        const ResidueVector &Pointers) {
  fwbase_assert(Strings.Modulus == Pointers.Modulus);
  uint64_t Modulus = Strings.Modulus;
  fwbase_assert(Modulus > 0 and Modulus <= MaxModulus);
  fwbase_assert(Strings.Counts.size() == Modulus);
  fwbase_assert(Pointers.Counts.size() == Modulus);

  double Estimate = estimateTransformError(Strings, Pointers);
  if (Estimate > RoundingTolerance)
    return createError("the estimated transform error (%f) for modulus %" PRIu64
                       " is too large to recover exact counts",
                       Estimate,
                       Modulus);

  // The circular correlation modulo n is the linear one with the negative
  // lags folded back. Padding to a power of two L >= 2n keeps the two sets of
  // lags apart: lag d >= 0 lands at d, lag d < 0 at L + d.
  uint64_t Length = transformLength(Modulus);
  Eigen::FFT<double> FFT;
  std::vector<Complex> Product = toSpectrum(FFT, Pointers, Length);
  {
    std::vector<Complex> StringsSpectrum = toSpectrum(FFT, Strings, Length);

    // corr(d) = sum_i X[i] * Y[i + d] has spectrum conj(X^) * Y^
    for (size_t K = 0; K < Product.size(); ++K)
      Product[K] *= std::conj(StringsSpectrum[K]);
  }

  std::vector<Complex> Output;
  FFT.inv(Output, Product);
  fwbase_assert(Output.size() == Length);
  Product.clear();
  Product.shrink_to_fit();

  Correlation Result;
  Result.Modulus = Modulus;
  Result.Scores.resize(Modulus);
  for (uint64_t R = 0; R < Modulus; ++R) {
    // Lag R and lag R - n
    double Value = Output[R].real() + Output[Length - Modulus + R].real();
    double Rounded = std::round(Value);
    Result.MaxRoundingError = std::max(Result.MaxRoundingError,
                                       std::abs(Value - Rounded));
    if (Rounded < 0.0)
      Rounded = 0.0;
    Result.Scores[R] = static_cast<uint64_t>(Rounded);
  }

  if (Result.MaxRoundingError > RoundingTolerance)
    return createError("transform rounding error %f for modulus %" PRIu64
                       " exceeds the tolerance",
                       Result.MaxRoundingError,
                       Modulus);

  return Result;
}

Correlation fwbase::correlateDirect(const ResidueVector &Strings,
                                   const ResidueVector &Pointers) {
  fwbase_assert(Strings.Modulus == Pointers.Modulus);
  uint64_t Modulus = Strings.Modulus;

  Correlation Result;
  Result.Modulus = Modulus;
  Result.Scores.assign(Modulus, 0);
  for (uint64_t R = 0; R < Modulus; ++R)
    for (uint64_t I = 0; I < Modulus; ++I)
      Result.Scores[R] += Strings.Counts[I]
                          * Pointers.Counts[(I + R) % Modulus];

  return Result;
}

/// Orders peaks by decreasing score, then by increasing residue
static bool isBetter(const Peak &A, const Peak &B) {
  if (A.Score != B.Score)
    return A.Score > B.Score;
  return A.Residue < B.Residue;
}

std::vector<Peak> fwbase::findPeaks(const Correlation &Correlation,
                                    unsigned Count) {
  std::vector<Peak> Result;
  const std::vector<uint64_t> &Scores = Correlation.Scores;
  if (Scores.empty() or Count == 0)
    return Result;

  uint64_t Max = *std::max_element(Scores.begin(), Scores.end());
  for (uint64_t R = 0; R < Scores.size(); ++R)
    if (Scores[R] == Max)
      Result.push_back({ R, Max });

  if (Result.size() >= Count)
    return Result;

  // The top of the queue is the worst of the best peaks seen so far
  size_t Missing = Count - Result.size();
  std::priority_queue<Peak, std::vector<Peak>, decltype(&isBetter)> Best(
    &isBetter);
  for (uint64_t R = 0; R < Scores.size(); ++R) {
    if (Scores[R] == Max)
      continue;

    Best.push({ R, Scores[R] });
    if (Best.size() > Missing)
      Best.pop();
  }

  size_t Start = Result.size();
  while (not Best.empty()) {
    Result.push_back(Best.top());
    Best.pop();
  }
  std::sort(Result.begin() + Start, Result.end(), isBetter);

  return Result;
}
