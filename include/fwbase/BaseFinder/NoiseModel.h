#pragma once

//
// This file is distributed under the MIT License. See LICENSE.md for details.
//

#include <cstdint>

namespace fwbase {

/// Binomial model of the coincidental matches between strings and pointers
///
/// For a wrong shift, each string lands on a residue hit by some pointer with
/// probability p = |Pointers| / Modulus, therefore the score of a wrong shift
/// is distributed as Binomial(|Strings|, p). The score of the right shift
/// exceeds it by the number of actual pointers to strings.
class NoiseModel {
private:
  uint64_t StringCount = 0;
  uint64_t PointerCount = 0;
  uint64_t Modulus = 0;

public:
  NoiseModel(uint64_t StringCount, uint64_t PointerCount, uint64_t Modulus);

public:
  uint64_t modulus() const { return Modulus; }

  /// Probability that a string hits a pointer for a random shift
  double hitProbability() const;

  /// Expected score of a random shift
  double floor() const;

  double standardDeviation() const;

  /// Smallest score considered a signal, \p Z standard deviations above the
  /// floor, and never less than a single match
  double threshold(double Z) const;

  bool isSignificant(uint64_t Score, double Z) const {
    return static_cast<double>(Score) >= threshold(Z);
  }

  /// Distance of \p Score from the noise floor
  double margin(uint64_t Score) const {
    return static_cast<double>(Score) - floor();
  }

  /// Expected number of wrong shifts scoring at least \p Score
  double expectedSpuriousPeaks(uint64_t Score) const;
};

/// Slack factor keeping the pointer density per residue around 1/16 for
/// pointers aligned to \p Alignment, within a sane memory overhead
double recommendedSlackFactor(unsigned Alignment);

/// Peak memory, in bytes, used to correlate a single modulus
uint64_t estimateCorrelationMemory(uint64_t Modulus);

} // namespace fwbase
