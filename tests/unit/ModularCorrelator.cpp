/// \file ModularCorrelator.cpp
/// \brief Tests for the FFT-based circular cross-correlation

//
// This file is distributed under the MIT License. See LICENSE.md for details.
//

#include <chrono>
#include <random>
#include <vector>

#define BOOST_TEST_MODULE ModularCorrelator
bool init_unit_test();
#include "boost/test/unit_test.hpp"

#include "fwbase/BaseFinder/ModularCorrelator.h"
#include "fwbase/BaseFinder/ResidueVector.h"
#include "fwbase/Support/Assert.h"

using namespace llvm;
using namespace fwbase;

static ResidueVector randomResidues(uint64_t Modulus,
                                    uint64_t MaxCount,
                                    std::mt19937 &Generator) {
  std::uniform_int_distribution<uint64_t> Distribution(0, MaxCount);
  ResidueVector Result;
  Result.Modulus = Modulus;
  for (uint64_t I = 0; I < Modulus; ++I)
    Result.Counts.push_back(Distribution(Generator));
  return Result;
}

static Correlation makeCorrelation(std::vector<uint64_t> Scores) {
  Correlation Result;
  Result.Modulus = Scores.size();
  Result.Scores = std::move(Scores);
  return Result;
}

BOOST_AUTO_TEST_CASE(MatchesDirectComputation) {
  std::mt19937 Generator(1234);
  for (uint64_t Modulus = 2; Modulus <= 64; ++Modulus) {
    ResidueVector Strings = randomResidues(Modulus, 5, Generator);
    ResidueVector Pointers = randomResidues(Modulus, 5, Generator);

    auto Fast = correlate(Strings, Pointers);
    fwbase_check(static_cast<bool>(Fast));
    Correlation Slow = correlateDirect(Strings, Pointers);

    BOOST_TEST(Fast->Modulus == Modulus);
    BOOST_TEST(Fast->Scores == Slow.Scores);
    BOOST_TEST(Fast->MaxRoundingError <= RoundingTolerance);
  }
}

BOOST_AUTO_TEST_CASE(LargeOddModulus) {
  std::mt19937 Generator(99);
  // 3 * 5 * 7 * 11 * 13
  uint64_t Modulus = 15015;
  ResidueVector Strings = randomResidues(Modulus, 1, Generator);
  ResidueVector Pointers = randomResidues(Modulus, 1, Generator);

  auto Fast = correlate(Strings, Pointers);
  fwbase_check(static_cast<bool>(Fast));

  // Spot check a few shifts against the definition
  for (uint64_t R : { 0UL, 1UL, 77UL, 15014UL }) {
    uint64_t Expected = 0;
    for (uint64_t I = 0; I < Modulus; ++I)
      Expected += Strings.Counts[I] * Pointers.Counts[(I + R) % Modulus];
    BOOST_TEST(Fast->Scores[R] == Expected);
  }
}

BOOST_AUTO_TEST_CASE(PrimeModulus) {
  std::mt19937 Generator(7);
  uint64_t Modulus = 4099;
  ResidueVector Strings = randomResidues(Modulus, 3, Generator);
  ResidueVector Pointers = randomResidues(Modulus, 3, Generator);

  auto Fast = correlate(Strings, Pointers);
  fwbase_check(static_cast<bool>(Fast));
  BOOST_TEST(Fast->Scores == correlateDirect(Strings, Pointers).Scores);
}

BOOST_AUTO_TEST_CASE(TransformLength) {
  BOOST_TEST(transformLength(0) == 0U);
  BOOST_TEST(transformLength(1) == 2U);
  BOOST_TEST(transformLength(3) == 8U);
  BOOST_TEST(transformLength(4096) == 8192U);
  BOOST_TEST(transformLength(4097) == 16384U);
  BOOST_TEST(transformLength(MaxModulus) == 2 * MaxModulus);
}

BOOST_AUTO_TEST_CASE(LargePrimeModulusIsFast) {
  // A prime modulus around 4M, the size used for a 1 MiB image
  uint64_t Modulus = 4194301;
  uint64_t Shift = 1234567;
  ResidueVector Strings{ Modulus, std::vector<uint64_t>(Modulus, 0) };
  ResidueVector Pointers{ Modulus, std::vector<uint64_t>(Modulus, 0) };

  std::mt19937_64 Generator(5);
  std::uniform_int_distribution<uint64_t> Distribution(0, Modulus - 1);
  uint64_t Placed = 0;
  while (Placed < 500) {
    uint64_t Offset = Distribution(Generator);
    if (Strings.Counts[Offset] != 0)
      continue;
    Strings.Counts[Offset] = 1;
    Pointers.Counts[(Offset + Shift) % Modulus] = 1;
    ++Placed;
  }

  auto Start = std::chrono::steady_clock::now();
  auto Result = correlate(Strings, Pointers);
  auto Elapsed = std::chrono::steady_clock::now() - Start;
  fwbase_check(static_cast<bool>(Result));

  std::vector<Peak> Peaks = findPeaks(*Result, 1);
  BOOST_TEST(Peaks.size() == 1U);
  BOOST_TEST(Peaks[0].Residue == Shift);
  BOOST_TEST(Peaks[0].Score == 500U);

  auto Seconds = std::chrono::duration_cast<std::chrono::seconds>(Elapsed);
  BOOST_TEST(Seconds.count() < 60);
}

BOOST_AUTO_TEST_CASE(SingleMatchGivesTheShift) {
  uint64_t Modulus = 105;
  ResidueVector Strings{ Modulus, std::vector<uint64_t>(Modulus, 0) };
  ResidueVector Pointers{ Modulus, std::vector<uint64_t>(Modulus, 0) };
  Strings.Counts[100] = 1;
  Pointers.Counts[(100 + 42) % Modulus] = 1;

  auto Result = correlate(Strings, Pointers);
  fwbase_check(static_cast<bool>(Result));

  std::vector<Peak> Peaks = findPeaks(*Result, 1);
  BOOST_TEST(Peaks.size() == 1U);
  BOOST_TEST(Peaks[0].Residue == 42U);
  BOOST_TEST(Peaks[0].Score == 1U);
}

BOOST_AUTO_TEST_CASE(PeaksAreSorted) {
  Correlation Scores = makeCorrelation({ 0, 4, 1, 7, 4, 2 });
  std::vector<Peak> Peaks = findPeaks(Scores, 3);

  std::vector<Peak> Expected = { { 3, 7 }, { 1, 4 }, { 4, 4 } };
  fwbase_check(Peaks == Expected);
}

BOOST_AUTO_TEST_CASE(AllTiesForTheMaximumAreKept) {
  Correlation Scores = makeCorrelation({ 3, 1, 3, 0, 3, 2 });

  std::vector<Peak> Peaks = findPeaks(Scores, 2);
  std::vector<Peak> Expected = { { 0, 3 }, { 2, 3 }, { 4, 3 } };
  fwbase_check(Peaks == Expected);

  Peaks = findPeaks(Scores, 5);
  Expected = { { 0, 3 }, { 2, 3 }, { 4, 3 }, { 5, 2 }, { 1, 1 } };
  fwbase_check(Peaks == Expected);
}

BOOST_AUTO_TEST_CASE(MorePeaksThanResidues) {
  Correlation Scores = makeCorrelation({ 1, 2 });
  std::vector<Peak> Peaks = findPeaks(Scores, 10);
  BOOST_TEST(Peaks.size() == 2U);
  BOOST_TEST(findPeaks(Scores, 0).empty());
}

BOOST_AUTO_TEST_CASE(ErrorEstimateGrowsWithTheNorms) {
  uint64_t Modulus = 1001;
  ResidueVector Small{ Modulus, std::vector<uint64_t>(Modulus, 1) };
  ResidueVector Large{ Modulus, std::vector<uint64_t>(Modulus, 100) };

  double SmallError = estimateTransformError(Small, Small);
  double LargeError = estimateTransformError(Large, Large);
  BOOST_TEST(SmallError < LargeError);
  BOOST_TEST(LargeError < RoundingTolerance);
}
