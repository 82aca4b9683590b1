/// \file ResidueVector.cpp
/// \brief Tests for the residue vector builder

//
// This file is distributed under the MIT License. See LICENSE.md for details.
//

#include <random>
#include <vector>

#define BOOST_TEST_MODULE ResidueVector
bool init_unit_test();
#include "boost/test/unit_test.hpp"

#include "fwbase/BaseFinder/Errors.h"
#include "fwbase/BaseFinder/ResidueVector.h"
#include "fwbase/Support/Assert.h"

using namespace llvm;
using namespace fwbase;

static std::vector<uint64_t> randomValues(size_t Count, unsigned Seed) {
  std::mt19937_64 Generator(Seed);
  std::vector<uint64_t> Result;
  for (size_t I = 0; I < Count; ++I)
    Result.push_back(Generator());
  return Result;
}

BOOST_AUTO_TEST_CASE(MatchesBruteForce) {
  std::vector<uint64_t> Values = randomValues(1000, 1);
  Values.push_back(0);
  Values.push_back(UINT64_MAX);

  for (uint64_t Modulus : { 1, 2, 3, 97, 1001, 65535 }) {
    auto Residues = buildResidueVector(Values, Modulus);
    fwbase_check(static_cast<bool>(Residues));
    fwbase_check(Residues->Modulus == Modulus);
    fwbase_check(Residues->Counts.size() == Modulus);

    std::vector<uint64_t> Expected(Modulus, 0);
    for (uint64_t Value : Values)
      ++Expected[Value % Modulus];

    BOOST_TEST(Residues->Counts == Expected);
  }
}

BOOST_AUTO_TEST_CASE(TotalIsTheNumberOfValues) {
  std::vector<uint64_t> Values = randomValues(4321, 2);
  auto Residues = buildResidueVector(Values, 127);
  fwbase_check(static_cast<bool>(Residues));
  BOOST_TEST(Residues->total() == Values.size());
}

BOOST_AUTO_TEST_CASE(DuplicatesAreCounted) {
  std::vector<uint64_t> Values = { 5, 5, 12, 19 };
  auto Residues = buildResidueVector(Values, 7);
  fwbase_check(static_cast<bool>(Residues));
  BOOST_TEST(Residues->Counts[5] == 4U);
  BOOST_TEST(Residues->squaredNorm() == 16.0);
}

BOOST_AUTO_TEST_CASE(EmptyInput) {
  auto Residues = buildResidueVector({}, 11);
  fwbase_check(static_cast<bool>(Residues));
  BOOST_TEST(Residues->total() == 0U);
  BOOST_TEST(Residues->Counts.size() == 11U);
}

BOOST_AUTO_TEST_CASE(InvalidModuli) {
  std::vector<uint64_t> Values = { 1, 2, 3 };

  auto Zero = buildResidueVector(Values, 0);
  fwbase_check(Zero.errorIsA<InvalidModulusError>());
  consumeError(Zero.takeError());

  auto TooLarge = buildResidueVector(Values, MaxModulus + 1);
  fwbase_check(TooLarge.errorIsA<InvalidModulusError>());
  consumeError(TooLarge.takeError());
}
