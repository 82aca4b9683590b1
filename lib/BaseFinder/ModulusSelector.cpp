/// \file ModulusSelector.cpp
/// Selection of the moduli used to split the address space.

//
// This file is distributed under the MIT License. See LICENSE.md for details.
//

#include <algorithm>
#include <cmath>
#include <limits>
#include <numeric>

#include "llvm/ADT/STLExtras.h"
#include "llvm/ADT/StringExtras.h"
#include "llvm/Support/MathExtras.h"

#include "fwbase/BaseFinder/Errors.h"
#include "fwbase/BaseFinder/ModulusSelector.h"
#include "fwbase/BaseFinder/ResidueVector.h"
#include "fwbase/Support/Assert.h"
#include "fwbase/Support/Debug.h"

using namespace llvm;
using namespace fwbase;

static Logger<> Log("moduli");

static unsigned bitLength(uint64_t Value) {
  return 64 - countLeadingZeros(Value);
}

/// Compare two APInts of possibly different bit widths
static bool isGreater(const APInt &A, const APInt &B) {
  unsigned Width = std::max(A.getBitWidth(), B.getBitWidth());
  return A.zextOrTrunc(Width).ugt(B.zextOrTrunc(Width));
}

static APInt multiply(const APInt &Product, uint64_t Factor) {
  unsigned Width = Product.getBitWidth() + bitLength(Factor);
  return Product.zextOrTrunc(Width) * APInt(Width, Factor);
}

APInt ModulusSet::product() const {
  fwbase_assert(BitWidth > 0);
  APInt Result(BitWidth, 1);
  for (uint64_t Modulus : Moduli)
    Result *= APInt(BitWidth, Modulus);
  return Result;
}

APInt fwbase::addressRange(unsigned PointerWidth,
                           uint64_t FileLength,
                           unsigned BitWidth) {
  fwbase_assert(BitWidth > 8 * PointerWidth + 1 and BitWidth > 65);
  APInt Result = APInt::getOneBitSet(BitWidth, 8 * PointerWidth);
  Result += APInt(BitWidth, FileLength);
  return Result;
}

uint64_t fwbase::minimumModulus(uint64_t FileLength, double SlackFactor) {
  fwbase_assert(SlackFactor >= 1.0);
  double Scaled = std::ceil(static_cast<double>(FileLength) * SlackFactor);
  uint64_t Result = FileLength + 1;
  if (Scaled >= static_cast<double>(std::numeric_limits<uint64_t>::max()))
    return std::numeric_limits<uint64_t>::max();
  Result = std::max(Result, static_cast<uint64_t>(Scaled));
  return std::max<uint64_t>(Result, 3);
}

bool fwbase::arePairwiseCoprime(ArrayRef<uint64_t> Moduli) {
  for (size_t I = 0; I < Moduli.size(); ++I)
    for (size_t J = I + 1; J < Moduli.size(); ++J)
      if (std::gcd(Moduli[I], Moduli[J]) != 1)
        return false;
  return true;
}

/// \return true if \p Candidate shares no factor with the chosen moduli
static bool isCoprimeWithAll(uint64_t Candidate, ArrayRef<uint64_t> Chosen) {
  return llvm::all_of(Chosen, [Candidate](uint64_t Modulus) {
    return std::gcd(Candidate, Modulus) == 1;
  });
}

Expected<ModulusSet> fwbase::selectModuli(const ModulusRequest &Request) {
  fwbase_assert(Request.SlackFactor >= 1.0);
  fwbase_assert(Request.PointerWidth > 0 and Request.PointerWidth <= 8);

  uint64_t Minimum = minimumModulus(Request.FileLength, Request.SlackFactor);

  unsigned RangeWidth = std::max(8 * Request.PointerWidth, 64u) + 2;
  APInt Range = addressRange(Request.PointerWidth,
                             Request.FileLength,
                             RangeWidth);

  fwbase_log(Log,
             "Looking for moduli of at least "
               << Minimum << " covering " << toString(Range, 16, false));

  // Even moduli are avoided: unaligned pointer tables produce many values
  // differing by multiples of 256, which pile up on a few residues
  uint64_t Candidate = Minimum | 1;

  ModulusSet Result;
  APInt Product(1, 1);
  unsigned Extra = 0;
  while (Result.CoveringCount == 0 or Extra < Request.Redundancy) {
    while (Candidate <= MaxModulus
           and not isCoprimeWithAll(Candidate, Result.Moduli))
      Candidate += 2;

    if (Candidate > MaxModulus)
      return make_error<InsufficientRangeError>("no modulus of at least "
                                                + Twine(Minimum)
                                                + " fits the largest supported "
                                                  "modulus ("
                                                + Twine(MaxModulus) + ")");

    Result.Moduli.push_back(Candidate);
    Product = multiply(Product, Candidate);

    if (Result.CoveringCount != 0)
      ++Extra;
    else if (isGreater(Product, Range))
      Result.CoveringCount = Result.size();

    fwbase_log(Log, "Selected modulus " << Candidate);
    Candidate += 2;
  }

  fwbase_assert(arePairwiseCoprime(Result.Moduli));

  // Fewest moduli that can determine a base on their own
  SmallVector<uint64_t, 8> Sorted(Result.Moduli.begin(), Result.Moduli.end());
  llvm::sort(Sorted, std::greater<uint64_t>());
  APInt Partial(1, 1);
  for (uint64_t Modulus : Sorted) {
    Partial = multiply(Partial, Modulus);
    ++Result.MinimumDetermining;
    if (isGreater(Partial, Range))
      break;
  }

  Result.BitWidth = RangeWidth;
  for (uint64_t Modulus : Result.Moduli)
    Result.BitWidth += bitLength(Modulus);

  fwbase_log(Log,
             Result.size() << " moduli, " << Result.CoveringCount
                           << " covering the range, at least "
                           << Result.MinimumDetermining
                           << " needed to determine a base");

  return Result;
}
