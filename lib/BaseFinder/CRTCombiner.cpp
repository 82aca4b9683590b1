/// \file CRTCombiner.cpp
/// Reconstruction of full-width base addresses from per-modulus residues.

//
// This file is distributed under the MIT License. See LICENSE.md for details.
//

#include <algorithm>
#include <limits>
#include <map>

#include "llvm/ADT/STLExtras.h"

#include "fwbase/BaseFinder/CRTCombiner.h"
#include "fwbase/BaseFinder/Errors.h"
#include "fwbase/BaseFinder/ModulusSelector.h"
#include "fwbase/Support/Assert.h"
#include "fwbase/Support/Debug.h"

using namespace llvm;
using namespace fwbase;

static Logger<> Log("crt");

/// \return the inverse of \p Value modulo \p Modulus, which must be coprime
static uint64_t modularInverse(uint64_t Value, uint64_t Modulus) {
  if (Modulus == 1)
    return 0;

  int64_t OldR = static_cast<int64_t>(Value % Modulus);
  int64_t R = static_cast<int64_t>(Modulus);
  int64_t OldS = 1;
  int64_t S = 0;
  while (R != 0) {
    int64_t Quotient = OldR / R;
    std::tie(OldR, R) = std::make_pair(R, OldR - Quotient * R);
    std::tie(OldS, S) = std::make_pair(S, OldS - Quotient * S);
  }

  fwbase_assert(OldR == 1, "Moduli are not coprime");
  int64_t Signed = static_cast<int64_t>(Modulus);
  return static_cast<uint64_t>(((OldS % Signed) + Signed) % Signed);
}

void CRTAccumulator::add(uint64_t Residue, uint64_t Modulus) {
  fwbase_assert(Modulus > 0);
  fwbase_assert(Modulus <= std::numeric_limits<uint32_t>::max());
  unsigned BitWidth = Product.getBitWidth();
  fwbase_check(Product.getActiveBits() + Log2_64_Ceil(Modulus + 1) <= BitWidth,
               "CRT accumulator overflow");

  // Garner step: X' = X + P * T with T = (R - X) * P^-1 (mod N)
  uint64_t Inverse = modularInverse(Product.urem(Modulus), Modulus);
  uint64_t Delta = (Residue % Modulus + Modulus - Value.urem(Modulus))
                   % Modulus;
  uint64_t T = (Delta * Inverse) % Modulus;

  Value += Product * APInt(BitWidth, T);
  Product *= APInt(BitWidth, Modulus);
}

APInt fwbase::reconstruct(ArrayRef<uint64_t> Residues,
                          ArrayRef<uint64_t> Moduli,
                          unsigned BitWidth) {
  fwbase_assert(Residues.size() == Moduli.size());
  CRTAccumulator Accumulator(BitWidth);
  for (auto [Residue, Modulus] : zip(Residues, Moduli))
    Accumulator.add(Residue, Modulus);
  return Accumulator.value();
}

const Peak *ModulusCandidates::find(uint64_t Residue) const {
  auto It = llvm::find_if(Peaks, [Residue](const Peak &P) {
    return P.Residue == Residue;
  });
  return It != Peaks.end() ? &*It : nullptr;
}

unsigned fwbase::agreementThreshold(unsigned ModuliCount,
                                    unsigned MinimumDetermining,
                                    unsigned Confirmations) {
  fwbase_assert(ModuliCount > 0);
  unsigned Majority = ModuliCount / 2 + 1;
  unsigned Confirmed = std::min(MinimumDetermining + Confirmations,
                                ModuliCount);
  return std::max(Majority, Confirmed);
}

namespace {

/// Depth-first exploration of the combinations of one candidate residue per
/// modulus
///
/// Moduli can be skipped as long as the remaining ones can still reach the
/// agreement threshold. As soon as the chosen moduli cover the address range
/// the base is determined and the remaining moduli are only checked.
class CombinationSearch {
private:
  ArrayRef<ModulusCandidates> Candidates;
  const CombinerConstraints &Constraints;
  unsigned MaxSkipped = 0;
  APInt Range;
  APInt PositiveLimit;
  APInt NegativeLimit;
  APInt FullProduct;
  uint64_t Steps = 0;
  bool Truncated = false;
  std::map<BaseAddress, CombinedCandidate> Found;

public:
  CombinationSearch(ArrayRef<ModulusCandidates> Candidates,
                    const CombinerConstraints &Constraints,
                    unsigned Threshold) :
    Candidates(Candidates), Constraints(Constraints) {
    unsigned BitWidth = Constraints.BitWidth;
    MaxSkipped = Candidates.size() - Threshold;
    Range = addressRange(Constraints.PointerWidth,
                         Constraints.FileLength,
                         BitWidth);
    PositiveLimit = APInt::getOneBitSet(BitWidth,
                                        8 * Constraints.PointerWidth);
    NegativeLimit = APInt(BitWidth, Constraints.FileLength);
    FullProduct = APInt(BitWidth, 1);
    for (const ModulusCandidates &Modulus : Candidates)
      FullProduct *= APInt(BitWidth, Modulus.Modulus);
  }

public:
  void run() { visit(0, CRTAccumulator(Constraints.BitWidth), 0); }

  bool truncated() const { return Truncated; }
  uint64_t steps() const { return Steps; }

  std::vector<CombinedCandidate> takeCandidates() {
    std::vector<CombinedCandidate> Result;
    Result.reserve(Found.size());
    for (auto &Entry : Found)
      Result.push_back(std::move(Entry.second));
    Found.clear();
    return Result;
  }

private:
  void visit(unsigned Index, const CRTAccumulator &Accumulator, unsigned Skip) {
    if (Truncated)
      return;

    if (++Steps > Constraints.MaxSteps) {
      Truncated = true;
      return;
    }

    if (Accumulator.product().ugt(Range)) {
      evaluate(Accumulator);
      return;
    }

    if (Index == Candidates.size())
      return;

    const ModulusCandidates &Current = Candidates[Index];
    for (const Peak &P : Current.Peaks) {
      CRTAccumulator Next = Accumulator;
      Next.add(P.Residue, Current.Modulus);
      visit(Index + 1, Next, Skip);
    }

    if (Skip < MaxSkipped)
      visit(Index + 1, Accumulator, Skip + 1);
  }

  void evaluate(const CRTAccumulator &Accumulator) {
    const APInt &Value = Accumulator.value();

    BaseAddress Base;
    if (Value.ult(PositiveLimit)) {
      Base = BaseAddress(Value.getZExtValue());
    } else {
      APInt Distance = Accumulator.product() - Value;
      if (not Distance.ult(NegativeLimit))
        return;
      Base = BaseAddress::negative(Distance.getZExtValue());
    }

    if (Found.count(Base) != 0)
      return;

    CombinedCandidate Candidate;
    Candidate.Base = Base;
    for (const ModulusCandidates &Modulus : Candidates) {
      if (const Peak *Match = Modulus.find(Base.residue(Modulus.Modulus))) {
        Candidate.AgreeingModuli.push_back(Modulus.Modulus);
        Candidate.Score += Match->Score;
      }
    }

    APInt Magnitude(Constraints.BitWidth, Base.magnitude());
    Candidate.Canonical = Base.isNegative() ? FullProduct - Magnitude :
                                              Magnitude;

    Found.emplace(Base, std::move(Candidate));
  }
};

} // namespace

static bool isPreferable(const CombinedCandidate &A,
                         const CombinedCandidate &B) {
  if (A.agreement() != B.agreement())
    return A.agreement() > B.agreement();
  if (A.Score != B.Score)
    return A.Score > B.Score;
  if (A.Base.isNegative() != B.Base.isNegative())
    return not A.Base.isNegative();
  return A.Base.magnitude() < B.Base.magnitude();
}

Expected<CombinationResult>
fwbase::combine(ArrayRef<ModulusCandidates> Candidates,
                const CombinerConstraints &Constraints) {
  fwbase_assert(not Candidates.empty());
  fwbase_assert(Constraints.BitWidth > 8 * Constraints.PointerWidth + 1);

  CombinationResult Result;
  Result.ModuliCount = Candidates.size();
  Result.Threshold = agreementThreshold(Result.ModuliCount,
                                        Constraints.MinimumDetermining,
                                        Constraints.Confirmations);

  CombinationSearch Search(Candidates, Constraints, Result.Threshold);
  Search.run();
  Result.Truncated = Search.truncated();
  Result.Ranked = Search.takeCandidates();
  llvm::sort(Result.Ranked, isPreferable);

  fwbase_log(Log,
             Result.Ranked.size() << " candidates after " << Search.steps()
                                  << " steps"
                                  << (Result.Truncated ? " (truncated)" : ""));
  {
    LoggerIndent<> Indent(Log);
    for (const CombinedCandidate &Candidate :
         makeArrayRef(Result.Ranked).take_front(8))
      fwbase_log(Log,
                 Candidate.Base.toString()
                   << ": " << Candidate.agreement() << "/"
                   << Result.ModuliCount << ", score " << Candidate.Score);
  }

  if (Result.Ranked.empty())
    return make_error<AmbiguousResultError>(std::nullopt,
                                            0,
                                            Result.ModuliCount,
                                            Result.Threshold);

  const CombinedCandidate &Best = Result.best();
  if (Best.agreement() < Result.Threshold)
    return make_error<AmbiguousResultError>(Best.Base,
                                            Best.agreement(),
                                            Result.ModuliCount,
                                            Result.Threshold);

  return Result;
}
