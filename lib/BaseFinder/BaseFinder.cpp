/// \file BaseFinder.cpp
/// Search of the base address of a raw image through modular correlations.

//
// This file is distributed under the MIT License. See LICENSE.md for details.
//

#include <algorithm>
#include <optional>

#include "llvm/ADT/STLExtras.h"
#include "llvm/Support/FormatVariadic.h"
#include "llvm/Support/Threading.h"
#include "llvm/Support/ThreadPool.h"

#include "fwbase/BaseFinder/BaseFinder.h"
#include "fwbase/BaseFinder/NoiseModel.h"
#include "fwbase/BaseFinder/ResidueVector.h"
#include "fwbase/Support/Assert.h"
#include "fwbase/Support/Debug.h"
#include "fwbase/Support/Error.h"
#include "fwbase/Support/Statistics.h"

using namespace llvm;
using namespace fwbase;

static Logger<> Log("base-finder");
static Logger<> CorrelationLog("correlation");

static RunningStatistics PeakMargin("peak-margin");
static RunningStatistics NoiseSpread("noise-spread");

Error fwbase::validateOptions(const BaseFinderOptions &Options) {
  if (Options.MinStringLength == 0)
    return make_error<InputError>("the minimum string length must be at "
                                  "least 1");

  if (not isValidPointerWidth(Options.Layout.Width))
    return make_error<InputError>("unsupported pointer width "
                                  + Twine(Options.Layout.Width)
                                  + ", expected 1, 2, 4 or 8");

  if (Options.Layout.Alignment == 0)
    return make_error<InputError>("the pointer alignment must be at least 1");

  if (Options.SlackFactor != 0.0 and not(Options.SlackFactor >= 1.0))
    return make_error<InputError>("the slack factor must be at least 1, got "
                                  + formatv("{0:F2}", Options.SlackFactor)
                                      .str());

  if (Options.PeaksPerModulus == 0)
    return make_error<InputError>("at least one peak per modulus must be "
                                  "retained");

  return Error::success();
}

double fwbase::effectiveSlackFactor(const BaseFinderOptions &Options) {
  if (Options.SlackFactor != 0.0)
    return Options.SlackFactor;
  return recommendedSlackFactor(Options.Layout.Alignment);
}

std::vector<uint64_t> ImageScan::stringOffsets() const {
  std::vector<uint64_t> Result;
  Result.reserve(Strings.size());
  for (const StringRun &String : Strings)
    Result.push_back(String.Offset);
  return Result;
}

ImageScan fwbase::scanImage(ArrayRef<uint8_t> Image,
                            const BaseFinderOptions &Options) {
  ImageScan Result;
  Result.FileLength = Image.size();
  Result.Strings = findStrings(Image, Options.MinStringLength);
  Result.Pointers = findPointerTargets(Image, Options.Layout, Result.Strings);
  return Result;
}

ModulusCandidates ModulusAnalysis::candidates() const {
  ModulusCandidates Result;
  Result.Modulus = Modulus;
  Result.Peaks.append(Peaks.begin(), Peaks.end());
  return Result;
}

Expected<ModulusAnalysis>
fwbase::analyzeModulus(ArrayRef<uint64_t> StringOffsets,
                       ArrayRef<uint64_t> Pointers,
                       uint64_t Modulus,
                       const BaseFinderOptions &Options) {
  auto Strings = buildResidueVector(StringOffsets, Modulus);
  if (not Strings)
    return Strings.takeError();

  auto Targets = buildResidueVector(Pointers, Modulus);
  if (not Targets)
    return Targets.takeError();

  auto MaybeCorrelation = correlate(*Strings, *Targets);
  if (not MaybeCorrelation)
    return MaybeCorrelation.takeError();

  NoiseModel Noise(StringOffsets.size(), Pointers.size(), Modulus);

  ModulusAnalysis Result;
  Result.Modulus = Modulus;
  Result.Floor = Noise.floor();
  Result.Threshold = Noise.threshold(Options.SignificanceZ);
  Result.MaxRoundingError = MaybeCorrelation->MaxRoundingError;

  std::vector<Peak> Peaks = findPeaks(*MaybeCorrelation,
                                      Options.PeaksPerModulus);
  fwbase_assert(not Peaks.empty());

  Result.TopScore = Peaks.front().Score;
  Result.TiedCount = llvm::count_if(Peaks, [&Result](const Peak &P) {
    return P.Score == Result.TopScore;
  });

  if (Result.TiedCount > Options.MaxTiedPeaks) {
    Result.Informative = false;
    return Result;
  }

  for (const Peak &P : Peaks)
    if (Noise.isSignificant(P.Score, Options.SignificanceZ))
      Result.Peaks.push_back(P);

  return Result;
}

/// \return how many moduli can be correlated at the same time
static unsigned concurrency(const BaseFinderOptions &Options,
                            ArrayRef<uint64_t> Moduli) {
  unsigned Result = Options.Threads;
  if (Result == 0)
    Result = llvm::hardware_concurrency().compute_thread_count();

  if (Options.MemoryBudget != 0) {
    uint64_t Largest = *std::max_element(Moduli.begin(), Moduli.end());
    uint64_t PerTask = estimateCorrelationMemory(Largest);
    uint64_t Fitting = Options.MemoryBudget / PerTask;
    if (Fitting == 0)
      fwbase_log(Log,
                 "The memory budget is too small for a single correlation ("
                   << PerTask << " bytes), running one at a time");
    Result = std::min<uint64_t>(Result, std::max<uint64_t>(Fitting, 1));
  }

  return std::max(1u, std::min<unsigned>(Result, Moduli.size()));
}

static void logAnalysis(const ModulusAnalysis &Analysis,
                        const NoiseModel &Noise) {
  fwbase_log(CorrelationLog,
             "Modulus " << Analysis.Modulus << ": top score "
                        << Analysis.TopScore << " (" << Analysis.TiedCount
                        << " tied), floor "
                        << formatv("{0:F2}", Analysis.Floor).str()
                        << ", threshold "
                        << formatv("{0:F2}", Analysis.Threshold).str()
                        << ", rounding error "
                        << formatv("{0:E2}", Analysis.MaxRoundingError).str());

  LoggerIndent<> Indent(CorrelationLog);
  if (not Analysis.Informative) {
    fwbase_log(CorrelationLog, "Too many tied residues, ignored");
    return;
  }

  for (const Peak &P : Analysis.Peaks)
    fwbase_log(CorrelationLog,
               "Residue " << P.Residue << ": " << P.Score
                          << " matches, "
                          << formatv("{0:E2}",
                                     Noise.expectedSpuriousPeaks(P.Score))
                               .str()
                          << " expected by chance");
}

uint64_t fwbase::countMatchedPointers(ArrayRef<uint64_t> StringOffsets,
                                      ArrayRef<uint64_t> Pointers,
                                      BaseAddress Base) {
  std::vector<uint64_t> Targets(Pointers.begin(), Pointers.end());
  llvm::sort(Targets);

  uint64_t Result = 0;
  for (uint64_t Offset : StringOffsets)
    if (std::binary_search(Targets.begin(), Targets.end(),
                           Base.translate(Offset)))
      ++Result;
  return Result;
}

Expected<BaseFinderResult>
fwbase::findBase(ArrayRef<uint64_t> StringOffsets,
                 ArrayRef<uint64_t> Pointers,
                 uint64_t FileLength,
                 const BaseFinderOptions &Options) {
  if (auto Err = validateOptions(Options))
    return std::move(Err);

  if (StringOffsets.empty() or Pointers.empty())
    return make_error<InsufficientDataError>(StringOffsets.size(),
                                             Pointers.size());

  ModulusRequest Request;
  Request.FileLength = FileLength;
  Request.PointerWidth = Options.Layout.Width;
  Request.SlackFactor = effectiveSlackFactor(Options);
  Request.Redundancy = Options.Redundancy;

  BaseFinderResult Result;
  Result.StringCount = StringOffsets.size();
  Result.PointerCount = Pointers.size();

  auto MaybeModuli = selectModuli(Request);
  if (not MaybeModuli)
    return MaybeModuli.takeError();
  Result.Moduli = std::move(*MaybeModuli);

  ArrayRef<uint64_t> Moduli = Result.Moduli.Moduli;
  unsigned Tasks = concurrency(Options, Moduli);
  fwbase_log(Log,
             "Correlating " << StringOffsets.size() << " strings and "
                            << Pointers.size() << " pointers over "
                            << Moduli.size() << " moduli, " << Tasks
                            << " at a time");

  // Each task only writes its own slot
  using AnalysisSlot = std::optional<Expected<ModulusAnalysis>>;
  std::vector<AnalysisSlot> Slots(Moduli.size());
  {
    ThreadPool Pool(llvm::hardware_concurrency(Tasks));
    for (size_t Index = 0; Index < Moduli.size(); ++Index) {
      AnalysisSlot &Slot = Slots[Index];
      uint64_t Modulus = Moduli[Index];
      Pool.async([&Slot, StringOffsets, Pointers, Modulus, &Options] {
        Slot.emplace(analyzeModulus(StringOffsets, Pointers, Modulus, Options));
      });
    }
    Pool.wait();
  }

  std::vector<Error> Errors;
  for (AnalysisSlot &Slot : Slots) {
    fwbase_assert(Slot.has_value());
    if (not *Slot) {
      Errors.push_back(Slot->takeError());
      continue;
    }

    ModulusAnalysis &Analysis = **Slot;
    NoiseModel Noise(StringOffsets.size(), Pointers.size(), Analysis.Modulus);
    logAnalysis(Analysis, Noise);
    NoiseSpread.push(Noise.standardDeviation());
    if (Analysis.Informative)
      PeakMargin.push(Noise.margin(Analysis.TopScore));
    Result.Analyses.push_back(std::move(Analysis));
  }

  if (auto Err = joinErrors(Errors))
    return std::move(Err);

  SmallVector<ModulusCandidates, 8> Candidates;
  for (const ModulusAnalysis &Analysis : Result.Analyses)
    Candidates.push_back(Analysis.candidates());

  CombinerConstraints Constraints;
  Constraints.PointerWidth = Options.Layout.Width;
  Constraints.FileLength = FileLength;
  Constraints.MinimumDetermining = Result.Moduli.MinimumDetermining;
  Constraints.BitWidth = Result.Moduli.BitWidth;
  Constraints.Confirmations = Options.Confirmations;
  Constraints.MaxSteps = Options.MaxCombinationSteps;

  auto MaybeCombination = combine(Candidates, Constraints);
  if (not MaybeCombination)
    return MaybeCombination.takeError();
  Result.Combination = std::move(*MaybeCombination);

  const CombinedCandidate &Best = Result.best();
  Result.MatchedPointers = countMatchedPointers(StringOffsets,
                                                Pointers,
                                                Best.Base);
  fwbase_log(Log,
             "Base " << Best.Base.toString() << " agreed by "
                     << Best.agreement() << " moduli out of "
                     << Result.Combination.ModuliCount << ", "
                     << Result.MatchedPointers
                     << " pointers reference a string");

  return Result;
}

Expected<BaseFinderResult> fwbase::findBase(const ImageScan &Scan,
                                            const BaseFinderOptions &Options) {
  std::vector<uint64_t> Offsets = Scan.stringOffsets();
  return findBase(Offsets, Scan.Pointers, Scan.FileLength, Options);
}

Expected<BaseFinderResult> fwbase::findBase(ArrayRef<uint8_t> Image,
                                            const BaseFinderOptions &Options) {
  if (auto Err = validateOptions(Options))
    return std::move(Err);

  return findBase(scanImage(Image, Options), Options);
}

void fwbase::printResult(raw_ostream &OS, const BaseFinderResult &Result) {
  const CombinedCandidate &Best = Result.best();
  OS << "Confidence: " << Best.agreement() << "/"
     << Result.Combination.ModuliCount << "\n";
  OS << "Offset: " << Best.Base.toString() << "\n";
}

void fwbase::printAmbiguity(raw_ostream &OS,
                            const AmbiguousResultError &Error) {
  OS << "Confidence: " << Error.agreement() << "/" << Error.moduliCount()
     << "\n";

  if (const auto &Best = Error.best())
    OS << "Offset: not found (best candidate " << Best->toString()
       << ", agreement " << Error.agreement() << "/" << Error.moduliCount()
       << ")\n";
  else
    OS << "Offset: not found (no consistent candidate)\n";
}
