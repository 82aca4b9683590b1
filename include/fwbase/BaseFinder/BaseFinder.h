#pragma once

//
// This file is distributed under the MIT License. See LICENSE.md for details.
//

#include <cstdint>
#include <vector>

#include "llvm/ADT/ArrayRef.h"
#include "llvm/Support/Error.h"
#include "llvm/Support/raw_ostream.h"

#include "fwbase/BaseFinder/BaseAddress.h"
#include "fwbase/BaseFinder/CRTCombiner.h"
#include "fwbase/BaseFinder/Errors.h"
#include "fwbase/BaseFinder/ModularCorrelator.h"
#include "fwbase/BaseFinder/ModulusSelector.h"
#include "fwbase/Image/PointerScanner.h"
#include "fwbase/Image/StringScanner.h"

namespace fwbase {

struct BaseFinderOptions {
  /// Minimum number of characters of a string
  unsigned MinStringLength = 5;
  PointerLayout Layout;
  /// Moduli are at least FileLength * SlackFactor, 0 picks
  /// recommendedSlackFactor(Layout.Alignment)
  double SlackFactor = 0.0;
  /// Number of residues per modulus retained for the combination
  unsigned PeaksPerModulus = 3;
  /// Moduli on top of the ones covering the address space
  unsigned Redundancy = 3;
  /// Agreeing moduli required beyond the ones determining a base
  unsigned Confirmations = 2;
  /// A modulus whose top score is shared by more residues than this carries
  /// no information
  unsigned MaxTiedPeaks = 16;
  /// Number of standard deviations above the noise floor for a peak to be
  /// significant
  double SignificanceZ = 4.0;
  /// Worker threads, 0 means all the available cores
  unsigned Threads = 0;
  /// Bytes available to concurrent correlations, 0 means unlimited
  uint64_t MemoryBudget = 0;
  uint64_t MaxCombinationSteps = uint64_t(1) << 22;
};

/// Checks \p Options for consistency, failing with InputError
llvm::Error validateOptions(const BaseFinderOptions &Options);

/// \return the slack factor actually used for \p Options
double effectiveSlackFactor(const BaseFinderOptions &Options);

/// The strings and the pointer values found in an image
struct ImageScan {
  uint64_t FileLength = 0;
  std::vector<StringRun> Strings;
  std::vector<uint64_t> Pointers;

  std::vector<uint64_t> stringOffsets() const;
};

ImageScan scanImage(llvm::ArrayRef<uint8_t> Image,
                    const BaseFinderOptions &Options);

/// What the correlation revealed about the base modulo a single modulus
struct ModulusAnalysis {
  uint64_t Modulus = 0;
  /// Significant peaks, best first, handed to the combiner
  std::vector<Peak> Peaks;
  uint64_t TopScore = 0;
  /// Number of residues scoring TopScore
  unsigned TiedCount = 0;
  /// False if too many residues share the top score
  bool Informative = true;
  double Floor = 0.0;
  double Threshold = 0.0;
  double MaxRoundingError = 0.0;

  ModulusCandidates candidates() const;
};

llvm::Expected<ModulusAnalysis>
analyzeModulus(llvm::ArrayRef<uint64_t> StringOffsets,
               llvm::ArrayRef<uint64_t> Pointers,
               uint64_t Modulus,
               const BaseFinderOptions &Options);

struct BaseFinderResult {
  uint64_t StringCount = 0;
  uint64_t PointerCount = 0;
  ModulusSet Moduli;
  /// One entry per modulus, in the same order as Moduli
  std::vector<ModulusAnalysis> Analyses;
  CombinationResult Combination;
  /// Number of strings whose address under the best base is a pointer value
  uint64_t MatchedPointers = 0;

  const CombinedCandidate &best() const { return Combination.best(); }
};

/// \return the number of \p StringOffsets that, loaded at \p Base, have their
/// address among \p Pointers
uint64_t countMatchedPointers(llvm::ArrayRef<uint64_t> StringOffsets,
                              llvm::ArrayRef<uint64_t> Pointers,
                              BaseAddress Base);

/// Finds the base address mapping \p StringOffsets onto \p Pointers
///
/// The moduli are correlated concurrently, the number of tasks in flight is
/// bounded by Options.Threads and Options.MemoryBudget.
llvm::Expected<BaseFinderResult>
findBase(llvm::ArrayRef<uint64_t> StringOffsets,
         llvm::ArrayRef<uint64_t> Pointers,
         uint64_t FileLength,
         const BaseFinderOptions &Options);

llvm::Expected<BaseFinderResult> findBase(const ImageScan &Scan,
                                          const BaseFinderOptions &Options);

llvm::Expected<BaseFinderResult> findBase(llvm::ArrayRef<uint8_t> Image,
                                          const BaseFinderOptions &Options);

/// Prints the confidence and the offset of a successful search
void printResult(llvm::raw_ostream &OS, const BaseFinderResult &Result);

/// Prints the confidence and the best candidate, if any, of a failed search
void printAmbiguity(llvm::raw_ostream &OS, const AmbiguousResultError &Error);

} // namespace fwbase
