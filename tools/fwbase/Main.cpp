/// \file Main.cpp
/// \brief Command line front-end looking for the load address of a firmware
/// image

//
// This file is distributed under the MIT License. See LICENSE.md for details.
//

#include <cstdlib>
#include <memory>
#include <string>

#include "llvm/ADT/StringExtras.h"
#include "llvm/Support/CommandLine.h"
#include "llvm/Support/Endian.h"
#include "llvm/Support/MemoryBuffer.h"
#include "llvm/Support/WithColor.h"
#include "llvm/Support/raw_ostream.h"

#include "fwbase/BaseFinder/BaseFinder.h"
#include "fwbase/BaseFinder/Errors.h"
#include "fwbase/Support/CommandLine.h"
#include "fwbase/Support/Debug.h"
#include "fwbase/Support/InitFwbase.h"

using namespace llvm;
using namespace llvm::cl;

namespace {

opt<std::string> InputPath(Positional, Required, desc("<firmware image>"));

opt<unsigned> MinLength("min-length",
                        desc("minimum length of a string, in characters"),
                        value_desc("n"),
                        cat(MainCategory),
                        init(5));
alias A1("n",
         desc("Alias for -min-length"),
         aliasopt(MinLength),
         cat(MainCategory));

opt<unsigned> PointerWidth("pointer-size",
                           desc("size of a pointer in bytes (1, 2, 4 or 8)"),
                           value_desc("bytes"),
                           cat(MainCategory),
                           init(8));
alias A2("l",
         desc("Alias for -pointer-size"),
         aliasopt(PointerWidth),
         cat(MainCategory));

opt<support::endianness>
  Endianness("endianness",
             desc("byte order of the pointers"),
             values(clEnumValN(support::little, "little", "little endian"),
                    clEnumValN(support::big, "big", "big endian")),
             cat(MainCategory),
             init(support::little));
alias A3("e",
         desc("Alias for -endianness"),
         aliasopt(Endianness),
         cat(MainCategory));

opt<unsigned> Alignment("alignment",
                        desc("alignment of the pointers in bytes, defaults to "
                             "the pointer size"),
                        value_desc("bytes"),
                        cat(MainCategory),
                        init(0));
alias A4("a",
         desc("Alias for -alignment"),
         aliasopt(Alignment),
         cat(MainCategory));

opt<double> SlackFactor("slack",
                        desc("ratio between the smallest modulus and the file "
                             "size, at least 1 (default depends on the "
                             "alignment)"),
                        value_desc("factor"),
                        cat(MainCategory),
                        init(0.0));
alias A5("f",
         desc("Alias for -slack"),
         aliasopt(SlackFactor),
         cat(MainCategory));

opt<unsigned> PeaksPerModulus("peaks",
                              desc("candidate residues kept for each modulus"),
                              value_desc("k"),
                              cat(MainCategory),
                              init(3));
alias A6("k",
         desc("Alias for -peaks"),
         aliasopt(PeaksPerModulus),
         cat(MainCategory));

opt<unsigned> Redundancy("redundancy",
                         desc("moduli to add on top of the ones needed to "
                              "cover the address space"),
                         value_desc("r"),
                         cat(MainCategory),
                         init(3));
alias A7("r",
         desc("Alias for -redundancy"),
         aliasopt(Redundancy),
         cat(MainCategory));

opt<unsigned> Threads("threads",
                      desc("worker threads, 0 uses all the cores"),
                      value_desc("j"),
                      cat(MainCategory),
                      init(0));
alias A8("j",
         desc("Alias for -threads"),
         aliasopt(Threads),
         cat(MainCategory));

opt<unsigned> MaxMemory("max-memory",
                        desc("memory available to concurrent correlations, in "
                             "MiB, 0 means unlimited"),
                        value_desc("MiB"),
                        cat(MainCategory),
                        init(0));

} // namespace

static Logger<> Log("fwbase");

static fwbase::BaseFinderOptions optionsFromCommandLine() {
  fwbase::BaseFinderOptions Result;
  Result.MinStringLength = MinLength;
  Result.Layout.Width = PointerWidth;
  Result.Layout.Endianness = Endianness;
  if (Alignment.getNumOccurrences() != 0)
    Result.Layout.Alignment = Alignment;
  else
    Result.Layout.Alignment = PointerWidth;
  Result.SlackFactor = SlackFactor;
  Result.PeaksPerModulus = PeaksPerModulus;
  Result.Redundancy = Redundancy;
  Result.Threads = Threads;
  Result.MemoryBudget = static_cast<uint64_t>(MaxMemory) * 1024 * 1024;
  return Result;
}

static auto ReportError = [](const ErrorInfoBase &Error) {
  WithColor::error(errs(), "fwbase") << Error.message() << "\n";
};

int main(int Argc, const char *Argv[]) {
  fwbase::InitFwbase X(Argc,
                       Argv,
                       "Finds the load address of a raw firmware image\n",
                       { &MainCategory });

  fwbase::BaseFinderOptions Options = optionsFromCommandLine();
  if (auto Err = fwbase::validateOptions(Options)) {
    handleAllErrors(std::move(Err), ReportError);
    return EXIT_FAILURE;
  }

  auto MaybeBuffer = MemoryBuffer::getFile(InputPath.getValue(),
                                           /* IsText */ false,
                                           /* RequiresNullTerminator */ false);
  if (not MaybeBuffer) {
    std::string Message = MaybeBuffer.getError().message();
    auto Err = make_error<fwbase::InputError>("cannot read "
                                              + InputPath.getValue() + ": "
                                              + Message);
    handleAllErrors(std::move(Err), ReportError);
    return EXIT_FAILURE;
  }

  std::unique_ptr<MemoryBuffer> Buffer = std::move(*MaybeBuffer);
  ArrayRef<uint8_t> Image = arrayRefFromStringRef(Buffer->getBuffer());
  fwbase_log(Log,
             "Read " << Image.size() << " bytes from " << InputPath.getValue());

  fwbase::ImageScan Scan = fwbase::scanImage(Image, Options);
  outs() << "Found " << Scan.Strings.size() << " strings\n";

  auto MaybeResult = fwbase::findBase(Scan, Options);
  if (not MaybeResult) {
    handleAllErrors(MaybeResult.takeError(),
                    [](const fwbase::AmbiguousResultError &Ambiguous) {
                      fwbase::printAmbiguity(outs(), Ambiguous);
                    },
                    ReportError);
    return EXIT_FAILURE;
  }

  fwbase::printResult(outs(), *MaybeResult);
  if (MaybeResult->Combination.Truncated)
    WithColor::warning(errs(), "fwbase")
      << "the search for candidates was interrupted, the result might not be "
         "the best one\n";

  return EXIT_SUCCESS;
}
