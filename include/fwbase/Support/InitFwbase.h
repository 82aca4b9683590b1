#pragma once

//
// This file is distributed under the MIT License. See LICENSE.md for details.
//

#include <cstdlib>

#include "llvm/ADT/ArrayRef.h"
#include "llvm/ADT/SmallVector.h"
#include "llvm/Support/Allocator.h"
#include "llvm/Support/CommandLine.h"
#include "llvm/Support/InitLLVM.h"
#include "llvm/Support/PrettyStackTrace.h"
#include "llvm/Support/Process.h"
#include "llvm/Support/StringSaver.h"

#include "fwbase/Support/Assert.h"
#include "fwbase/Support/OnQuit.h"

namespace fwbase {

/// Performs initialization and shutdown steps for fwbase tools.
///
/// This performs the regular LLVM initialization steps (stack trace printers
/// on signal), installs the OnQuit handlers and parses the command line.
class InitFwbase : public llvm::InitLLVM {
private:
  static inline bool Initialized = false;

public:
  InitFwbase(int &Argc,
             const char **&Argv,
             const char *Overview,
             llvm::ArrayRef<const llvm::cl::OptionCategory *>
               RelevantCategories) :
    InitLLVM(Argc, Argv, true) {

    fwbase_assert(not Initialized);
    Initialized = true;

    OnQuit->install();

    llvm::setBugReportMsg("PLEASE submit a bug report and include the crash "
                          "backtrace\n");

    if (not RelevantCategories.empty())
      llvm::cl::HideUnrelatedOptions(RelevantCategories);

    // Options coming from the FWBASE_OPTIONS environment variable are appended
    // after the ones on the command line, so that the latter can't be
    // shadowed by the positional arguments.
    llvm::BumpPtrAllocator A;
    llvm::StringSaver Saver(A);
    llvm::SmallVector<const char *, 0> Arguments(Argv, Argv + Argc);
    if (auto EnvValue = llvm::sys::Process::GetEnv("FWBASE_OPTIONS"))
      llvm::cl::TokenizeGNUCommandLine(*EnvValue, Saver, Arguments);

    int Count = static_cast<int>(Arguments.size());
    bool Result = llvm::cl::ParseCommandLineOptions(Count,
                                                    Arguments.data(),
                                                    Overview);

    if (not Result)
      std::exit(EXIT_FAILURE);
  }

  ~InitFwbase() { OnQuit->quit(); }
};

} // namespace fwbase
