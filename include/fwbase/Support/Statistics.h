#pragma once

//
// This file is distributed under the MIT License. See LICENSE.md for details.
//

#include <algorithm>
#include <cmath>
#include <cstdint>
#include <string>

#include "llvm/ADT/StringRef.h"
#include "llvm/Support/CommandLine.h"

#include "fwbase/Support/Debug.h"
#include "fwbase/Support/OnQuit.h"

extern llvm::cl::opt<bool> Statistics;

/// Collects mean, variance and extremes of a series of samples
///
/// Named instances are meant to be global variables: their summary is printed
/// at exit when -statistics is given.
class RunningStatistics {
private:
  std::string Name;
  uint64_t N = 0;
  double Mean = 0.0;
  double SquaredDistance = 0.0;
  double Min = 0.0;
  double Max = 0.0;

public:
  RunningStatistics() = default;

  RunningStatistics(const llvm::StringRef Name) : Name(Name.str()) {
    OnQuit->add([this] {
      if (Statistics and N > 0)
        dump();
    });
  }

  /// Record a new sample
  void push(double X) {
    N++;

    // Welford's update, see Knuth TAOCP vol 2, 3rd edition, page 232
    double Delta = X - Mean;
    Mean += Delta / N;
    SquaredDistance += Delta * (X - Mean);

    if (N == 1) {
      Min = Max = X;
    } else {
      Min = std::min(Min, X);
      Max = std::max(Max, X);
    }
  }

  uint64_t size() const { return N; }

  double mean() const { return Mean; }

  double variance() const { return N > 1 ? SquaredDistance / (N - 1) : 0.0; }

  double standardDeviation() const { return std::sqrt(variance()); }

  double min() const { return Min; }

  double max() const { return Max; }

  template<typename T>
  void dump(T &Output) const {
    Output << Name << ": { n: " << size() << " mean: " << mean()
           << " stddev: " << standardDeviation() << " min: " << min()
           << " max: " << max() << " }\n";
  }

  void dump() const { dump(dbg); }
};
