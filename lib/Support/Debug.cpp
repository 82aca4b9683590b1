/// \file Debug.cpp
/// Implementation of the debug framework.

//
// This file is distributed under the MIT License. See LICENSE.md for details.
//

#include <iostream>
#include <string>
#include <vector>

#include "llvm/ADT/Twine.h"
#include "llvm/Support/ManagedStatic.h"

#include "fwbase/Support/Assert.h"
#include "fwbase/Support/CommandLine.h"
#include "fwbase/Support/Debug.h"

namespace cl = llvm::cl;
using llvm::Twine;

static cl::opt<unsigned> MaxLocationLength("debug-location-max-length",
                                           cl::desc("emit file and line number "
                                                    "for log messages of at "
                                                    "most this size."),
                                           cl::cat(MainCategory),
                                           cl::init(0));

size_t MaxLoggerNameLength = 0;

/// A global registry for all the loggers
///
/// Loggers are usually global static variables in translation units, the role
/// of this class is collecting them.
class LoggersRegistry {
public:
  LoggersRegistry() {}

  void add(Logger<> *L) { Loggers.push_back(L); }

  size_t size() const { return Loggers.size(); }

  void enable(llvm::StringRef Name) {
    for (Logger<> *L : Loggers) {
      if (L->name() == Name) {
        L->enable();
        return;
      }
    }

    fwbase_abort("Requested logger not available");
  }

private:
  std::vector<Logger<> *> Loggers;
};

static llvm::ManagedStatic<LoggersRegistry> Loggers;

std::ostream &dbg(std::cerr);

template<bool StaticEnabled>
void Logger<StaticEnabled>::flush(const LogTerminator &LineInfo) {
  if (not isEnabled())
    return;

  std::string Pad;

  if (MaxLocationLength != 0) {
    std::string Suffix = (Twine(":") + Twine(LineInfo.Line)).str();
    fwbase_assert(Suffix.size() < MaxLocationLength);
    std::string Location(LineInfo.File);
    size_t LastSlash = Location.rfind("/");
    if (LastSlash != std::string::npos)
      Location.erase(0, LastSlash + 1);

    if (Location.size() > MaxLocationLength - Suffix.size())
      Location.erase(MaxLocationLength - Suffix.size(), std::string::npos);

    Pad = std::string(MaxLocationLength - Location.size() - Suffix.size(), ' ');
    dbg << "[" << Location << Suffix << Pad << "] ";
  }

  Pad = std::string(MaxLoggerNameLength - Name.size(), ' ');
  dbg << "[" << Name.str() << Pad << "] ";
  dbg << std::string(IndentLevel * 2, ' ');

  std::string Data = Buffer.str();
  if (Data.size() > 0 and Data.back() == '\n')
    Data.resize(Data.size() - 1);

  // Continuation lines are aligned under the first one
  size_t Start = 0;
  size_t End = Data.find('\n');
  dbg << Data.substr(Start, End) << "\n";

  if (End != std::string::npos) {
    Pad = std::string(3 + MaxLoggerNameLength + IndentLevel * 2, ' ');
    do {
      Start = End + 1;
      End = Data.find('\n', Start);
      dbg << Pad << Data.substr(Start, End - Start) << "\n";
    } while (End != std::string::npos);
  }

  Buffer.str("");
  Buffer.clear();
}

enum PlaceholderEnum {
};
struct DebugLogOptionList : public cl::list<PlaceholderEnum> {
  using list = cl::list<PlaceholderEnum>;
  DebugLogOptionList() :
    list("debug-log",
         cl::desc("enable verbose logging"),
         cl::cat(MainCategory)) {}

  virtual bool addOccurrence(unsigned Pos,
                             llvm::StringRef ArgName,
                             llvm::StringRef Value,
                             bool MultiArg = false) override {
    Loggers->enable(Value);
    return list::addOccurrence(Pos, ArgName, Value, MultiArg);
  }
};

struct DebugLogOptionWrapper {
  DebugLogOptionList TheOption;
};

static llvm::ManagedStatic<DebugLogOptionWrapper> DebugLogOption;

template<bool StaticEnabled>
void Logger<StaticEnabled>::init() {
  if constexpr (StaticEnabled) {
    Loggers->add(this);
    if (Name.size() > 0) {
      auto &Parser = DebugLogOption->TheOption.getParser();
      Parser.addLiteralOption(Name.data(), Loggers->size(), "");
    }
  }
}

template<bool StaticEnabled>
unsigned Logger<StaticEnabled>::IndentLevel;

template<bool StaticEnabled>
void Logger<StaticEnabled>::indent(unsigned Level) {
  if (isEnabled())
    IndentLevel += Level;
}

template<bool StaticEnabled>
void Logger<StaticEnabled>::unindent(unsigned Level) {
  if (isEnabled()) {
    fwbase_assert(IndentLevel >= Level);
    IndentLevel -= Level;
  }
}

template class Logger<true>;
template class Logger<false>;
