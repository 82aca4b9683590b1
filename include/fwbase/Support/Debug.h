#pragma once

//
// This file is distributed under the MIT License. See LICENSE.md for details.
//

#include <algorithm>
#include <cstdint>
#include <sstream>
#include <string>

#include "llvm/ADT/StringRef.h"

extern std::ostream &dbg;
extern size_t MaxLoggerNameLength;

/// Stream an instance of this class to call Logger::flush()
struct LogTerminator {
  const char *File;
  uint64_t Line;
};
#define DoLog (LogTerminator{ __FILE__, __LINE__ })

/// Logger that self-registers itself, can be disabled, has a name and follows
/// the global indentation level
///
/// The typical usage of this class is to be a static global variable in a
/// translation unit. Loggers are not thread safe: only log from the thread
/// driving the analysis.
template<bool StaticEnabled = true>
class Logger {
private:
  static unsigned IndentLevel;

public:
  Logger(llvm::StringRef Name) : Name(Name), Enabled(false) { init(); }

  void indent(unsigned Level = 1);
  void unindent(unsigned Level = 1);

  bool isEnabled() const { return StaticEnabled && Enabled; }
  llvm::StringRef name() const { return Name; }

  void enable() {
    MaxLoggerNameLength = std::max(MaxLoggerNameLength, Name.size());
    Enabled = true;
  }

  void disable() { Enabled = false; }

  /// Write a log line
  ///
  /// To call this method using the stream syntax, see LogTerminator, or simply
  /// MyLogger << DoLog;
  void flush(const LogTerminator &LineInfo = LogTerminator{ "", 0 });

  template<typename T>
  inline Logger &operator<<(const T &Other) {
    writeToLog(*this, Other, static_cast<int>(0));
    return *this;
  }

  template<bool X>
  friend void writeToLog(Logger<X> &This, const LogTerminator &T, int Ignore);

  template<bool X, typename T, typename LowPrio>
  friend void writeToLog(Logger<X> &This, const T Other, LowPrio Ignore);

private:
  void init();

private:
  llvm::StringRef Name;
  std::stringstream Buffer;
  bool Enabled;
};

/// Indent all loggers within the scope of this object
template<bool StaticEnabled = true>
class LoggerIndent {
public:
  LoggerIndent(Logger<StaticEnabled> &L) : L(L) { L.indent(); }
  ~LoggerIndent() { L.unindent(); }

private:
  Logger<StaticEnabled> &L;
};

/// The catch-all function for logging, it can log any type not already handled
///
/// The \p Ignore argument is not used. It only makes this overload less
/// specific than the ones taking an `int`, which are the ad-hoc handlers.
template<bool X, typename T, typename LowPrio>
inline void writeToLog(Logger<X> &This, const T Other, LowPrio) {
  if (This.isEnabled())
    This.Buffer << Other;
}

/// Specialization of writeToLog to emit a message
template<bool X>
inline void writeToLog(Logger<X> &This, const LogTerminator &LineInfo, int) {
  This.flush(LineInfo);
}

/// Specialization for llvm::StringRef
template<bool X>
inline void writeToLog(Logger<X> &This, const llvm::StringRef &S, int Ign) {
  writeToLog(This, S.str(), Ign);
}

#define fwbase_log(Logger, Expr) \
  do {                           \
    if (Logger.isEnabled()) {    \
      (Logger) << Expr << DoLog; \
    }                            \
  } while (0)

extern template class Logger<true>;
extern template class Logger<false>;
