/// \file Assert.cpp
/// Implementation of the various functions to assert and abort.

//
// This file is distributed under the MIT License. See LICENSE.md for details.
//

#include <cstdio>
#include <cstdlib>

#include "fwbase/Support/Assert.h"

[[noreturn]] static void terminate() {
  std::abort();
}

static void
report(const char *Type, const char *File, unsigned Line, const char *What) {
  std::fprintf(stderr, "%s at %s:%u", Type, File, Line);
  if (What != nullptr)
    std::fprintf(stderr, ":\n\n%s", What);
  std::fprintf(stderr, "\n");
}

void fwbase_assert_fail(const char *AssertionBody,
                        const char *Message,
                        const char *File,
                        unsigned Line) {
  report("Assertion failed", File, Line, Message);
  std::fprintf(stderr, "\n%s\n", AssertionBody);
  terminate();
}

void fwbase_check_fail(const char *CheckBody,
                       const char *Message,
                       const char *File,
                       unsigned Line) {
  report("Check failed", File, Line, Message);
  std::fprintf(stderr, "\n%s\n", CheckBody);
  terminate();
}

void fwbase_do_abort(const char *Message, const char *File, unsigned Line) {
  report("Abort", File, Line, Message);
  terminate();
}
