#pragma once

//
// This file is distributed under the MIT License. See LICENSE.md for details.
//

#include <cstdint>
#include <vector>

#include "llvm/ADT/ArrayRef.h"

namespace fwbase {

/// A NUL-terminated sequence of printable characters in the image
struct StringRun {
  uint64_t Offset = 0;
  /// Size in bytes, terminator included
  uint64_t Size = 0;
  /// Number of characters, terminator excluded
  uint64_t Codepoints = 0;

  uint64_t end() const { return Offset + Size; }
};

/// \return the size of the printable character starting at \p Bytes, 0 if
///         there's none
///
/// Printable characters are tab, line feed, form feed, carriage return, ASCII
/// 0x20-0x7e and well-formed UTF-8 sequences of two to four bytes.
unsigned printableCharacterSize(llvm::ArrayRef<uint8_t> Bytes);

/// Finds all the strings at least \p MinLength characters long
///
/// Strings are searched left to right, never overlap and must be followed by a
/// NUL byte.
std::vector<StringRun> findStrings(llvm::ArrayRef<uint8_t> Image,
                                   unsigned MinLength);

} // namespace fwbase
