/// \file StringScanner.cpp
/// Detection of text strings in raw images.

//
// This file is distributed under the MIT License. See LICENSE.md for details.
//

#include <algorithm>

#include "fwbase/Image/StringScanner.h"
#include "fwbase/Support/Assert.h"
#include "fwbase/Support/Debug.h"

using namespace llvm;
using namespace fwbase;

static Logger<> Log("strings");

static bool isContinuation(uint8_t Byte) {
  return (Byte & 0xC0) == 0x80;
}

unsigned fwbase::printableCharacterSize(ArrayRef<uint8_t> Bytes) {
  if (Bytes.empty())
    return 0;

  uint8_t Lead = Bytes[0];
  switch (Lead) {
  case '\t':
  case '\n':
  case '\f':
  case '\r':
    return 1;
  default:
    break;
  }

  if (Lead >= 0x20 and Lead <= 0x7E)
    return 1;

  unsigned Size = 0;
  if (Lead >= 0xC2 and Lead <= 0xDF)
    Size = 2;
  else if (Lead >= 0xE0 and Lead <= 0xEF)
    Size = 3;
  else if (Lead >= 0xF0 and Lead <= 0xF4)
    Size = 4;
  else
    return 0;

  if (Bytes.size() < Size)
    return 0;

  for (uint8_t Byte : Bytes.slice(1, Size - 1))
    if (not isContinuation(Byte))
      return 0;

  return Size;
}

std::vector<StringRun> fwbase::findStrings(ArrayRef<uint8_t> Image,
                                           unsigned MinLength) {
  fwbase_assert(MinLength > 0);

  std::vector<StringRun> Result;
  uint64_t Size = Image.size();
  uint64_t Start = 0;
  while (Start < Size) {
    // Consume the longest run of printable characters starting here
    uint64_t End = Start;
    uint64_t Codepoints = 0;
    while (unsigned Length = printableCharacterSize(Image.drop_front(End))) {
      End += Length;
      ++Codepoints;
    }

    if (Codepoints >= MinLength and End < Size and Image[End] == 0) {
      Result.push_back({ Start, End + 1 - Start, Codepoints });
      Start = End + 1;
    } else {
      Start = std::max(End, Start + 1);
    }
  }

  fwbase_log(Log, "Found " << Result.size() << " strings in " << Size
                           << " bytes");
  return Result;
}
