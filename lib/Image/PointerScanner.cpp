/// \file PointerScanner.cpp
/// Collection of the candidate pointer values of raw images.

//
// This file is distributed under the MIT License. See LICENSE.md for details.
//

#include <algorithm>

#include "llvm/ADT/STLExtras.h"

#include "fwbase/Image/PointerScanner.h"
#include "fwbase/Support/Assert.h"
#include "fwbase/Support/Debug.h"

using namespace llvm;
using namespace fwbase;

static Logger<> Log("pointers");

bool fwbase::isValidPointerWidth(unsigned Width) {
  return Width == 1 or Width == 2 or Width == 4 or Width == 8;
}

template<typename T>
static uint64_t readAs(const uint8_t *Cursor, support::endianness Endianness) {
  using support::unaligned;
  using support::endian::read;
  return read<T, unaligned>(Cursor, Endianness);
}

uint64_t fwbase::readPointer(ArrayRef<uint8_t> Image,
                             uint64_t Offset,
                             const PointerLayout &Layout) {
  fwbase_assert(Offset + Layout.Width <= Image.size());
  const uint8_t *Cursor = Image.data() + Offset;

  switch (Layout.Width) {
  case 1:
    return *Cursor;
  case 2:
    return readAs<uint16_t>(Cursor, Layout.Endianness);
  case 4:
    return readAs<uint32_t>(Cursor, Layout.Endianness);
  case 8:
    return readAs<uint64_t>(Cursor, Layout.Endianness);
  default:
    fwbase_abort("Unsupported pointer width");
  }
}

std::vector<uint64_t>
fwbase::findPointerTargets(ArrayRef<uint8_t> Image,
                           const PointerLayout &Layout,
                           ArrayRef<StringRun> Strings) {
  fwbase_assert(isValidPointerWidth(Layout.Width));
  fwbase_assert(Layout.Alignment > 0);

  std::vector<uint64_t> Result;
  uint64_t Size = Image.size();
  if (Size < Layout.Width)
    return Result;

  uint64_t DroppedNull = 0;
  uint64_t DroppedInString = 0;

  // Slots are visited in increasing order, so is NextString
  auto NextString = Strings.begin();
  for (uint64_t Offset = 0; Offset <= Size - Layout.Width;
       Offset += Layout.Alignment) {
    uint64_t SlotEnd = Offset + Layout.Width;

    while (NextString != Strings.end() and NextString->end() <= Offset)
      ++NextString;

    if (NextString != Strings.end() and NextString->Offset < SlotEnd) {
      ++DroppedInString;
      continue;
    }

    uint64_t Value = readPointer(Image, Offset, Layout);
    if (Value == 0) {
      ++DroppedNull;
      continue;
    }

    Result.push_back(Value);
  }

  llvm::sort(Result);
  Result.erase(std::unique(Result.begin(), Result.end()), Result.end());

  fwbase_log(Log,
             "Found " << Result.size() << " distinct pointer values ("
                      << DroppedNull << " null slots, " << DroppedInString
                      << " slots in strings)");
  return Result;
}
