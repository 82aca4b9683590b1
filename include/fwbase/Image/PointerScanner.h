#pragma once

//
// This file is distributed under the MIT License. See LICENSE.md for details.
//

#include <cstdint>
#include <vector>

#include "llvm/ADT/ArrayRef.h"
#include "llvm/Support/Endian.h"

#include "fwbase/Image/StringScanner.h"

namespace fwbase {

/// How pointers are stored in the image
struct PointerLayout {
  /// Size of a pointer in bytes: 1, 2, 4 or 8
  unsigned Width = 8;
  llvm::support::endianness Endianness = llvm::support::little;
  /// Pointers are only searched at offsets multiple of Alignment
  unsigned Alignment = 8;
};

/// \return true if \p Width is a supported pointer size
bool isValidPointerWidth(unsigned Width);

/// Decodes the pointer stored at \p Offset
uint64_t readPointer(llvm::ArrayRef<uint8_t> Image,
                     uint64_t Offset,
                     const PointerLayout &Layout);

/// Collects the values of all the aligned pointer-sized slots of \p Image
///
/// Null values and slots overlapping one of \p Strings (which must be sorted
/// and not overlapping) are discarded. The result is sorted and free of
/// duplicates.
std::vector<uint64_t> findPointerTargets(llvm::ArrayRef<uint8_t> Image,
                                         const PointerLayout &Layout,
                                         llvm::ArrayRef<StringRun> Strings);

} // namespace fwbase
