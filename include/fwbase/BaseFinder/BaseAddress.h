#pragma once

//
// This file is distributed under the MIT License. See LICENSE.md for details.
//

#include <compare>
#include <cstdint>
#include <string>

namespace fwbase {

/// A load address for the image
///
/// Images whose first bytes are mapped slightly below zero (i.e., pointers
/// reference strings at a lower address than their file offset) have a
/// negative base, hence the explicit sign.
class BaseAddress {
private:
  bool Negative = false;
  uint64_t Magnitude = 0;

public:
  BaseAddress() = default;
  explicit BaseAddress(uint64_t Value) : Negative(false), Magnitude(Value) {}

  static BaseAddress negative(uint64_t Magnitude) {
    BaseAddress Result(Magnitude);
    Result.Negative = Magnitude != 0;
    return Result;
  }

public:
  bool isNegative() const { return Negative; }
  uint64_t magnitude() const { return Magnitude; }

  /// \return the value of this address modulo \p Modulus, in [0, Modulus)
  uint64_t residue(uint64_t Modulus) const {
    uint64_t Result = Magnitude % Modulus;
    if (Negative and Result != 0)
      Result = Modulus - Result;
    return Result;
  }

  /// \return the address of the byte at \p Offset in the image
  uint64_t translate(uint64_t Offset) const {
    return Negative ? Offset - Magnitude : Offset + Magnitude;
  }

  /// Hexadecimal representation, e.g. "0x8000000" or "-0x100"
  std::string toString() const;

  std::strong_ordering operator<=>(const BaseAddress &) const = default;
  bool operator==(const BaseAddress &) const = default;
};

} // namespace fwbase
