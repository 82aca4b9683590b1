/// \file BaseFinder.cpp
/// \brief End-to-end tests for the search of the base address

//
// This file is distributed under the MIT License. See LICENSE.md for details.
//

#include <algorithm>
#include <cstring>
#include <random>
#include <string>
#include <vector>

#define BOOST_TEST_MODULE BaseFinder
bool init_unit_test();
#include "boost/test/unit_test.hpp"

#include "llvm/Support/Endian.h"
#include "llvm/Support/raw_ostream.h"

#include "fwbase/BaseFinder/BaseFinder.h"
#include "fwbase/BaseFinder/Errors.h"
#include "fwbase/Support/Assert.h"

using namespace llvm;
using namespace fwbase;

static bool isInputError(Error E) {
  bool Result = E.isA<InputError>();
  consumeError(std::move(E));
  return Result;
}

static std::string printed(const BaseFinderResult &Result) {
  std::string Buffer;
  raw_string_ostream Stream(Buffer);
  printResult(Stream, Result);
  Stream.flush();
  return Buffer;
}

static std::string printed(const AmbiguousResultError &Error) {
  std::string Buffer;
  raw_string_ostream Stream(Buffer);
  printAmbiguity(Stream, Error);
  Stream.flush();
  return Buffer;
}

/// A firmware image of \p Size bytes with random lowercase strings at the
/// beginning and, starting at \p TableOffset, a table of pointers to most of
/// them (mixed with some garbage) relocated by \p Base
class SyntheticImage {
public:
  std::vector<uint8_t> Bytes;
  std::vector<uint64_t> StringOffsets;

public:
  SyntheticImage(uint64_t Size,
                 uint64_t FirstString,
                 unsigned StringCount,
                 unsigned Seed) :
    Bytes(Size, 0) {
    std::mt19937 Random(Seed);
    std::uniform_int_distribution<unsigned> Length(6, 20);
    std::uniform_int_distribution<unsigned> Letter('a', 'z');
    std::uniform_int_distribution<unsigned> Gap(1, 8);

    uint64_t Offset = FirstString;
    for (unsigned I = 0; I < StringCount; ++I) {
      StringOffsets.push_back(Offset);
      unsigned Characters = Length(Random);
      for (unsigned J = 0; J < Characters; ++J)
        Bytes.at(Offset + J) = Letter(Random);
      Offset += Characters + Gap(Random);
    }
  }

  /// Writes pointers to the first \p Count strings followed by \p Garbage
  /// random values
  void writeTable(uint64_t TableOffset,
                  const PointerLayout &Layout,
                  BaseAddress Base,
                  unsigned Count,
                  unsigned Garbage,
                  unsigned Seed) {
    std::mt19937_64 Random(Seed);
    std::vector<uint64_t> Values;
    for (uint64_t Offset : makeArrayRef(StringOffsets).take_front(Count))
      Values.push_back(Base.translate(Offset));

    uint64_t Mask = Layout.Width == 8 ? ~uint64_t(0) :
                                        (uint64_t(1) << (8 * Layout.Width)) - 1;
    for (unsigned I = 0; I < Garbage; ++I)
      Values.push_back((Random() & Mask) | 1);

    std::shuffle(Values.begin(), Values.end(), Random);

    uint64_t Offset = TableOffset;
    for (uint64_t Value : Values) {
      write(Offset, Value, Layout);
      Offset += Layout.Alignment;
    }
  }

  void write(uint64_t Offset, uint64_t Value, const PointerLayout &Layout) {
    using namespace llvm::support;
    fwbase_check(Offset + Layout.Width <= Bytes.size());
    uint8_t *Cursor = Bytes.data() + Offset;
    switch (Layout.Width) {
    case 4:
      endian::write<uint32_t, unaligned>(Cursor, Value, Layout.Endianness);
      break;
    case 8:
      endian::write<uint64_t, unaligned>(Cursor, Value, Layout.Endianness);
      break;
    default:
      fwbase_abort();
    }
  }
};

BOOST_AUTO_TEST_CASE(SingleStringSinglePointer) {
  std::vector<uint8_t> Image(4096, 0);
  std::memcpy(Image.data() + 0x100, "hello", 5);
  support::endian::write64le(Image.data() + 0x800, 0x11ffffefc0 + 0x100);

  BaseFinderOptions Options;
  Options.MinStringLength = 5;
  Options.Layout.Width = 8;
  Options.Layout.Endianness = support::little;
  Options.Layout.Alignment = 8;

  ImageScan Scan = scanImage(Image, Options);
  BOOST_TEST(Scan.Strings.size() == 1U);
  BOOST_TEST(Scan.Pointers.size() == 1U);

  auto Result = findBase(Scan, Options);
  fwbase_check(static_cast<bool>(Result));

  unsigned K = Result->Combination.ModuliCount;
  BOOST_TEST(K == Result->Moduli.size());
  BOOST_TEST(Result->best().agreement() == K);
  fwbase_check(Result->best().Base == BaseAddress(0x11ffffefc0));
  BOOST_TEST(Result->MatchedPointers == 1U);

  std::string Expected = "Confidence: " + std::to_string(K) + "/"
                         + std::to_string(K) + "\nOffset: 0x11ffffefc0\n";
  BOOST_TEST(printed(*Result) == Expected);
}

BOOST_AUTO_TEST_CASE(BoundedConcurrency) {
  std::vector<uint8_t> Image(4096, 0);
  std::memcpy(Image.data() + 0x100, "hello", 5);
  support::endian::write64le(Image.data() + 0x800, 0x11ffffefc0 + 0x100);

  BaseFinderOptions Options;
  Options.Threads = 1;
  Options.MemoryBudget = 1;

  auto Result = findBase(Image, Options);
  fwbase_check(static_cast<bool>(Result));
  fwbase_check(Result->best().Base == BaseAddress(0x11ffffefc0));
}

BOOST_AUTO_TEST_CASE(ThirtyTwoBitBigEndian) {
  PointerLayout Layout;
  Layout.Width = 4;
  Layout.Endianness = support::big;
  Layout.Alignment = 4;

  SyntheticImage Image(1 << 16, 0x100, 200, 1);
  BaseAddress Base(0x08000000);
  Image.writeTable(0x8000, Layout, Base, 150, 50, 2);

  BaseFinderOptions Options;
  Options.Layout = Layout;

  auto Result = findBase(Image.Bytes, Options);
  fwbase_check(static_cast<bool>(Result));
  BOOST_TEST(Result->StringCount >= 200U);
  fwbase_check(Result->best().Base == Base);
  BOOST_TEST(Result->best().agreement() >= Result->Combination.Threshold);
  BOOST_TEST(Result->MatchedPointers >= 150U);

  for (const ModulusAnalysis &Analysis : Result->Analyses) {
    fwbase_check(Analysis.Informative);
    BOOST_TEST(Analysis.TopScore >= 150U);
    BOOST_TEST(Analysis.Peaks.front().Residue == Base.residue(Analysis.Modulus));
  }
}

BOOST_AUTO_TEST_CASE(NegativeBase) {
  PointerLayout Layout;
  Layout.Width = 4;
  Layout.Endianness = support::little;
  Layout.Alignment = 4;

  SyntheticImage Image(1 << 16, 0x1000, 100, 3);
  BaseAddress Base = BaseAddress::negative(0x400);
  Image.writeTable(0x9000, Layout, Base, 80, 20, 4);

  BaseFinderOptions Options;
  Options.Layout = Layout;

  auto Result = findBase(Image.Bytes, Options);
  fwbase_check(static_cast<bool>(Result));
  fwbase_check(Result->best().Base == Base);

  std::string Output = printed(*Result);
  BOOST_TEST(Output.find("Offset: -0x400\n") != std::string::npos);
}

BOOST_AUTO_TEST_CASE(CountMatchedPointers) {
  std::vector<uint64_t> Strings = { 0x500, 0x600, 0x700 };
  std::vector<uint64_t> Pointers = { 0x300, 5, 0x100 };

  BaseAddress Base = BaseAddress::negative(0x400);
  BOOST_TEST(countMatchedPointers(Strings, Pointers, Base) == 2U);
  BOOST_TEST(countMatchedPointers(Strings, Pointers, BaseAddress(0x10)) == 0U);
}

BOOST_AUTO_TEST_CASE(RandomDataIsAmbiguous) {
  std::mt19937 Random(42);
  std::vector<uint8_t> Image(256 * 1024);
  for (uint8_t &Byte : Image)
    Byte = static_cast<uint8_t>(Random());

  BaseFinderOptions Options;
  Options.MinStringLength = 4;

  auto Result = findBase(Image, Options);
  fwbase_check(Result.errorIsA<AmbiguousResultError>());

  handleAllErrors(Result.takeError(), [](const AmbiguousResultError &Error) {
    BOOST_TEST(Error.agreement() < Error.threshold());
    std::string Output = printed(Error);
    BOOST_TEST(Output.find("Offset: not found") != std::string::npos);
  });
}

BOOST_AUTO_TEST_CASE(NoStrings) {
  std::vector<uint8_t> Image(4096, 0);
  support::endian::write64le(Image.data() + 0x800, 0x1234);

  auto Result = findBase(Image, BaseFinderOptions());
  fwbase_check(Result.errorIsA<InsufficientDataError>());

  handleAllErrors(Result.takeError(), [](const InsufficientDataError &Error) {
    BOOST_TEST(Error.stringCount() == 0U);
    BOOST_TEST(Error.pointerCount() == 1U);
  });
}

BOOST_AUTO_TEST_CASE(NoPointers) {
  std::vector<uint8_t> Image(4096, 0);
  std::memcpy(Image.data() + 0x100, "hello", 5);

  auto Result = findBase(Image, BaseFinderOptions());
  fwbase_check(Result.errorIsA<InsufficientDataError>());
  consumeError(Result.takeError());
}

BOOST_AUTO_TEST_CASE(InvalidOptions) {
  std::vector<uint8_t> Image(4096, 0);

  BaseFinderOptions Options;
  Options.Layout.Width = 3;
  auto Result = findBase(Image, Options);
  fwbase_check(Result.errorIsA<InputError>());
  consumeError(Result.takeError());

  Options = BaseFinderOptions();
  Options.SlackFactor = 0.5;
  std::string Message = toString(validateOptions(Options));
  BOOST_TEST(Message == "the slack factor must be at least 1, got 0.50");

  Options = BaseFinderOptions();
  Options.Layout.Alignment = 0;
  Result = findBase(Image, Options);
  fwbase_check(Result.errorIsA<InputError>());
  consumeError(Result.takeError());

  Options = BaseFinderOptions();
  Options.MinStringLength = 0;
  fwbase_check(isInputError(validateOptions(Options)));
}

BOOST_AUTO_TEST_CASE(TiedModulusIsUninformative) {
  std::vector<uint64_t> Strings = { 0 };
  std::vector<uint64_t> Pointers;
  for (uint64_t I = 1; I <= 20; ++I)
    Pointers.push_back(I);

  BaseFinderOptions Options;
  auto Analysis = analyzeModulus(Strings, Pointers, 101, Options);
  fwbase_check(static_cast<bool>(Analysis));
  fwbase_check(not Analysis->Informative);
  BOOST_TEST(Analysis->TiedCount == 20U);
  BOOST_TEST(Analysis->Peaks.empty());
}

BOOST_AUTO_TEST_CASE(PrintAmbiguity) {
  AmbiguousResultError WithCandidate(BaseAddress(0x1000), 3, 7, 6);
  BOOST_TEST(printed(WithCandidate)
             == "Confidence: 3/7\n"
                "Offset: not found (best candidate 0x1000, agreement 3/7)\n");

  AmbiguousResultError WithoutCandidate(std::nullopt, 0, 7, 6);
  BOOST_TEST(printed(WithoutCandidate)
             == "Confidence: 0/7\n"
                "Offset: not found (no consistent candidate)\n");
}
