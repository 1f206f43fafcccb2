// Copyright 2022 Tenstorrent Corporation or its affiliates.
//
// Licensed under the Apache License, Version 2.0 (the "License");
// you may not use this file except in compliance with the License.
// You may obtain a copy of the License at
//
//     http://www.apache.org/licenses/LICENSE-2.0
//
// Unless required by applicable law or agreed to in writing, software
// distributed under the License is distributed on an "AS IS" BASIS,
// WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
// See the License for the specific language governing permissions and
// limitations under the License.

#include <array>
#include <stdexcept>
#include <string>
#include "IntType.hpp"


using namespace FixInt;


namespace
{
  constexpr IntKind I8   = IntKind::Int8;
  constexpr IntKind I16  = IntKind::Int16;
  constexpr IntKind I32  = IntKind::Int32;
  constexpr IntKind I64  = IntKind::Int64;
  constexpr IntKind I128 = IntKind::Int128;
  constexpr IntKind U8   = IntKind::UInt8;
  constexpr IntKind U16  = IntKind::UInt16;
  constexpr IntKind U32  = IntKind::UInt32;
  constexpr IntKind U64  = IntKind::UInt64;
  constexpr IntKind U128 = IntKind::UInt128;

  const std::array<IntTypeInfo, intKindCount> typeTable =
    {{
      { I8,   "Int8",    8,   true },
      { I16,  "Int16",   16,  true },
      { I32,  "Int32",   32,  true },
      { I64,  "Int64",   64,  true },
      { I128, "Int128",  128, true },
      { U8,   "UInt8",   8,   false },
      { U16,  "UInt16",  16,  false },
      { U32,  "UInt32",  32,  false },
      { U64,  "UInt64",  64,  false },
      { U128, "UInt128", 128, false },
    }};

  using PromoteTable = std::array<std::array<IntKind, intKindCount>, intKindCount>;

  // Rows and columns are in IntKind order. Two types of the same
  // signedness promote to the wider. A signed/unsigned mix promotes
  // to the signed type when it is strictly wider than the unsigned
  // one, otherwise to the unsigned type; types narrower than the word
  // are first raised to the signed word type.

  const PromoteTable promote64 =
    {{
      //  I8    I16   I32   I64   I128  U8    U16   U32   U64   U128
      { { I8,   I16,  I32,  I64,  I128, I64,  I64,  I64,  U64,  U128 } },  // I8
      { { I16,  I16,  I32,  I64,  I128, I64,  I64,  I64,  U64,  U128 } },  // I16
      { { I32,  I32,  I32,  I64,  I128, I64,  I64,  I64,  U64,  U128 } },  // I32
      { { I64,  I64,  I64,  I64,  I128, I64,  I64,  I64,  U64,  U128 } },  // I64
      { { I128, I128, I128, I128, I128, I128, I128, I128, I128, U128 } },  // I128
      { { I64,  I64,  I64,  I64,  I128, U8,   U16,  U32,  U64,  U128 } },  // U8
      { { I64,  I64,  I64,  I64,  I128, U16,  U16,  U32,  U64,  U128 } },  // U16
      { { I64,  I64,  I64,  I64,  I128, U32,  U32,  U32,  U64,  U128 } },  // U32
      { { U64,  U64,  U64,  U64,  I128, U64,  U64,  U64,  U64,  U128 } },  // U64
      { { U128, U128, U128, U128, U128, U128, U128, U128, U128, U128 } },  // U128
    }};

  const PromoteTable promote32 =
    {{
      //  I8    I16   I32   I64   I128  U8    U16   U32   U64   U128
      { { I8,   I16,  I32,  I64,  I128, I32,  I32,  U32,  U64,  U128 } },  // I8
      { { I16,  I16,  I32,  I64,  I128, I32,  I32,  U32,  U64,  U128 } },  // I16
      { { I32,  I32,  I32,  I64,  I128, I32,  I32,  U32,  U64,  U128 } },  // I32
      { { I64,  I64,  I64,  I64,  I128, I64,  I64,  I64,  U64,  U128 } },  // I64
      { { I128, I128, I128, I128, I128, I128, I128, I128, I128, U128 } },  // I128
      { { I32,  I32,  I32,  I64,  I128, U8,   U16,  U32,  U64,  U128 } },  // U8
      { { I32,  I32,  I32,  I64,  I128, U16,  U16,  U32,  U64,  U128 } },  // U16
      { { U32,  U32,  U32,  I64,  I128, U32,  U32,  U32,  U64,  U128 } },  // U32
      { { U64,  U64,  U64,  U64,  I128, U64,  U64,  U64,  U64,  U128 } },  // U64
      { { U128, U128, U128, U128, U128, U128, U128, U128, U128, U128 } },  // U128
    }};


  void
  checkWordSize(unsigned wordSize)
  {
    if (not isValidWordSize(wordSize))
      throw std::invalid_argument("Invalid word size: " + std::to_string(wordSize) +
                                  " (expecting 32 or 64)");
  }
}


const IntTypeInfo&
FixInt::typeInfo(IntKind kind)
{
  return typeTable.at(kindIndex(kind));
}


IntKind
FixInt::kindFor(unsigned width, bool isSigned)
{
  unsigned offset = isSigned ? 0 : 5;
  switch (width)
    {
    case 8:   return static_cast<IntKind>(offset + 0);
    case 16:  return static_cast<IntKind>(offset + 1);
    case 32:  return static_cast<IntKind>(offset + 2);
    case 64:  return static_cast<IntKind>(offset + 3);
    case 128: return static_cast<IntKind>(offset + 4);
    default:  break;
    }
  throw std::invalid_argument("Invalid integer width: " + std::to_string(width));
}


IntKind
FixInt::signedKind(IntKind kind)
{
  return kindFor(kindWidth(kind), true);
}


IntKind
FixInt::unsignedKind(IntKind kind)
{
  return kindFor(kindWidth(kind), false);
}


const char*
FixInt::kindName(IntKind kind)
{
  return typeInfo(kind).name;
}


bool
FixInt::parseKindName(std::string_view name, IntKind& kind)
{
  for (const auto& info : typeTable)
    if (name == info.name)
      {
        kind = info.kind;
        return true;
      }
  return false;
}


bool
FixInt::isValidWordSize(unsigned wordSize)
{
  return wordSize == 32 or wordSize == 64;
}


IntKind
FixInt::promoteKind(IntKind a, IntKind b, unsigned wordSize)
{
  checkWordSize(wordSize);
  const PromoteTable& table = wordSize == 64 ? promote64 : promote32;
  return table.at(kindIndex(a)).at(kindIndex(b));
}


bool
FixInt::widenKind(IntKind kind, unsigned wordSize, IntKind& wide)
{
  checkWordSize(wordSize);

  unsigned width = kindWidth(kind);
  if (width == 128)
    return false;

  // Types narrower than the word widen to the word type of the same
  // signedness. Others double.
  unsigned target = width < wordSize ? wordSize : 2*width;
  wide = kindFor(target, kindIsSigned(kind));
  return true;
}
