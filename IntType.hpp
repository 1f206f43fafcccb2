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

#pragma once

#include <cstdint>
#include <string_view>


namespace FixInt
{

  /// The ten fixed width integer types.
  enum class IntKind : uint8_t
    {
      Int8, Int16, Int32, Int64, Int128,
      UInt8, UInt16, UInt32, UInt64, UInt128
    };

  constexpr unsigned intKindCount = 10;

  /// Static description of an integer type.
  struct IntTypeInfo
  {
    IntKind kind;
    const char* name;
    unsigned width;    // Bit count.
    bool isSigned;
  };

  /// Return the descriptor of the given kind.
  const IntTypeInfo& typeInfo(IntKind kind);

  /// Return the index of the given kind (0 to 9).
  constexpr unsigned kindIndex(IntKind kind)
  { return static_cast<unsigned>(kind); }

  /// Return the bit count of the given kind.
  constexpr unsigned kindWidth(IntKind kind)
  {
    constexpr unsigned widths[] = { 8, 16, 32, 64, 128 };
    return widths[kindIndex(kind) % 5];
  }

  /// Return true if the given kind is signed.
  constexpr bool kindIsSigned(IntKind kind)
  { return kindIndex(kind) < 5; }

  /// Return the kind with the given width and signedness. Width must
  /// be one of 8, 16, 32, 64 or 128.
  IntKind kindFor(unsigned width, bool isSigned);

  /// Same-width signed counterpart of the given kind.
  IntKind signedKind(IntKind kind);

  /// Same-width unsigned counterpart of the given kind.
  IntKind unsignedKind(IntKind kind);

  /// Return the name of the given kind (e.g. "UInt16").
  const char* kindName(IntKind kind);

  /// Set kind to the type of the given name (e.g. "Int8"). Return
  /// true on success and false if the name is not recognized.
  bool parseKindName(std::string_view name, IntKind& kind);

  /// Return true if the given native word size (in bits) is supported
  /// by the promotion rules: 32 or 64.
  bool isValidWordSize(unsigned wordSize);

  /// Return the word size of the host: 32 or 64.
  constexpr unsigned hostWordSize()
  { return sizeof(void*) >= 8 ? 64 : 32; }

  /// Return the result type of a binary operation mixing the two
  /// given types on a machine with the given word size. The result
  /// is looked up in an explicit table; the relation is symmetric.
  /// Word size must be 32 or 64.
  IntKind promoteKind(IntKind a, IntKind b, unsigned wordSize);

  /// Set wide to the type obtained by widening the given kind on a
  /// machine with the given word size. Return true on success and
  /// false if there is no wider type (128-bit kinds).
  bool widenKind(IntKind kind, unsigned wordSize, IntKind& wide);
}
