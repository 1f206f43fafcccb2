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
#include <iosfwd>
#include <stdexcept>
#include <string>
#include "IntType.hpp"
#include "IntTraits.hpp"
#include "BigInt.hpp"


namespace FixInt
{

  /// Return the kind corresponding to the given C++ integer type.
  template <FixedInt T>
  constexpr IntKind kindOf()
  {
    constexpr unsigned width = IntTraits<T>::width;
    constexpr unsigned log = width == 8 ? 0 : width == 16 ? 1 : width == 32 ? 2 :
      width == 64 ? 3 : 4;
    return static_cast<IntKind>((IntTraits<T>::isSigned ? 0 : 5) + log);
  }


  /// Tag carrying a C++ integer type through a generic lambda.
  template <typename T>
  struct KindType
  {
    using type = T;
  };


  /// Invoke f with a KindType tag of the C++ type implementing the
  /// given kind and return what f returns. The 128-bit kinds map to
  /// Int128/Uint128 (native or emulated depending on the build).
  template <typename F>
  auto dispatchKind(IntKind kind, F&& f)
  {
    switch (kind)
      {
      case IntKind::Int8:    return f(KindType<int8_t>());
      case IntKind::Int16:   return f(KindType<int16_t>());
      case IntKind::Int32:   return f(KindType<int32_t>());
      case IntKind::Int64:   return f(KindType<int64_t>());
      case IntKind::Int128:  return f(KindType<Int128>());
      case IntKind::UInt8:   return f(KindType<uint8_t>());
      case IntKind::UInt16:  return f(KindType<uint16_t>());
      case IntKind::UInt32:  return f(KindType<uint32_t>());
      case IntKind::UInt64:  return f(KindType<uint64_t>());
      case IntKind::UInt128: return f(KindType<Uint128>());
      }
    throw std::invalid_argument("Invalid integer kind");
  }


  /// Invoke f with the KindType tags of the signed and unsigned C++
  /// types of the given width (8, 16, 32, 64 or 128).
  template <typename F>
  auto dispatchWidth(unsigned width, F&& f)
  {
    switch (width)
      {
      case 8:   return f(KindType<int8_t>(),  KindType<uint8_t>());
      case 16:  return f(KindType<int16_t>(), KindType<uint16_t>());
      case 32:  return f(KindType<int32_t>(), KindType<uint32_t>());
      case 64:  return f(KindType<int64_t>(), KindType<uint64_t>());
      case 128: return f(KindType<Int128>(),  KindType<Uint128>());
      default:  break;
      }
    throw std::invalid_argument("Invalid integer width");
  }


  /// Immutable fixed width integer tagged with its kind. The bit
  /// pattern is held zero-extended in two 64-bit limbs: bits above the
  /// width of the kind are always zero.
  class IntValue
  {
  public:

    /// Default constructor: Int64 zero.
    IntValue() = default;

    /// Return a value of the kind of T holding x.
    template <FixedInt T>
    static IntValue from(T x)
    {
      if constexpr (IntTraits<T>::width == 128)
        return IntValue(kindOf<T>(), highLimb(x), lowLimb(x));
      else
        return IntValue(kindOf<T>(), 0, static_cast<uint64_t>(toUnsigned(x)));
    }

    /// Return a value of the given kind with the given bit pattern.
    /// Bits above the width of the kind are dropped.
    static IntValue fromBits(IntKind kind, uint64_t high, uint64_t low);

    /// Return a value of the given kind from decimal or hexadecimal
    /// (0x prefix) text with an optional sign. Throw
    /// std::invalid_argument if the text is not an integer and
    /// ArithException (Inexact) if it is out of range for the kind.
    static IntValue fromLiteral(IntKind kind, const std::string& text);

    /// Return a value of the given kind equal to x. Throw
    /// ArithException (Inexact) if x is out of range.
    static IntValue fromBig(IntKind kind, const BigInt& x);

    /// Smallest value of the given kind.
    static IntValue minOf(IntKind kind);

    /// Largest value of the given kind.
    static IntValue maxOf(IntKind kind);

    IntKind kind() const
    { return kind_; }

    unsigned width() const
    { return kindWidth(kind_); }

    bool isSigned() const
    { return kindIsSigned(kind_); }

    /// Least significant 64 bits of the pattern.
    uint64_t low() const
    { return low_; }

    /// Most significant 64 bits of the (zero-extended) pattern.
    uint64_t high() const
    { return high_; }

    /// Return true if this is a negative value of a signed kind.
    bool isNegative() const;

    /// Return true if the pattern is all zeros.
    bool isZero() const
    { return low_ == 0 and high_ == 0; }

    /// Return the bit pattern as the given C++ type. The pattern is
    /// truncated or zero-extended to the width of T.
    template <FixedInt T>
    T get() const
    {
      if constexpr (IntTraits<T>::width == 128)
        return fromLimbs<T>(high_, low_);
      else
        return static_cast<T>(static_cast<typename IntTraits<T>::Unsigned>(low_));
    }

    /// Return the mathematical value of this.
    BigInt toBig() const;

    /// Return the decimal text of this.
    std::string toString() const;

    /// Same kind and same bits.
    bool operator == (const IntValue& other) const
    { return kind_ == other.kind_ and low_ == other.low_ and high_ == other.high_; }

    bool operator != (const IntValue& other) const
    { return not (*this == other); }

  private:

    IntValue(IntKind kind, uint64_t high, uint64_t low)
      : kind_(kind), low_(low), high_(high)
    { }

    IntKind kind_ = IntKind::Int64;
    uint64_t low_ = 0;
    uint64_t high_ = 0;
  };

  /// Print value in the form value::Kind (e.g. -3::Int8).
  std::ostream& operator << (std::ostream& out, const IntValue& value);
}
