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
#include <limits>
#include <type_traits>
#include "wideint.hpp"


namespace FixInt
{

  /// Static description of a fixed width integer type: width,
  /// signedness, same-width signed/unsigned counterparts and range.
  /// Defined for int8_t to uint64_t, for the emulated 128-bit types
  /// and, when the compiler has them, for the native 128-bit types.
  template <typename T>
  struct IntTraits;

  /// Traits of the built-in 8 to 64 bit types.
  template <typename T, typename S, typename U>
  struct BuiltinIntTraits
  {
    static constexpr unsigned width = 8*sizeof(T);
    static constexpr bool isSigned = std::is_signed<T>::value;
    using Signed = S;
    using Unsigned = U;

    /// Type used to carry out modular arithmetic without integral
    /// promotion to (signed) int.
    using Calc = std::conditional_t<(width < 32), uint32_t, U>;

    static constexpr T min() { return std::numeric_limits<T>::min(); }
    static constexpr T max() { return std::numeric_limits<T>::max(); }
  };

  template <> struct IntTraits<int8_t>   : BuiltinIntTraits<int8_t,   int8_t,  uint8_t>  { };
  template <> struct IntTraits<int16_t>  : BuiltinIntTraits<int16_t,  int16_t, uint16_t> { };
  template <> struct IntTraits<int32_t>  : BuiltinIntTraits<int32_t,  int32_t, uint32_t> { };
  template <> struct IntTraits<int64_t>  : BuiltinIntTraits<int64_t,  int64_t, uint64_t> { };
  template <> struct IntTraits<uint8_t>  : BuiltinIntTraits<uint8_t,  int8_t,  uint8_t>  { };
  template <> struct IntTraits<uint16_t> : BuiltinIntTraits<uint16_t, int16_t, uint16_t> { };
  template <> struct IntTraits<uint32_t> : BuiltinIntTraits<uint32_t, int32_t, uint32_t> { };
  template <> struct IntTraits<uint64_t> : BuiltinIntTraits<uint64_t, int64_t, uint64_t> { };

  template <> struct IntTraits<UwideInt>
  {
    static constexpr unsigned width = 128;
    static constexpr bool isSigned = false;
    using Signed = WideInt;
    using Unsigned = UwideInt;
    using Calc = UwideInt;

    static constexpr UwideInt min() { return UwideInt(0u); }
    static constexpr UwideInt max() { return UwideInt(~uint64_t(0), ~uint64_t(0)); }
  };

  template <> struct IntTraits<WideInt>
  {
    static constexpr unsigned width = 128;
    static constexpr bool isSigned = true;
    using Signed = WideInt;
    using Unsigned = UwideInt;
    using Calc = UwideInt;

    static constexpr WideInt min()
    { return WideInt(std::numeric_limits<int64_t>::min(), 0); }

    static constexpr WideInt max()
    { return WideInt(std::numeric_limits<int64_t>::max(), ~uint64_t(0)); }
  };

#ifdef __SIZEOF_INT128__

  __extension__ using NativeInt128 = __int128;
  __extension__ using NativeUint128 = unsigned __int128;

  template <> struct IntTraits<NativeUint128>
  {
    static constexpr unsigned width = 128;
    static constexpr bool isSigned = false;
    using Signed = NativeInt128;
    using Unsigned = NativeUint128;
    using Calc = NativeUint128;

    static constexpr NativeUint128 min() { return 0; }
    static constexpr NativeUint128 max() { return ~NativeUint128(0); }
  };

  template <> struct IntTraits<NativeInt128>
  {
    static constexpr unsigned width = 128;
    static constexpr bool isSigned = true;
    using Signed = NativeInt128;
    using Unsigned = NativeUint128;
    using Calc = NativeUint128;

    static constexpr NativeInt128 min() { return -max() - 1; }
    static constexpr NativeInt128 max() { return NativeInt128(~NativeUint128(0) >> 1); }
  };

#endif

  /// Concept satisfied by the types having IntTraits.
  template <typename T>
  concept FixedInt = requires { IntTraits<T>::width; };

  /// Concept satisfied by signed fixed width types.
  template <typename T>
  concept SignedFixedInt = FixedInt<T> and IntTraits<T>::isSigned;

  /// Concept satisfied by unsigned fixed width types.
  template <typename T>
  concept UnsignedFixedInt = FixedInt<T> and not IntTraits<T>::isSigned;

  /// Reinterpret the bits of x as the same-width unsigned type.
  template <FixedInt T>
  constexpr typename IntTraits<T>::Unsigned
  toUnsigned(T x)
  { return static_cast<typename IntTraits<T>::Unsigned>(x); }

  /// Reinterpret the bits of x as the same-width signed type.
  template <FixedInt T>
  constexpr typename IntTraits<T>::Signed
  toSigned(T x)
  { return static_cast<typename IntTraits<T>::Signed>(x); }

  /// Return the most significant 64 bits of a 128-bit value.
  template <FixedInt T>
  requires (IntTraits<T>::width == 128)
  constexpr uint64_t
  highLimb(T x)
  {
    if constexpr (LimbInt<T>)
      return static_cast<uint64_t>(x.high());
    else
      return static_cast<uint64_t>(toUnsigned(x) >> 64);
  }

  /// Return the least significant 64 bits of a 128-bit value.
  template <FixedInt T>
  requires (IntTraits<T>::width == 128)
  constexpr uint64_t
  lowLimb(T x)
  {
    if constexpr (LimbInt<T>)
      return x.low();
    else
      return static_cast<uint64_t>(x);
  }

  /// Assemble a 128-bit value from its limbs.
  template <FixedInt T>
  requires (IntTraits<T>::width == 128)
  constexpr T
  fromLimbs(uint64_t high, uint64_t low)
  {
    using U = typename IntTraits<T>::Unsigned;
    if constexpr (LimbInt<T>)
      return T(U(high, low));
    else
      return static_cast<T>((U(high) << 64) | U(low));
  }
}
