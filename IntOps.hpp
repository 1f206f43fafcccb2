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

#include <bit>
#include <concepts>
#include <cstdint>
#include "IntTraits.hpp"
#include "ArithException.hpp"


/// Arithmetic on fixed width integers. Each operation is a template
/// instantiated for int8_t to uint64_t and for the 128-bit types
/// (native or emulated). Wrapping operations never throw. Checked
/// operations return true and set result on success and return false
/// (leaving result unmodified) on overflow. Division operations throw
/// ArithException on a zero divisor.


namespace FixInt
{

  template <FixedInt T>
  constexpr T typemin()
  { return IntTraits<T>::min(); }

  template <FixedInt T>
  constexpr T typemax()
  { return IntTraits<T>::max(); }

  /// Return true if x is negative.
  template <FixedInt T>
  constexpr bool signBit(T x)
  {
    if constexpr (IntTraits<T>::isSigned)
      return x < T(0);
    else
      return false;
  }


  /// Modular addition.
  template <FixedInt T>
  constexpr T wrapAdd(T x, T y)
  {
    using C = typename IntTraits<T>::Calc;
    return static_cast<T>(C(toUnsigned(x)) + C(toUnsigned(y)));
  }

  /// Modular subtraction.
  template <FixedInt T>
  constexpr T wrapSub(T x, T y)
  {
    using C = typename IntTraits<T>::Calc;
    return static_cast<T>(C(toUnsigned(x)) - C(toUnsigned(y)));
  }

  /// Modular multiplication.
  template <FixedInt T>
  constexpr T wrapMul(T x, T y)
  {
    using C = typename IntTraits<T>::Calc;
    return static_cast<T>(C(toUnsigned(x)) * C(toUnsigned(y)));
  }

  /// Modular negation.
  template <FixedInt T>
  constexpr T wrapNeg(T x)
  {
    using C = typename IntTraits<T>::Calc;
    return static_cast<T>(C(0u) - C(toUnsigned(x)));
  }

  template <FixedInt T>
  constexpr T bitNot(T x)
  {
    using C = typename IntTraits<T>::Calc;
    return static_cast<T>(~C(toUnsigned(x)));
  }

  template <FixedInt T>
  constexpr T bitAnd(T x, T y)
  {
    using C = typename IntTraits<T>::Calc;
    return static_cast<T>(C(toUnsigned(x)) & C(toUnsigned(y)));
  }

  template <FixedInt T>
  constexpr T bitOr(T x, T y)
  {
    using C = typename IntTraits<T>::Calc;
    return static_cast<T>(C(toUnsigned(x)) | C(toUnsigned(y)));
  }

  template <FixedInt T>
  constexpr T bitXor(T x, T y)
  {
    using C = typename IntTraits<T>::Calc;
    return static_cast<T>(C(toUnsigned(x)) ^ C(toUnsigned(y)));
  }


  /// Shift left. Counts of the full width or more produce zero.
  template <FixedInt T>
  constexpr T shiftLeft(T x, uint64_t n)
  {
    using C = typename IntTraits<T>::Calc;
    if (n >= IntTraits<T>::width)
      return T(0);
    if (n == 0)
      return x;
    return static_cast<T>(C(toUnsigned(x)) << int(n));
  }

  /// Logical (zero filling) shift right for signed and unsigned
  /// types. Counts of the full width or more produce zero.
  template <FixedInt T>
  constexpr T shiftRightLogical(T x, uint64_t n)
  {
    using C = typename IntTraits<T>::Calc;
    if (n >= IntTraits<T>::width)
      return T(0);
    if (n == 0)
      return x;
    return static_cast<T>(C(toUnsigned(x)) >> int(n));
  }

  /// Shift right: arithmetic (sign extending) for signed types and
  /// logical for unsigned types. Counts of the full width or more
  /// produce the sign fill.
  template <FixedInt T>
  constexpr T shiftRight(T x, uint64_t n)
  {
    if constexpr (IntTraits<T>::isSigned)
      {
	if (n >= IntTraits<T>::width)
	  return signBit(x) ? T(-1) : T(0);
	if (n == 0)
	  return x;
	return static_cast<T>(x >> int(n));
      }
    else
      return shiftRightLogical(x, n);
  }


  /// Reverse the order of the bytes of x.
  template <FixedInt T>
  constexpr T byteSwap(T x)
  {
    constexpr unsigned width = IntTraits<T>::width;
    if constexpr (width == 8)
      return x;
    else if constexpr (width == 16)
      return static_cast<T>(__builtin_bswap16(toUnsigned(x)));
    else if constexpr (width == 32)
      return static_cast<T>(__builtin_bswap32(toUnsigned(x)));
    else if constexpr (width == 64)
      return static_cast<T>(__builtin_bswap64(toUnsigned(x)));
    else
      return fromLimbs<T>(__builtin_bswap64(lowLimb(x)), __builtin_bswap64(highLimb(x)));
  }

  /// Population count.
  template <FixedInt T>
  constexpr unsigned countOnes(T x)
  {
    if constexpr (IntTraits<T>::width == 128)
      return std::popcount(highLimb(x)) + std::popcount(lowLimb(x));
    else
      return std::popcount(toUnsigned(x));
  }

  template <FixedInt T>
  constexpr unsigned leadingZeros(T x)
  {
    if constexpr (IntTraits<T>::width == 128)
      {
	uint64_t high = highLimb(x);
	if (high != 0)
	  return std::countl_zero(high);
	return 64 + std::countl_zero(lowLimb(x));
      }
    else
      return std::countl_zero(toUnsigned(x));
  }

  template <FixedInt T>
  constexpr unsigned trailingZeros(T x)
  {
    if constexpr (IntTraits<T>::width == 128)
      {
	uint64_t low = lowLimb(x);
	if (low != 0)
	  return std::countr_zero(low);
	return 64 + std::countr_zero(highLimb(x));
      }
    else
      return std::countr_zero(toUnsigned(x));
  }

  template <FixedInt T>
  constexpr unsigned countZeros(T x)
  { return countOnes(bitNot(x)); }

  template <FixedInt T>
  constexpr unsigned leadingOnes(T x)
  { return leadingZeros(bitNot(x)); }

  template <FixedInt T>
  constexpr unsigned trailingOnes(T x)
  { return trailingZeros(bitNot(x)); }


  /// Return x negated if y is negative and x otherwise (modular).
  template <FixedInt T>
  constexpr T flipSign(T x, T y)
  { return signBit(y) ? wrapNeg(x) : x; }

  /// Return x with the sign of y (modular).
  template <FixedInt T>
  constexpr T copySign(T x, T y)
  { return flipSign(x, bitXor(x, y)); }

  /// Wrapping absolute value: abs(typemin) is typemin.
  template <FixedInt T>
  constexpr T wrapAbs(T x)
  { return flipSign(x, x); }

  /// Absolute value of x as the same-width unsigned type. Exact for
  /// every x including typemin.
  template <FixedInt T>
  constexpr typename IntTraits<T>::Unsigned absUnsigned(T x)
  {
    auto u = toUnsigned(x);
    return signBit(x) ? wrapNeg(u) : u;
  }

  template <FixedInt T>
  constexpr bool isOdd(T x)
  { return bitAnd(x, T(1)) != T(0); }

  template <FixedInt T>
  constexpr bool isEven(T x)
  { return not isOdd(x); }


  template <FixedInt T>
  constexpr bool isEqual(T x, T y)
  { return x == y; }

  template <FixedInt T>
  constexpr bool isLess(T x, T y)
  { return x < y; }

  template <FixedInt T>
  constexpr bool isLessEqual(T x, T y)
  { return x <= y; }

  /// Mixed signed/unsigned comparisons of same-width values. These
  /// compare mathematical values: a negative number is less than any
  /// unsigned number.
  template <SignedFixedInt S, UnsignedFixedInt U>
  requires (IntTraits<S>::width == IntTraits<U>::width)
  constexpr bool isEqual(S x, U y)
  { return not signBit(x) and toUnsigned(x) == y; }

  template <UnsignedFixedInt U, SignedFixedInt S>
  requires (IntTraits<S>::width == IntTraits<U>::width)
  constexpr bool isEqual(U x, S y)
  { return isEqual(y, x); }

  template <SignedFixedInt S, UnsignedFixedInt U>
  requires (IntTraits<S>::width == IntTraits<U>::width)
  constexpr bool isLess(S x, U y)
  { return signBit(x) or toUnsigned(x) < y; }

  template <UnsignedFixedInt U, SignedFixedInt S>
  requires (IntTraits<S>::width == IntTraits<U>::width)
  constexpr bool isLess(U x, S y)
  { return S(0) < y and x < toUnsigned(y); }

  template <SignedFixedInt S, UnsignedFixedInt U>
  requires (IntTraits<S>::width == IntTraits<U>::width)
  constexpr bool isLessEqual(S x, U y)
  { return signBit(x) or toUnsigned(x) <= y; }

  template <UnsignedFixedInt U, SignedFixedInt S>
  requires (IntTraits<S>::width == IntTraits<U>::width)
  constexpr bool isLessEqual(U x, S y)
  { return not signBit(y) and x <= toUnsigned(y); }


  /// Return the 128-bit product of two 64-bit unsigned operands. W
  /// selects the 128-bit implementation: for the emulated type the
  /// product is assembled from 32-bit limbs.
  template <UnsignedFixedInt W = Uint128>
  requires (IntTraits<W>::width == 128)
  constexpr W widemulU64(uint64_t x, uint64_t y)
  {
    if constexpr (std::is_same<W, UwideInt>::value)
      return UwideInt::widemul(x, y);
    else
      return W(x) * W(y);
  }

  /// Return the 128-bit product of two 64-bit signed operands. The
  /// magnitudes are multiplied unsigned and the sign reapplied.
  template <SignedFixedInt W = Int128>
  requires (IntTraits<W>::width == 128)
  constexpr W widemulS64(int64_t x, int64_t y)
  {
    using UW = typename IntTraits<W>::Unsigned;
    UW prod = widemulU64<UW>(absUnsigned(x), absUnsigned(y));
    if (signBit(x) != signBit(y))
      prod = wrapNeg(prod);
    return toSigned(prod);
  }

  /// Return the integral type that is twice as wide as the given
  /// type. For example:
  ///    makeDoubleWide<uint16_t>::type
  /// yields the type
  ///    uint32_t.
  template <typename T>
  struct makeDoubleWide;

  template <> struct makeDoubleWide<uint8_t>    { using type = uint16_t; };
  template <> struct makeDoubleWide<uint16_t>   { using type = uint32_t; };
  template <> struct makeDoubleWide<uint32_t>   { using type = uint64_t; };
  template <> struct makeDoubleWide<uint64_t>   { using type = Uint128; };

  template <> struct makeDoubleWide<int8_t>     { using type = int16_t; };
  template <> struct makeDoubleWide<int16_t>    { using type = int32_t; };
  template <> struct makeDoubleWide<int32_t>    { using type = int64_t; };
  template <> struct makeDoubleWide<int64_t>    { using type = Int128; };

  /// Exact (double width) product of two same-type operands.
  template <FixedInt T>
  requires (IntTraits<T>::width <= 64)
  constexpr typename makeDoubleWide<T>::type widemul(T x, T y)
  {
    using W = typename makeDoubleWide<T>::type;
    if constexpr (IntTraits<T>::width == 64 and IntTraits<T>::isSigned)
      return widemulS64<W>(x, y);
    else if constexpr (IntTraits<T>::width == 64)
      return widemulU64<W>(x, y);
    else
      return wrapMul(W(x), W(y));
  }

  /// Exact product of a signed and an unsigned operand of the same
  /// width as the double width signed type.
  template <SignedFixedInt S, UnsignedFixedInt U>
  requires (IntTraits<S>::width == IntTraits<U>::width and IntTraits<S>::width <= 64)
  constexpr typename makeDoubleWide<S>::type widemul(S x, U y)
  {
    using W = typename makeDoubleWide<S>::type;
    return wrapMul(W(x), W(y));
  }

  template <UnsignedFixedInt U, SignedFixedInt S>
  requires (IntTraits<S>::width == IntTraits<U>::width and IntTraits<S>::width <= 64)
  constexpr typename makeDoubleWide<S>::type widemul(U x, S y)
  { return widemul(y, x); }


  [[noreturn]] inline void
  throwDivideByZero()
  {
    throw ArithException(ArithException::DivideByZero, "integer division by zero");
  }

  [[noreturn]] inline void
  throwDivideOverflow()
  {
    throw ArithException(ArithException::Overflow, "integer division overflow");
  }

  /// Return true if x/y is the one overflowing signed quotient
  /// (typemin divided by -1).
  template <FixedInt T>
  constexpr bool isDivideOverflow(T x, T y)
  {
    if constexpr (IntTraits<T>::isSigned)
      return x == typemin<T>() and y == T(-1);
    else
      return false;
  }

  /// Truncating division (round toward zero).
  template <FixedInt T>
  T divTrunc(T x, T y)
  {
    if (y == T(0))
      throwDivideByZero();
    if (isDivideOverflow(x, y))
      throwDivideOverflow();
    return static_cast<T>(x / y);
  }

  /// Remainder of truncating division: x == divTrunc(x,y)*y + remTrunc(x,y).
  /// The result has the sign of x (or is zero).
  template <FixedInt T>
  T remTrunc(T x, T y)
  {
    if (y == T(0))
      throwDivideByZero();
    if constexpr (IntTraits<T>::isSigned)
      if (y == T(-1))
	return T(0);
    return static_cast<T>(x % y);
  }

  /// Floor division (round toward negative infinity).
  template <FixedInt T>
  T divFloor(T x, T y)
  {
    T d = divTrunc(x, y);
    if constexpr (IntTraits<T>::isSigned)
      if (signBit(bitXor(x, y)) and remTrunc(x, y) != T(0))
	d = wrapSub(d, T(1));
    return d;
  }

  /// Floor modulo: x == divFloor(x,y)*y + modFloor(x,y). The result
  /// has the sign of y (or is zero).
  template <FixedInt T>
  T modFloor(T x, T y)
  {
    if constexpr (not IntTraits<T>::isSigned)
      return remTrunc(x, y);
    else
      {
	if (y == T(0))
	  throwDivideByZero();
	if (y == T(-1))
	  return T(0);  // Avoid the overflow in divFloor(typemin, -1).
	if constexpr (std::is_same<T, WideInt>::value)
	  return x.floorMod(y);
	else
	  return wrapSub(x, wrapMul(divFloor(x, y), y));
      }
  }

  /// Ceiling division (round toward positive infinity).
  template <FixedInt T>
  T divCeil(T x, T y)
  {
    T d = divTrunc(x, y);
    if ((T(0) < x) == (T(0) < y) and remTrunc(x, y) != T(0))
      d = wrapAdd(d, T(1));
    return d;
  }


  // Mixed signed/unsigned division of same-width operands. The
  // magnitude of the signed operand is taken as unsigned (exact for
  // typemin), the unsigned operation performed and the sign
  // reapplied. Results are modular in the result type.

  template <SignedFixedInt S, UnsignedFixedInt U>
  requires (IntTraits<S>::width == IntTraits<U>::width)
  S divTrunc(S x, U y)
  { return flipSign(toSigned(divTrunc(absUnsigned(x), y)), x); }

  template <UnsignedFixedInt U, SignedFixedInt S>
  requires (IntTraits<S>::width == IntTraits<U>::width)
  U divTrunc(U x, S y)
  { return toUnsigned(flipSign(toSigned(divTrunc(x, absUnsigned(y))), y)); }

  template <SignedFixedInt S, UnsignedFixedInt U>
  requires (IntTraits<S>::width == IntTraits<U>::width)
  S remTrunc(S x, U y)
  { return flipSign(toSigned(remTrunc(absUnsigned(x), y)), x); }

  template <UnsignedFixedInt U, SignedFixedInt S>
  requires (IntTraits<S>::width == IntTraits<U>::width)
  U remTrunc(U x, S y)
  { return remTrunc(x, absUnsigned(y)); }

  template <SignedFixedInt S, UnsignedFixedInt U>
  requires (IntTraits<S>::width == IntTraits<U>::width)
  S divFloor(S x, U y)
  {
    S d = divTrunc(x, y);
    if (signBit(x) and remTrunc(absUnsigned(x), y) != U(0))
      d = wrapSub(d, S(1));
    return d;
  }

  template <UnsignedFixedInt U, SignedFixedInt S>
  requires (IntTraits<S>::width == IntTraits<U>::width)
  U divFloor(U x, S y)
  {
    U d = divTrunc(x, y);
    if (signBit(y) and remTrunc(x, absUnsigned(y)) != U(0))
      d = wrapSub(d, U(1));
    return d;
  }

  template <SignedFixedInt S, UnsignedFixedInt U>
  requires (IntTraits<S>::width == IntTraits<U>::width)
  S divCeil(S x, U y)
  {
    S d = divTrunc(x, y);
    if (not signBit(x) and remTrunc(absUnsigned(x), y) != U(0))
      d = wrapAdd(d, S(1));
    return d;
  }

  template <UnsignedFixedInt U, SignedFixedInt S>
  requires (IntTraits<S>::width == IntTraits<U>::width)
  U divCeil(U x, S y)
  {
    U d = divTrunc(x, y);
    if (not signBit(y) and remTrunc(x, absUnsigned(y)) != U(0))
      d = wrapAdd(d, U(1));
    return d;
  }

  /// Floor modulo of a signed dividend by an unsigned divisor: the
  /// non-negative residue, as the unsigned type.
  template <SignedFixedInt S, UnsignedFixedInt U>
  requires (IntTraits<S>::width == IntTraits<U>::width)
  U modFloor(S x, U y)
  {
    U r = remTrunc(absUnsigned(x), y);
    if (signBit(x) and r != U(0))
      return wrapSub(y, r);
    return r;
  }

  /// Floor modulo of an unsigned dividend by a signed divisor, as
  /// the signed type (sign of the divisor).
  template <UnsignedFixedInt U, SignedFixedInt S>
  requires (IntTraits<S>::width == IntTraits<U>::width)
  S modFloor(U x, S y)
  {
    U mag = absUnsigned(y);
    U r = remTrunc(x, mag);
    if (signBit(y) and r != U(0))
      return wrapSub(toSigned(r), toSigned(mag));
    return toSigned(r);
  }


  /// Checked addition.
  template <FixedInt T>
  bool checkedAdd(T x, T y, T& result)
  {
    T r = wrapAdd(x, y);
    if constexpr (IntTraits<T>::isSigned)
      {
	// Operands of same sign and result of different sign.
	if (not signBit(bitXor(x, y)) and signBit(bitXor(x, r)))
	  return false;
      }
    else
      {
	if (x > bitNot(y))
	  return false;
      }
    result = r;
    return true;
  }

  /// Checked subtraction.
  template <FixedInt T>
  bool checkedSub(T x, T y, T& result)
  {
    T r = wrapSub(x, y);
    if constexpr (IntTraits<T>::isSigned)
      {
	// Operands of different signs and result sign differs from x.
	if (signBit(bitXor(x, y)) and signBit(bitXor(x, r)))
	  return false;
      }
    else
      {
	if (x < y)
	  return false;
      }
    result = r;
    return true;
  }

  /// Checked multiplication. The product is bounded against the type
  /// limits by dividing the limits by y beforehand.
  template <FixedInt T>
  bool checkedMul(T x, T y, T& result)
  {
    if constexpr (IntTraits<T>::isSigned)
      {
	if (T(0) < y)
	  {
	    if (divFloor(typemax<T>(), y) < x or x < divCeil(typemin<T>(), y))
	      return false;
	  }
	else if (y < T(0))
	  {
	    if (x < divCeil(typemax<T>(), y))
	      return false;
	    // y == -1 would overflow divFloor; covered by the test above.
	    if (y != T(-1) and divFloor(typemin<T>(), y) < x)
	      return false;
	  }
      }
    else
      {
	if (T(0) < y and divTrunc(typemax<T>(), y) < x)
	  return false;
      }
    result = wrapMul(x, y);
    return true;
  }

  /// Checked negation: Fails for typemin of a signed type and for
  /// any non-zero unsigned value.
  template <FixedInt T>
  bool checkedNeg(T x, T& result)
  {
    if constexpr (IntTraits<T>::isSigned)
      {
	if (x == typemin<T>())
	  return false;
	result = wrapNeg(x);
      }
    else
      {
	if (x != T(0))
	  return false;
	result = x;
      }
    return true;
  }

  /// Checked absolute value: Fails for typemin of a signed type.
  template <FixedInt T>
  bool checkedAbs(T x, T& result)
  {
    if (x == typemin<T>() and IntTraits<T>::isSigned)
      return false;
    result = wrapAbs(x);
    return true;
  }

  template <FixedInt T>
  bool checkedDiv(T x, T y, T& result)
  {
    if (isDivideOverflow(x, y))
      return false;
    result = divTrunc(x, y);
    return true;
  }

  template <FixedInt T>
  bool checkedRem(T x, T y, T& result)
  {
    result = remTrunc(x, y);
    return true;
  }

  template <FixedInt T>
  bool checkedFld(T x, T y, T& result)
  {
    if (isDivideOverflow(x, y))
      return false;
    result = divFloor(x, y);
    return true;
  }

  template <FixedInt T>
  bool checkedMod(T x, T y, T& result)
  {
    result = modFloor(x, y);
    return true;
  }

  template <FixedInt T>
  bool checkedCld(T x, T y, T& result)
  {
    if (isDivideOverflow(x, y))
      return false;
    result = divCeil(x, y);
    return true;
  }

  /// Checked sum of three or more operands, left to right, stopping
  /// at the first overflow.
  template <FixedInt T, std::same_as<T>... Rest>
  bool checkedAddMany(T& result, T x1, T x2, T x3, Rest... rest)
  {
    T acc = x1;
    bool ok = (checkedAdd(acc, x2, acc) and checkedAdd(acc, x3, acc) and
	       (checkedAdd(acc, rest, acc) and ...));
    if (ok)
      result = acc;
    return ok;
  }

  /// Checked product of three or more operands, left to right,
  /// stopping at the first overflow.
  template <FixedInt T, std::same_as<T>... Rest>
  bool checkedMulMany(T& result, T x1, T x2, T x3, Rest... rest)
  {
    T acc = x1;
    bool ok = (checkedMul(acc, x2, acc) and checkedMul(acc, x3, acc) and
	       (checkedMul(acc, rest, acc) and ...));
    if (ok)
      result = acc;
    return ok;
  }
}
