// Copyright 2020 Western Digital Corporation or its affiliates.
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

#include <concepts>
#include <cstdint>
#include <type_traits>


// 128-bit integers made of a pair of 64-bit limbs. They stand in for
// __int128 where the compiler lacks it or where FIXINT_SOFT_INT128 is
// defined. The signed type is 2's complement.


namespace FixInt
{

  /// Common (empty) base of the limb based integers.
  struct WideIntTag
  {
  };

  /// Satisfied by the limb based integers.
  template <typename T>
  concept LimbInt = std::derived_from<T, WideIntTag>;

  class UwideInt;
  class WideInt;

  using EmuUint128 = UwideInt;
  using EmuInt128  = WideInt;

#if defined(__SIZEOF_INT128__) and not defined(FIXINT_SOFT_INT128)
  __extension__ typedef __int128 Int128;
  __extension__ typedef unsigned __int128 Uint128;
#else
  typedef WideInt Int128;
  typedef UwideInt Uint128;
#endif

  /// True when Int128/Uint128 are the compiler types rather than the
  /// limb emulation.
  constexpr bool hasNativeInt128()
  { return not std::is_same<Uint128, UwideInt>::value; }


  /// Limb storage and the operations whose result bits do not depend
  /// on signedness: addition, subtraction, multiplication, left shift
  /// and the bitwise operations. DERIVED is the signed or unsigned
  /// integer built on top.
  template <typename DERIVED>
  class LimbPair : public WideIntTag
  {
  public:

    static constexpr int totalBits = 128;
    static constexpr int limbBits = 64;

    constexpr DERIVED& operator += (const DERIVED& x)
    {
      uint64_t sum = lo_ + x.lo_;
      hi_ += x.hi_ + (sum < lo_ ? 1 : 0);
      lo_ = sum;
      return self();
    }

    constexpr DERIVED& operator -= (const DERIVED& x)
    {
      uint64_t borrow = lo_ < x.lo_ ? 1 : 0;
      lo_ -= x.lo_;
      hi_ -= x.hi_ + borrow;
      return self();
    }

    /// Only the low 128 bits of the product are kept. These do not
    /// need hi*hi nor the upper halves of the two cross products.
    constexpr DERIVED& operator *= (const DERIVED& x)
    {
      uint64_t a = lo_, b = hi_;
      uint64_t carry = 0;
      lo_ = mulLimbs(a, x.lo_, carry);
      hi_ = carry + a*x.hi_ + b*x.lo_;
      return self();
    }

    constexpr DERIVED& operator |= (const DERIVED& x)
    { lo_ |= x.lo_;  hi_ |= x.hi_;  return self(); }

    constexpr DERIVED& operator &= (const DERIVED& x)
    { lo_ &= x.lo_;  hi_ &= x.hi_;  return self(); }

    constexpr DERIVED& operator ^= (const DERIVED& x)
    { lo_ ^= x.lo_;  hi_ ^= x.hi_;  return self(); }

    constexpr DERIVED operator ~ () const
    {
      DERIVED r;
      r.lo_ = ~lo_;
      r.hi_ = ~hi_;
      return r;
    }

    /// Shift amounts of 128 or more clear the value.
    constexpr DERIVED& operator <<= (int n)
    {
      if (n >= totalBits)
	hi_ = lo_ = 0;
      else if (n >= limbBits)
	{
	  hi_ = lo_ << (n - limbBits);
	  lo_ = 0;
	}
      else if (n > 0)
	{
	  hi_ = (hi_ << n) | (lo_ >> (limbBits - n));
	  lo_ <<= n;
	}
      return self();
    }

    /// Multiply two 64-bit values in 32-bit pieces. Return the low 64
    /// bits of the product and set high to the upper 64 bits.
    static constexpr uint64_t mulLimbs(uint64_t u, uint64_t v, uint64_t& high)
    {
      constexpr uint64_t lowMask = 0xffffffff;
      uint64_t uLo = u & lowMask, uHi = u >> 32;
      uint64_t vLo = v & lowMask, vHi = v >> 32;

      uint64_t ll = uLo * vLo;
      uint64_t hl = uHi * vLo + (ll >> 32);
      uint64_t lh = uLo * vHi + (hl & lowMask);

      high = uHi * vHi + (hl >> 32) + (lh >> 32);
      return (lh << 32) | (ll & lowMask);
    }

  protected:

    constexpr LimbPair() = default;

    constexpr LimbPair(uint64_t hi, uint64_t lo)
      : lo_(lo), hi_(hi)
    { }

    /// Shift right filling vacated bits with fill (0 or all ones).
    constexpr DERIVED& shiftRightFill(int n, uint64_t fill)
    {
      if (n >= totalBits)
	hi_ = lo_ = fill;
      else if (n >= limbBits)
	{
	  lo_ = n == limbBits ? hi_ : (hi_ >> (n - limbBits)) | (fill << (totalBits - n));
	  hi_ = fill;
	}
      else if (n > 0)
	{
	  lo_ = (lo_ >> n) | (hi_ << (limbBits - n));
	  hi_ = (hi_ >> n) | (fill << (limbBits - n));
	}
      return self();
    }

    constexpr DERIVED& self()
    { return static_cast<DERIVED&>(*this); }

    uint64_t lo_ = 0;
    uint64_t hi_ = 0;
  };


  /// Unsigned 128-bit integer.
  class UwideInt : public LimbPair<UwideInt>
  {
  public:

    using Signed = WideInt;

    constexpr UwideInt() = default;

    constexpr UwideInt(const UwideInt&) = default;

    constexpr UwideInt& operator = (const UwideInt&) = default;

    /// Same bits as the given signed value.
    constexpr UwideInt(const WideInt& x);

    template <std::unsigned_integral UINT>
    constexpr UwideInt(UINT x)
      : LimbPair(0, x)
    { }

    /// Negative values are sign extended to 128 bits.
    template <std::signed_integral INT>
    constexpr UwideInt(INT x)
      : LimbPair(x < 0 ? ~uint64_t(0) : 0, static_cast<uint64_t>(x))
    { }

    constexpr UwideInt(uint64_t high, uint64_t low)
      : LimbPair(high, low)
    { }

    constexpr uint64_t low() const
    { return lo_; }

    constexpr uint64_t high() const
    { return hi_; }

    /// Truncate to a built-in integer.
    template <std::integral INT>
    constexpr explicit operator INT() const
    { return static_cast<INT>(lo_); }

    /// Full 128-bit product of two 64-bit values.
    static constexpr UwideInt widemul(uint64_t u, uint64_t v)
    {
      uint64_t high = 0;
      uint64_t low = mulLimbs(u, v, high);
      return UwideInt(high, low);
    }

    /// Throws ArithException when x is zero.
    UwideInt& operator /= (const UwideInt& x);

    /// Throws ArithException when x is zero.
    UwideInt& operator %= (const UwideInt& x);

    /// Logical shift.
    constexpr UwideInt& operator >>= (int n)
    { return shiftRightFill(n, 0); }

    constexpr bool operator == (const UwideInt& x) const
    { return lo_ == x.lo_ and hi_ == x.hi_; }

    constexpr bool operator != (const UwideInt& x) const
    { return lo_ != x.lo_ or hi_ != x.hi_; }

    constexpr bool operator < (const UwideInt& x) const
    { return hi_ != x.hi_ ? hi_ < x.hi_ : lo_ < x.lo_; }

    constexpr bool operator > (const UwideInt& x) const
    { return x < *this; }

    constexpr bool operator <= (const UwideInt& x) const
    { return not (x < *this); }

    constexpr bool operator >= (const UwideInt& x) const
    { return not (*this < x); }
  };


  /// Signed 128-bit integer.
  class WideInt : public LimbPair<WideInt>
  {
  public:

    using Unsigned = UwideInt;

    constexpr WideInt() = default;

    constexpr WideInt(const WideInt&) = default;

    constexpr WideInt& operator = (const WideInt&) = default;

    /// Same bits as the given unsigned value.
    constexpr WideInt(const UwideInt& x)
      : LimbPair(x.high(), x.low())
    { }

    template <std::unsigned_integral UINT>
    constexpr WideInt(UINT x)
      : LimbPair(0, x)
    { }

    template <std::signed_integral INT>
    constexpr WideInt(INT x)
      : LimbPair(x < 0 ? ~uint64_t(0) : 0, static_cast<uint64_t>(x))
    { }

    constexpr WideInt(int64_t high, uint64_t low)
      : LimbPair(static_cast<uint64_t>(high), low)
    { }

    constexpr uint64_t low() const
    { return lo_; }

    /// Upper limb, carrying the sign.
    constexpr int64_t high() const
    { return static_cast<int64_t>(hi_); }

    template <std::integral INT>
    constexpr explicit operator INT() const
    { return static_cast<INT>(lo_); }

    constexpr bool isNegative() const
    { return (hi_ >> 63) != 0; }

    /// Truncating division. Throws ArithException when x is zero and
    /// when dividing the minimum by -1.
    WideInt& operator /= (const WideInt& x);

    /// Remainder with the sign of the dividend. Throws ArithException
    /// when x is zero.
    WideInt& operator %= (const WideInt& x);

    /// Remainder with the sign of x.
    WideInt floorMod(const WideInt& x) const;

    /// Arithmetic shift.
    constexpr WideInt& operator >>= (int n)
    { return shiftRightFill(n, isNegative() ? ~uint64_t(0) : 0); }

    constexpr bool operator == (const WideInt& x) const
    { return lo_ == x.lo_ and hi_ == x.hi_; }

    constexpr bool operator != (const WideInt& x) const
    { return lo_ != x.lo_ or hi_ != x.hi_; }

    constexpr bool operator < (const WideInt& x) const
    { return hi_ != x.hi_ ? high() < x.high() : lo_ < x.lo_; }

    constexpr bool operator > (const WideInt& x) const
    { return x < *this; }

    constexpr bool operator <= (const WideInt& x) const
    { return not (x < *this); }

    constexpr bool operator >= (const WideInt& x) const
    { return not (*this < x); }
  };


  constexpr UwideInt::UwideInt(const WideInt& x)
    : LimbPair(static_cast<uint64_t>(x.high()), x.low())
  { }


  /// Right operand of a binary operator on a limb integer W: another W
  /// or a built-in integer converted to W.
  template <typename W, typename R>
  concept LimbOperand = LimbInt<W> and (std::integral<R> or std::same_as<W, R>);

  template <typename W, typename R> requires LimbOperand<W, R>
  constexpr W operator + (W a, const R& b)
  { return a += W(b); }

  template <typename W, typename R> requires LimbOperand<W, R>
  constexpr W operator - (W a, const R& b)
  { return a -= W(b); }

  template <typename W, typename R> requires LimbOperand<W, R>
  constexpr W operator * (W a, const R& b)
  { return a *= W(b); }

  template <typename W, typename R> requires LimbOperand<W, R>
  inline W operator / (W a, const R& b)
  { return a /= W(b); }

  template <typename W, typename R> requires LimbOperand<W, R>
  inline W operator % (W a, const R& b)
  { return a %= W(b); }

  template <typename W, typename R> requires LimbOperand<W, R>
  constexpr W operator | (W a, const R& b)
  { return a |= W(b); }

  template <typename W, typename R> requires LimbOperand<W, R>
  constexpr W operator & (W a, const R& b)
  { return a &= W(b); }

  template <typename W, typename R> requires LimbOperand<W, R>
  constexpr W operator ^ (W a, const R& b)
  { return a ^= W(b); }

  /// Negation modulo 2^128.
  template <LimbInt W>
  constexpr W operator - (const W& a)
  { return W(0u) - a; }

  template <LimbInt W>
  constexpr W operator << (W x, int n)
  { return x <<= n; }

  template <LimbInt W>
  constexpr W operator >> (W x, int n)
  { return x >>= n; }
}
