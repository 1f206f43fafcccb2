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
#include <utility>
#include <vector>
#include "IntType.hpp"
#include "IntValue.hpp"


namespace FixInt
{

  /// Arithmetic on tagged integer values of possibly different
  /// kinds. Binary operations on operands of different kinds are
  /// carried out in the kind given by the promotion table of the word
  /// size of this object.
  ///
  /// Wrapping operations convert each operand to the promoted kind
  /// modulo 2^width and never throw. Checked operations require each
  /// operand to be representable in the promoted kind and throw
  /// ArithException (Overflow) when an operand or the result is not.
  /// Division operations throw ArithException (DivideByZero) on a zero
  /// divisor whatever the kinds. An IntArith object holds no mutable
  /// state and may be shared between threads.
  class IntArith
  {
  public:

    /// Constructor. Throw std::invalid_argument if the word size is
    /// not 32 or 64.
    explicit IntArith(unsigned wordSize = hostWordSize());

    /// Native word size (in bits) used for promotion.
    unsigned wordSize() const
    { return wordSize_; }

    /// Kind of the result of a binary operation on the given kinds.
    IntKind resultKind(IntKind a, IntKind b) const;

    /// Return x and y converted (modulo) to their promoted kind.
    std::pair<IntValue, IntValue> promote(const IntValue& x, const IntValue& y) const;

    IntValue add(const IntValue& x, const IntValue& y) const;
    IntValue sub(const IntValue& x, const IntValue& y) const;
    IntValue mul(const IntValue& x, const IntValue& y) const;

    /// Modular negation: -typemin is typemin.
    IntValue neg(const IntValue& x) const;

    /// Modular absolute value: abs(typemin) is typemin.
    IntValue abs(const IntValue& x) const;

    IntValue bitNot(const IntValue& x) const;
    IntValue bitAnd(const IntValue& x, const IntValue& y) const;
    IntValue bitOr(const IntValue& x, const IntValue& y) const;
    IntValue bitXor(const IntValue& x, const IntValue& y) const;

    /// Shift left by n bits. Result has the kind of x.
    IntValue shl(const IntValue& x, uint64_t n) const;

    /// Shift right by n bits (arithmetic for signed kinds). Result has
    /// the kind of x.
    IntValue shr(const IntValue& x, uint64_t n) const;

    /// Logical shift right by n bits. Result has the kind of x.
    IntValue lshr(const IntValue& x, uint64_t n) const;

    IntValue bswap(const IntValue& x) const;

    unsigned countOnes(const IntValue& x) const;
    unsigned countZeros(const IntValue& x) const;
    unsigned leadingZeros(const IntValue& x) const;
    unsigned leadingOnes(const IntValue& x) const;
    unsigned trailingZeros(const IntValue& x) const;
    unsigned trailingOnes(const IntValue& x) const;

    // Division family. Operands of the same signedness are promoted.
    // A signed/unsigned pair is brought to the larger of the two widths
    // with each operand keeping its signedness; the result kind is the
    // one of the corresponding mixed operation (signed for div, rem,
    // fld, cld with a signed dividend; unsigned for mod with an unsigned
    // divisor; and so on).

    /// Truncating division.
    IntValue div(const IntValue& x, const IntValue& y) const;

    /// Remainder of truncating division (sign of x).
    IntValue rem(const IntValue& x, const IntValue& y) const;

    /// Floor division.
    IntValue fld(const IntValue& x, const IntValue& y) const;

    /// Floor modulo (sign of y).
    IntValue mod(const IntValue& x, const IntValue& y) const;

    /// Ceiling division.
    IntValue cld(const IntValue& x, const IntValue& y) const;

    IntValue checkedAdd(const IntValue& x, const IntValue& y) const;
    IntValue checkedSub(const IntValue& x, const IntValue& y) const;
    IntValue checkedMul(const IntValue& x, const IntValue& y) const;
    IntValue checkedNeg(const IntValue& x) const;
    IntValue checkedAbs(const IntValue& x) const;

    /// Checked division family. Result kinds and values are those of
    /// the unchecked operators. The only overflow is the minimum of a
    /// signed kind divided by -1 (div, fld and cld).
    IntValue checkedDiv(const IntValue& x, const IntValue& y) const;
    IntValue checkedRem(const IntValue& x, const IntValue& y) const;
    IntValue checkedFld(const IntValue& x, const IntValue& y) const;
    IntValue checkedMod(const IntValue& x, const IntValue& y) const;
    IntValue checkedCld(const IntValue& x, const IntValue& y) const;

    /// Checked sum of two or more operands, left to right. The result
    /// kind is the promotion of all the operand kinds. Throw
    /// std::invalid_argument if fewer than two operands are given.
    IntValue checkedAdd(const std::vector<IntValue>& operands) const;

    /// Checked product of two or more operands, left to right.
    IntValue checkedMul(const std::vector<IntValue>& operands) const;

    // Comparisons of mathematical values: a negative value is less
    // than any value of an unsigned kind.

    bool isEqual(const IntValue& x, const IntValue& y) const;
    bool isLess(const IntValue& x, const IntValue& y) const;
    bool isLessEqual(const IntValue& x, const IntValue& y) const;

    /// Exact product of two operands of at most 64 bits in the double
    /// width kind. Throw ArithException (Inexact) for 128-bit operands.
    IntValue widemul(const IntValue& x, const IntValue& y) const;

    /// Return x converted to the kind obtained by widening its kind.
    /// Throw ArithException (Inexact) for 128-bit kinds.
    IntValue widen(const IntValue& x) const;

  private:

    unsigned wordSize_ = 64;
  };
}
