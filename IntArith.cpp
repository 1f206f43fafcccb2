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

#include <algorithm>
#include <stdexcept>
#include <string>
#include "IntArith.hpp"
#include "IntConvert.hpp"
#include "IntOps.hpp"
#include "ArithException.hpp"
#include "functors.hpp"


using namespace FixInt;


namespace
{

  /// Apply the given modular binary operation to x and y converted
  /// (modulo) to the given kind.
  template <typename OP>
  IntValue
  wrapBinary(const IntValue& x, const IntValue& y, IntKind kind, OP op)
  {
    IntValue a = truncateTo(x, kind), b = truncateTo(y, kind);
    return dispatchKind(kind, [&](auto tag) {
      using T = typename decltype(tag)::type;
      return IntValue::from(op(a.get<T>(), b.get<T>()));
    });
  }


  /// Apply the given unary operation to x in its own kind.
  template <typename OP>
  auto
  unary(const IntValue& x, OP op)
  {
    return dispatchKind(x.kind(), [&](auto tag) {
      using T = typename decltype(tag)::type;
      return op(x.get<T>());
    });
  }


  /// Apply a shift operation to x in its own kind.
  template <typename OP>
  IntValue
  shift(const IntValue& x, uint64_t n, OP op)
  {
    return dispatchKind(x.kind(), [&](auto tag) {
      using T = typename decltype(tag)::type;
      return IntValue::from(op(x.get<T>(), n));
    });
  }


  /// Convert x to the given kind for a checked operation: an operand
  /// that does not fit the kind of the operation is an overflow.
  IntValue
  checkedOperand(const IntValue& x, IntKind kind)
  {
    try
      {
        return convertTo(x, kind);
      }
    catch (const ArithException& e)
      {
        if (e.type() != ArithException::Inexact)
          throw;
      }
    throw ArithException(ArithException::Overflow, "operand out of range of result type");
  }


  [[noreturn]] void
  throwOverflow()
  {
    throw ArithException(ArithException::Overflow, "integer overflow");
  }


  /// Apply the given checked binary operation to x and y converted to
  /// the given kind. Throw Overflow if the operation fails.
  template <typename OP>
  IntValue
  checkedBinary(const IntValue& x, const IntValue& y, IntKind kind, OP op)
  {
    IntValue a = checkedOperand(x, kind), b = checkedOperand(y, kind);
    return dispatchKind(kind, [&](auto tag) {
      using T = typename decltype(tag)::type;
      T res = T(0);
      if (not op(a.get<T>(), b.get<T>(), res))
        throwOverflow();
      return IntValue::from(res);
    });
  }


  /// Fold a checked binary operation over two or more operands.
  template <typename OP>
  IntValue
  checkedFold(const std::vector<IntValue>& operands, unsigned wordSize, OP op)
  {
    if (operands.size() < 2)
      throw std::invalid_argument("Checked fold requires at least two operands");

    IntKind kind = operands.front().kind();
    for (const auto& x : operands)
      kind = promoteKind(kind, x.kind(), wordSize);

    IntValue acc = checkedOperand(operands.front(), kind);
    for (size_t i = 1; i < operands.size(); ++i)
      acc = checkedBinary(acc, operands.at(i), kind, op);
    return acc;
  }


  /// Bring a signed/unsigned pair to the larger of the two widths,
  /// each operand keeping its signedness, and invoke f with the
  /// resulting C++ values.
  template <typename F>
  auto
  mixedPair(const IntValue& x, const IntValue& y, F f)
  {
    unsigned width = std::max(x.width(), y.width());
    IntValue a = convertTo(x, kindFor(width, x.isSigned()));
    IntValue b = convertTo(y, kindFor(width, y.isSigned()));

    return dispatchWidth(width, [&](auto stag, auto utag) {
      using S = typename decltype(stag)::type;
      using U = typename decltype(utag)::type;
      if (a.isSigned())
        return f(a.get<S>(), b.get<U>());
      return f(a.get<U>(), b.get<S>());
    });
  }


  /// Apply a division family operation. Operands of the same
  /// signedness are promoted (exactly) to their common kind, mixed
  /// operands go through the mixed signed/unsigned algebra.
  template <typename OP>
  IntValue
  divide(const IntValue& x, const IntValue& y, unsigned wordSize, OP op)
  {
    if (x.isSigned() == y.isSigned())
      {
        IntKind kind = promoteKind(x.kind(), y.kind(), wordSize);
        IntValue a = convertTo(x, kind), b = convertTo(y, kind);
        return dispatchKind(kind, [&](auto tag) {
          using T = typename decltype(tag)::type;
          return IntValue::from(op(a.get<T>(), b.get<T>()));
        });
      }

    return mixedPair(x, y, [&](auto a, auto b) {
      return IntValue::from(op(a, b));
    });
  }


  /// Compare the mathematical values of x and y with the given
  /// predicate (isEqual, isLess or isLessEqual of IntOps).
  template <typename PRED>
  bool
  compare(const IntValue& x, const IntValue& y, PRED pred)
  {
    if (x.isSigned() == y.isSigned())
      {
        unsigned width = std::max(x.width(), y.width());
        IntKind kind = kindFor(width, x.isSigned());
        IntValue a = convertTo(x, kind), b = convertTo(y, kind);
        return dispatchKind(kind, [&](auto tag) {
          using T = typename decltype(tag)::type;
          return pred(a.get<T>(), b.get<T>());
        });
      }
    return mixedPair(x, y, pred);
  }


  struct EqualPred
  {
    template <typename A, typename B>
    bool operator() (const A& a, const B& b) const
    { return isEqual(a, b); }
  };


  struct LessPred
  {
    template <typename A, typename B>
    bool operator() (const A& a, const B& b) const
    { return isLess(a, b); }
  };


  struct LessEqualPred
  {
    template <typename A, typename B>
    bool operator() (const A& a, const B& b) const
    { return isLessEqual(a, b); }
  };
}


IntArith::IntArith(unsigned wordSize)
  : wordSize_(wordSize)
{
  if (not isValidWordSize(wordSize))
    throw std::invalid_argument("Invalid word size: " + std::to_string(wordSize) +
                                " (expecting 32 or 64)");
}


IntKind
IntArith::resultKind(IntKind a, IntKind b) const
{
  return promoteKind(a, b, wordSize_);
}


std::pair<IntValue, IntValue>
IntArith::promote(const IntValue& x, const IntValue& y) const
{
  IntKind kind = resultKind(x.kind(), y.kind());
  return std::make_pair(truncateTo(x, kind), truncateTo(y, kind));
}


IntValue
IntArith::add(const IntValue& x, const IntValue& y) const
{
  return wrapBinary(x, y, resultKind(x.kind(), y.kind()), MyAdd());
}


IntValue
IntArith::sub(const IntValue& x, const IntValue& y) const
{
  return wrapBinary(x, y, resultKind(x.kind(), y.kind()), MySub());
}


IntValue
IntArith::mul(const IntValue& x, const IntValue& y) const
{
  return wrapBinary(x, y, resultKind(x.kind(), y.kind()), MyMul());
}


IntValue
IntArith::neg(const IntValue& x) const
{
  return unary(x, [](auto v) { return IntValue::from(wrapNeg(v)); });
}


IntValue
IntArith::abs(const IntValue& x) const
{
  return unary(x, [](auto v) { return IntValue::from(wrapAbs(v)); });
}


IntValue
IntArith::bitNot(const IntValue& x) const
{
  return unary(x, [](auto v) { return IntValue::from(FixInt::bitNot(v)); });
}


IntValue
IntArith::bitAnd(const IntValue& x, const IntValue& y) const
{
  return wrapBinary(x, y, resultKind(x.kind(), y.kind()), MyBitAnd());
}


IntValue
IntArith::bitOr(const IntValue& x, const IntValue& y) const
{
  return wrapBinary(x, y, resultKind(x.kind(), y.kind()), MyBitOr());
}


IntValue
IntArith::bitXor(const IntValue& x, const IntValue& y) const
{
  return wrapBinary(x, y, resultKind(x.kind(), y.kind()), MyBitXor());
}


IntValue
IntArith::shl(const IntValue& x, uint64_t n) const
{
  return shift(x, n, MyShl());
}


IntValue
IntArith::shr(const IntValue& x, uint64_t n) const
{
  return shift(x, n, MyShr());
}


IntValue
IntArith::lshr(const IntValue& x, uint64_t n) const
{
  return shift(x, n, MyLshr());
}


IntValue
IntArith::bswap(const IntValue& x) const
{
  return unary(x, [](auto v) { return IntValue::from(byteSwap(v)); });
}


unsigned
IntArith::countOnes(const IntValue& x) const
{
  return unary(x, [](auto v) { return FixInt::countOnes(v); });
}


unsigned
IntArith::countZeros(const IntValue& x) const
{
  return unary(x, [](auto v) { return FixInt::countZeros(v); });
}


unsigned
IntArith::leadingZeros(const IntValue& x) const
{
  return unary(x, [](auto v) { return FixInt::leadingZeros(v); });
}


unsigned
IntArith::leadingOnes(const IntValue& x) const
{
  return unary(x, [](auto v) { return FixInt::leadingOnes(v); });
}


unsigned
IntArith::trailingZeros(const IntValue& x) const
{
  return unary(x, [](auto v) { return FixInt::trailingZeros(v); });
}


unsigned
IntArith::trailingOnes(const IntValue& x) const
{
  return unary(x, [](auto v) { return FixInt::trailingOnes(v); });
}


IntValue
IntArith::div(const IntValue& x, const IntValue& y) const
{
  return divide(x, y, wordSize_, MyDiv());
}


IntValue
IntArith::rem(const IntValue& x, const IntValue& y) const
{
  return divide(x, y, wordSize_, MyRem());
}


IntValue
IntArith::fld(const IntValue& x, const IntValue& y) const
{
  return divide(x, y, wordSize_, MyFld());
}


IntValue
IntArith::mod(const IntValue& x, const IntValue& y) const
{
  return divide(x, y, wordSize_, MyMod());
}


IntValue
IntArith::cld(const IntValue& x, const IntValue& y) const
{
  return divide(x, y, wordSize_, MyCld());
}


IntValue
IntArith::checkedAdd(const IntValue& x, const IntValue& y) const
{
  return checkedBinary(x, y, resultKind(x.kind(), y.kind()), MyCheckedAdd());
}


IntValue
IntArith::checkedSub(const IntValue& x, const IntValue& y) const
{
  return checkedBinary(x, y, resultKind(x.kind(), y.kind()), MyCheckedSub());
}


IntValue
IntArith::checkedMul(const IntValue& x, const IntValue& y) const
{
  return checkedBinary(x, y, resultKind(x.kind(), y.kind()), MyCheckedMul());
}


IntValue
IntArith::checkedNeg(const IntValue& x) const
{
  return unary(x, [](auto v) {
    decltype(v) res = v;
    if (not FixInt::checkedNeg(v, res))
      throwOverflow();
    return IntValue::from(res);
  });
}


IntValue
IntArith::checkedAbs(const IntValue& x) const
{
  return unary(x, [](auto v) {
    decltype(v) res = v;
    if (not FixInt::checkedAbs(v, res))
      throwOverflow();
    return IntValue::from(res);
  });
}


IntValue
IntArith::checkedDiv(const IntValue& x, const IntValue& y) const
{
  return divide(x, y, wordSize_, MyDiv());
}


IntValue
IntArith::checkedRem(const IntValue& x, const IntValue& y) const
{
  return divide(x, y, wordSize_, MyRem());
}


IntValue
IntArith::checkedFld(const IntValue& x, const IntValue& y) const
{
  return divide(x, y, wordSize_, MyFld());
}


IntValue
IntArith::checkedMod(const IntValue& x, const IntValue& y) const
{
  return divide(x, y, wordSize_, MyMod());
}


IntValue
IntArith::checkedCld(const IntValue& x, const IntValue& y) const
{
  return divide(x, y, wordSize_, MyCld());
}


IntValue
IntArith::checkedAdd(const std::vector<IntValue>& operands) const
{
  return checkedFold(operands, wordSize_, MyCheckedAdd());
}


IntValue
IntArith::checkedMul(const std::vector<IntValue>& operands) const
{
  return checkedFold(operands, wordSize_, MyCheckedMul());
}


bool
IntArith::isEqual(const IntValue& x, const IntValue& y) const
{
  return compare(x, y, EqualPred());
}


bool
IntArith::isLess(const IntValue& x, const IntValue& y) const
{
  return compare(x, y, LessPred());
}


bool
IntArith::isLessEqual(const IntValue& x, const IntValue& y) const
{
  return compare(x, y, LessEqualPred());
}


IntValue
IntArith::widemul(const IntValue& x, const IntValue& y) const
{
  if (x.width() > 64 or y.width() > 64)
    throw ArithException(ArithException::Inexact, "no integer type wider than 128 bits");

  auto product = [](auto a, auto b) -> IntValue {
    if constexpr (IntTraits<decltype(a)>::width > 64)
      throw std::logic_error("Unexpected 128-bit widemul operand");
    else
      return IntValue::from(FixInt::widemul(a, b));
  };

  if (x.isSigned() == y.isSigned())
    {
      IntKind kind = resultKind(x.kind(), y.kind());
      IntValue a = convertTo(x, kind), b = convertTo(y, kind);
      return dispatchKind(kind, [&](auto tag) {
        using T = typename decltype(tag)::type;
        return product(a.get<T>(), b.get<T>());
      });
    }

  return mixedPair(x, y, product);
}


IntValue
IntArith::widen(const IntValue& x) const
{
  IntKind wide = x.kind();
  if (not widenKind(x.kind(), wordSize_, wide))
    throw ArithException(ArithException::Inexact, "no integer type wider than 128 bits");
  return convertTo(x, wide);
}
