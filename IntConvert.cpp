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

#include <cmath>
#include <stdexcept>
#include "IntConvert.hpp"
#include "ArithException.hpp"
#include "wideint.hpp"


using namespace FixInt;


namespace
{
  constexpr ConversionTable conversionTable = makeConversionTable();

  // Conversions operate on the zero-extended 128-bit pattern held in
  // the emulated type so that a single routine serves every width.
  using Bits = EmuUint128;

  Bits
  widthMask(unsigned width)
  {
    if (width == 128)
      return ~Bits(0u);
    return (Bits(1u) << int(width)) - Bits(1u);
  }

  bool
  topBit(const Bits& x, unsigned width)
  {
    return ((x >> int(width - 1)) & Bits(1u)) != Bits(0u);
  }

  Bits
  signExtend(const Bits& x, unsigned width)
  {
    if (width == 128 or not topBit(x, width))
      return x;
    return x | ~widthMask(width);
  }

  [[noreturn]] void
  throwInexact()
  {
    throw ArithException(ArithException::Inexact, "integer conversion loses information");
  }


  /// Apply the given rule to the pattern of x. Check the exactness
  /// predicates of the rule if check is true.
  IntValue
  applyRule(const ConversionRule& rule, const IntValue& x, IntKind to, bool check)
  {
    using Rule = ConversionRule;

    unsigned fromWidth = x.width(), toWidth = kindWidth(to);
    Bits bits(x.high(), x.low());
    Bits result = bits;

    if (check and rule.has(Rule::TopBit) and topBit(bits, fromWidth))
      throwInexact();

    switch (rule.direction)
      {
      case Rule::Direction::Same:
        break;

      case Rule::Direction::Widen:
        if (rule.extension == Rule::Extension::Sign)
          result = signExtend(bits, fromWidth) & widthMask(toWidth);
        break;

      case Rule::Direction::Narrow:
        result = bits & widthMask(toWidth);
        if (check and rule.has(Rule::TruncSigned) and
            (signExtend(result, toWidth) & widthMask(fromWidth)) != bits)
          throwInexact();
        if (check and rule.has(Rule::TruncUnsigned) and result != bits)
          throwInexact();
        break;
      }

    return IntValue::fromBits(to, result.high(), result.low());
  }
}


const ConversionRule&
FixInt::conversionRule(IntKind from, IntKind to)
{
  return conversionTable.at(kindIndex(from)).at(kindIndex(to));
}


IntValue
FixInt::convertTo(const IntValue& x, IntKind to)
{
  return applyRule(conversionRule(x.kind(), to), x, to, true);
}


IntValue
FixInt::truncateTo(const IntValue& x, IntKind to)
{
  return applyRule(conversionRule(x.kind(), to), x, to, false);
}


IntValue
FixInt::reinterpretAs(const IntValue& x, IntKind to)
{
  if (x.width() != kindWidth(to))
    throw std::invalid_argument(std::string("Cannot reinterpret ") + kindName(x.kind()) +
                                " as " + kindName(to) + ": widths differ");
  return IntValue::fromBits(to, x.high(), x.low());
}


IntValue
FixInt::toSigned(const IntValue& x)
{
  return reinterpretAs(x, signedKind(x.kind()));
}


IntValue
FixInt::toUnsigned(const IntValue& x)
{
  return reinterpretAs(x, unsignedKind(x.kind()));
}


IntValue
FixInt::fromDouble(double x, IntKind to)
{
  if (not std::isfinite(x) or std::trunc(x) != x)
    throwInexact();

  // Exclusive bounds: a value is in range if lower < x < upper.
  unsigned width = kindWidth(to);
  double lower = -1, upper = std::ldexp(1.0, int(width));
  if (kindIsSigned(to))
    {
      upper = std::ldexp(1.0, int(width - 1));
      lower = -upper - 1;
    }
  if (not (x > lower and x < upper))
    {
      // The signed minimum is exactly representable and lower is not
      // distinguishable from it for wide kinds.
      if (not (kindIsSigned(to) and x == -std::ldexp(1.0, int(width - 1))))
        throwInexact();
    }

  // X is an integer so the magnitude splits exactly into 64-bit limbs.
  double mag = std::fabs(x);
  double two64 = std::ldexp(1.0, 64);
  double high = std::floor(mag / two64);
  double low = mag - high*two64;

  Bits bits(static_cast<uint64_t>(high), static_cast<uint64_t>(low));
  if (x < 0)
    bits = Bits(0u) - bits;
  bits &= widthMask(width);
  return IntValue::fromBits(to, bits.high(), bits.low());
}


IntValue
FixInt::fromFloat(float x, IntKind to)
{
  return fromDouble(static_cast<double>(x), to);
}


double
FixInt::toDouble(const IntValue& x)
{
  if (x.width() == 128)
    return x.toBig().convert_to<double>();
  if (x.isSigned())
    return static_cast<double>(truncateTo(x, IntKind::Int64).get<int64_t>());
  return static_cast<double>(x.low());
}
