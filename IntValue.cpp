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

#include <ostream>
#include "IntValue.hpp"
#include "IntOps.hpp"
#include "ArithException.hpp"


using namespace FixInt;


IntValue
IntValue::fromBits(IntKind kind, uint64_t high, uint64_t low)
{
  unsigned width = kindWidth(kind);
  if (width < 128)
    {
      high = 0;
      if (width < 64)
        low &= (uint64_t(1) << width) - 1;
    }
  return IntValue(kind, high, low);
}


IntValue
IntValue::fromBig(IntKind kind, const BigInt& x)
{
  if (x < minOf(kind).toBig() or x > maxOf(kind).toBig())
    throw ArithException(ArithException::Inexact, "value out of range of integer type");

  uint64_t high = 0, low = 0;
  if (not bigToLimbs(x, x < 0, high, low))
    throw ArithException(ArithException::Inexact, "value out of range of integer type");
  return fromBits(kind, high, low);
}


IntValue
IntValue::fromLiteral(IntKind kind, const std::string& text)
{
  BigInt x;
  if (not parseBigInt(text, x))
    throw std::invalid_argument("Invalid integer literal: " + text);
  return fromBig(kind, x);
}


IntValue
IntValue::minOf(IntKind kind)
{
  return dispatchKind(kind, [](auto tag) {
    using T = typename decltype(tag)::type;
    return IntValue::from(typemin<T>());
  });
}


IntValue
IntValue::maxOf(IntKind kind)
{
  return dispatchKind(kind, [](auto tag) {
    using T = typename decltype(tag)::type;
    return IntValue::from(typemax<T>());
  });
}


bool
IntValue::isNegative() const
{
  if (not isSigned())
    return false;
  unsigned width = this->width();
  if (width == 128)
    return (high_ >> 63) != 0;
  return ((low_ >> (width - 1)) & 1) != 0;
}


BigInt
IntValue::toBig() const
{
  unsigned width = this->width();
  if (width == 128)
    return bigFromLimbs(high_, low_, isSigned());

  BigInt x = low_;
  if (isNegative())
    x -= BigInt(1) << width;
  return x;
}


std::string
IntValue::toString() const
{
  return toBig().str();
}


std::ostream&
FixInt::operator << (std::ostream& out, const IntValue& value)
{
  out << value.toString() << "::" << kindName(value.kind());
  return out;
}
