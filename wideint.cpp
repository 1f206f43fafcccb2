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

#include "wideint.hpp"
#include "BigInt.hpp"
#include "ArithException.hpp"


using namespace FixInt;


// The emulated 128-bit division promotes both operands to arbitrary
// precision, divides there and converts the result back. For
// representable operands the result is representable except for
// signed minimum divided by -1.


namespace
{
  template <typename WIDE>
  BigInt
  toBig(const WIDE& x, bool isSigned)
  {
    return bigFromLimbs(static_cast<uint64_t>(x.high()), x.low(), isSigned);
  }


  UwideInt
  fromBig(const BigInt& x, bool isSigned)
  {
    uint64_t high = 0, low = 0;
    if (not bigToLimbs(x, isSigned, high, low))
      throw ArithException(ArithException::Overflow,
			   "128-bit division result not representable");
    return UwideInt(high, low);
  }


  template <typename WIDE>
  void
  checkDivisor(const WIDE& x)
  {
    if (x == WIDE(0u))
      throw ArithException(ArithException::DivideByZero,
			   "integer division by zero");
  }
}


UwideInt&
UwideInt::operator /= (const UwideInt& x)
{
  checkDivisor(x);
  *this = fromBig(toBig(*this, false) / toBig(x, false), false);
  return *this;
}


UwideInt&
UwideInt::operator %= (const UwideInt& x)
{
  checkDivisor(x);
  *this = fromBig(toBig(*this, false) % toBig(x, false), false);
  return *this;
}


WideInt&
WideInt::operator /= (const WideInt& x)
{
  checkDivisor(x);
  *this = WideInt(fromBig(toBig(*this, true) / toBig(x, true), true));
  return *this;
}


WideInt&
WideInt::operator %= (const WideInt& x)
{
  checkDivisor(x);
  *this = WideInt(fromBig(toBig(*this, true) % toBig(x, true), true));
  return *this;
}


WideInt
WideInt::floorMod(const WideInt& x) const
{
  checkDivisor(x);
  return WideInt(fromBig(bigFloorMod(toBig(*this, true), toBig(x, true)), true));
}
