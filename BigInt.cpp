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

#include <cctype>
#include <stdexcept>
#include "BigInt.hpp"


using namespace FixInt;


static const BigInt&
twoTo128()
{
  static const BigInt value = BigInt(1) << 128;
  return value;
}


BigInt
FixInt::bigFromLimbs(uint64_t high, uint64_t low, bool isSigned)
{
  BigInt x = high;
  x <<= 64;
  x |= low;
  if (isSigned and (high >> 63) != 0)
    x -= twoTo128();
  return x;
}


bool
FixInt::bigToLimbs(const BigInt& x, bool isSigned, uint64_t& high, uint64_t& low)
{
  static const BigInt twoTo127 = BigInt(1) << 127;

  BigInt lo = isSigned ? BigInt(-twoTo127) : BigInt(0);
  BigInt hi = isSigned ? twoTo127 : twoTo128();
  if (x < lo or x >= hi)
    return false;

  BigInt bits = x;
  if (bits < 0)
    bits += twoTo128();

  static const BigInt mask64 = (BigInt(1) << 64) - 1;
  BigInt lowBits = bits & mask64;
  BigInt highBits = bits >> 64;
  low = lowBits.convert_to<uint64_t>();
  high = highBits.convert_to<uint64_t>();
  return true;
}


BigInt
FixInt::bigFloorMod(const BigInt& x, const BigInt& y)
{
  BigInt r = x % y;
  if (r != 0 and ((r < 0) != (y < 0)))
    r += y;
  return r;
}


bool
FixInt::parseBigInt(const std::string& text, BigInt& value)
{
  std::string str = text;

  // cpp_int accepts a leading minus but not a leading plus.
  if (not str.empty() and str.front() == '+')
    {
      str.erase(0, 1);
      if (not str.empty() and (str.front() == '-' or str.front() == '+'))
	return false;
    }

  if (str.empty() or str == "-")
    return false;

  size_t digits = str.front() == '-' ? 1 : 0;
  if (str.size() > digits + 1 and str.at(digits) == '0' and
      std::tolower(str.at(digits + 1)) == 'x')
    digits += 2;

  // Reject stray characters (whitespace, embedded signs) that the
  // cpp_int parser would otherwise ignore or misread.
  if (digits == str.size())
    return false;
  bool hex = digits >= 2 and std::tolower(str.at(digits - 1)) == 'x';
  for (size_t i = digits; i < str.size(); ++i)
    {
      unsigned char c = str.at(i);
      if (hex ? not std::isxdigit(c) : not std::isdigit(c))
	return false;
    }

  // A leading zero selects octal in cpp_int; strip it for decimal.
  if (not hex)
    {
      size_t first = str.front() == '-' ? 1 : 0;
      size_t nz = str.find_first_not_of('0', first);
      if (nz == std::string::npos)
	str = "0";
      else if (nz > first)
	str.erase(first, nz - first);
    }

  try
    {
      value = BigInt(str);
    }
  catch (std::exception&)
    {
      return false;
    }

  return true;
}
