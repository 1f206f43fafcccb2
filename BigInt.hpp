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
#include <string>
#include <boost/multiprecision/cpp_int.hpp>


namespace FixInt
{
  /// Arbitrary precision integer. Used for 128-bit division when the
  /// 128-bit types are emulated, for literal parsing and for decimal
  /// printing.
  using BigInt = boost::multiprecision::cpp_int;

  /// Return the integer whose 128-bit pattern is the given pair of
  /// limbs. If isSigned is true the pattern is interpreted as 2's
  /// complement.
  BigInt bigFromLimbs(uint64_t high, uint64_t low, bool isSigned);

  /// Set high/low to the 128-bit pattern of the given integer. Return
  /// true on success and false if x is outside the range of a signed
  /// (isSigned true) or unsigned 128-bit integer in which case
  /// high/low are left unmodified.
  bool bigToLimbs(const BigInt& x, bool isSigned, uint64_t& high, uint64_t& low);

  /// Return the floor modulo of x by y (result has the sign of y). Y
  /// must not be zero.
  BigInt bigFloorMod(const BigInt& x, const BigInt& y);

  /// Parse a decimal or hexadecimal (0x prefix) integer literal with
  /// an optional leading sign. Return true on success and false if the
  /// text is not an integer.
  bool parseBigInt(const std::string& text, BigInt& value);
}
