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

#include "IntOps.hpp"

namespace FixInt
{

/// Function operator to compute the modular sum of a and b.
struct MyAdd
{
  template <typename T>
  constexpr T operator() (const T& a, const T& b) const
  { return wrapAdd(a, b); }
};


struct MySub
{
  template <typename T>
  constexpr T operator() (const T& a, const T& b) const
  { return wrapSub(a, b); }
};


struct MyMul
{
  template <typename T>
  constexpr T operator() (const T& a, const T& b) const
  { return wrapMul(a, b); }
};


struct MyBitAnd
{
  template <typename T>
  constexpr T operator() (const T& a, const T& b) const
  { return bitAnd(a, b); }
};


struct MyBitOr
{
  template <typename T>
  constexpr T operator() (const T& a, const T& b) const
  { return bitOr(a, b); }
};


struct MyBitXor
{
  template <typename T>
  constexpr T operator() (const T& a, const T& b) const
  { return bitXor(a, b); }
};


/// Function operator to shift a left by n bits. A count of the full
/// width or more yields zero.
struct MyShl
{
  template <typename T>
  constexpr T operator() (const T& a, uint64_t n) const
  { return shiftLeft(a, n); }
};


/// Shift right: arithmetic for signed, logical for unsigned.
struct MyShr
{
  template <typename T>
  constexpr T operator() (const T& a, uint64_t n) const
  { return shiftRight(a, n); }
};


/// Logical shift right.
struct MyLshr
{
  template <typename T>
  constexpr T operator() (const T& a, uint64_t n) const
  { return shiftRightLogical(a, n); }
};


// Division family. The operands are either of the same type or a
// same-width signed/unsigned pair. The result type is the one of the
// selected overload.

struct MyDiv
{
  template <typename A, typename B>
  auto operator() (const A& a, const B& b) const
  { return divTrunc(a, b); }
};


struct MyRem
{
  template <typename A, typename B>
  auto operator() (const A& a, const B& b) const
  { return remTrunc(a, b); }
};


struct MyFld
{
  template <typename A, typename B>
  auto operator() (const A& a, const B& b) const
  { return divFloor(a, b); }
};


struct MyMod
{
  template <typename A, typename B>
  auto operator() (const A& a, const B& b) const
  { return modFloor(a, b); }
};


struct MyCld
{
  template <typename A, typename B>
  auto operator() (const A& a, const B& b) const
  { return divCeil(a, b); }
};


// Checked operations: set res and return true on success, return
// false on overflow.

struct MyCheckedAdd
{
  template <typename T>
  bool operator() (const T& a, const T& b, T& res) const
  { return checkedAdd(a, b, res); }
};


struct MyCheckedSub
{
  template <typename T>
  bool operator() (const T& a, const T& b, T& res) const
  { return checkedSub(a, b, res); }
};


struct MyCheckedMul
{
  template <typename T>
  bool operator() (const T& a, const T& b, T& res) const
  { return checkedMul(a, b, res); }
};

}
