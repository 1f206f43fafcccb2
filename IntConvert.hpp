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

#include <array>
#include <cstdint>
#include "IntType.hpp"
#include "IntValue.hpp"


namespace FixInt
{

  /// Conversion between two kinds: how the bit pattern changes and
  /// which predicates must hold for the conversion to be exact.
  struct ConversionRule
  {
    enum class Direction : uint8_t { Same, Widen, Narrow };

    enum class Extension : uint8_t { None, Sign, Zero };

    /// Check flags.
    enum Check : uint8_t
      {
        NoCheck        = 0,
        TopBit         = 1,   // Source top bit must be clear.
        TruncSigned    = 2,   // Truncated value sign-extended back equals source.
        TruncUnsigned  = 4    // Truncated value zero-extended back equals source.
      };

    Direction direction = Direction::Same;
    Extension extension = Extension::None;
    uint8_t checks = NoCheck;

    bool has(Check check) const
    { return (checks & check) != 0; }
  };


  /// Return the rule of a conversion between the given kinds.
  constexpr ConversionRule
  makeConversionRule(IntKind from, IntKind to)
  {
    using Rule = ConversionRule;

    Rule rule;
    unsigned fromWidth = kindWidth(from), toWidth = kindWidth(to);
    bool fromSigned = kindIsSigned(from), toSigned = kindIsSigned(to);

    if (fromWidth == toWidth)
      {
        rule.direction = Rule::Direction::Same;
        if (fromSigned != toSigned)
          rule.checks = Rule::TopBit;
      }
    else if (fromWidth < toWidth)
      {
        rule.direction = Rule::Direction::Widen;
        rule.extension = fromSigned ? Rule::Extension::Sign : Rule::Extension::Zero;
        if (fromSigned and not toSigned)
          rule.checks = Rule::TopBit;
      }
    else
      {
        rule.direction = Rule::Direction::Narrow;
        if (toSigned)
          rule.checks = fromSigned ? Rule::TruncSigned : uint8_t(Rule::TruncSigned | Rule::TopBit);
        else
          rule.checks = Rule::TruncUnsigned;
      }
    return rule;
  }


  using ConversionTable = std::array<std::array<ConversionRule, intKindCount>, intKindCount>;

  /// The rules of all kind pairs indexed by source then destination
  /// kind index.
  constexpr ConversionTable
  makeConversionTable()
  {
    ConversionTable table{};
    for (unsigned i = 0; i < intKindCount; ++i)
      for (unsigned j = 0; j < intKindCount; ++j)
        table[i][j] = makeConversionRule(static_cast<IntKind>(i), static_cast<IntKind>(j));
    return table;
  }

  /// Return the rule of a conversion between the given kinds.
  const ConversionRule& conversionRule(IntKind from, IntKind to);

  /// Return x converted to the given kind. Throw ArithException
  /// (Inexact) if the value of x is not representable in that kind.
  IntValue convertTo(const IntValue& x, IntKind to);

  /// Return x converted to the given kind modulo 2 to the power of the
  /// width of the kind: truncate when narrowing, sign/zero extend
  /// when widening, reinterpret at equal width. Never fails.
  IntValue truncateTo(const IntValue& x, IntKind to);

  /// Return the bits of x as the given kind. Throw
  /// std::invalid_argument if the widths differ.
  IntValue reinterpretAs(const IntValue& x, IntKind to);

  /// Reinterpret x as the signed kind of the same width.
  IntValue toSigned(const IntValue& x);

  /// Reinterpret x as the unsigned kind of the same width.
  IntValue toUnsigned(const IntValue& x);

  /// Return the value of the given kind equal to x. Throw
  /// ArithException (Inexact) if x is not finite, is not an integer
  /// or is out of range.
  IntValue fromDouble(double x, IntKind to);

  /// Float version of fromDouble.
  IntValue fromFloat(float x, IntKind to);

  /// Return the double nearest to the value of x.
  double toDouble(const IntValue& x);
}
