#include <gtest/gtest.h>

#include <cmath>
#include <limits>
#include <stdexcept>

#include "ArithException.hpp"
#include "IntConvert.hpp"

namespace FixInt {
namespace {

class IntConvertTest : public ::testing::Test {};

using Rule = ConversionRule;

IntValue Lit(IntKind kind, const char* text) {
  return IntValue::fromLiteral(kind, text);
}

void ExpectInexact(const IntValue& x, IntKind to) {
  try {
    convertTo(x, to);
    FAIL() << "expected Inexact converting " << x << " to " << kindName(to);
  } catch (const ArithException& e) {
    EXPECT_EQ(e.type(), ArithException::Inexact);
  }
}

// =============================================================================
// Rule Table Tests
// =============================================================================

TEST_F(IntConvertTest, RuleDirections) {
  const Rule& same = conversionRule(IntKind::Int32, IntKind::UInt32);
  EXPECT_EQ(same.direction, Rule::Direction::Same);
  EXPECT_EQ(same.extension, Rule::Extension::None);
  EXPECT_TRUE(same.has(Rule::TopBit));

  const Rule& identity = conversionRule(IntKind::UInt16, IntKind::UInt16);
  EXPECT_EQ(identity.direction, Rule::Direction::Same);
  EXPECT_EQ(identity.checks, Rule::NoCheck);

  const Rule& widenSigned = conversionRule(IntKind::Int8, IntKind::Int64);
  EXPECT_EQ(widenSigned.direction, Rule::Direction::Widen);
  EXPECT_EQ(widenSigned.extension, Rule::Extension::Sign);
  EXPECT_EQ(widenSigned.checks, Rule::NoCheck);

  const Rule& widenToUnsigned = conversionRule(IntKind::Int8, IntKind::UInt64);
  EXPECT_EQ(widenToUnsigned.extension, Rule::Extension::Sign);
  EXPECT_TRUE(widenToUnsigned.has(Rule::TopBit));

  const Rule& widenUnsigned = conversionRule(IntKind::UInt8, IntKind::Int16);
  EXPECT_EQ(widenUnsigned.extension, Rule::Extension::Zero);
  EXPECT_EQ(widenUnsigned.checks, Rule::NoCheck);
}

TEST_F(IntConvertTest, NarrowingChecks) {
  EXPECT_EQ(conversionRule(IntKind::Int64, IntKind::Int8).checks, Rule::TruncSigned);
  EXPECT_EQ(conversionRule(IntKind::Int64, IntKind::UInt8).checks, Rule::TruncUnsigned);
  EXPECT_EQ(conversionRule(IntKind::UInt64, IntKind::UInt8).checks, Rule::TruncUnsigned);

  const Rule& rule = conversionRule(IntKind::UInt64, IntKind::Int8);
  EXPECT_EQ(rule.direction, Rule::Direction::Narrow);
  EXPECT_TRUE(rule.has(Rule::TruncSigned));
  EXPECT_TRUE(rule.has(Rule::TopBit));
}

TEST_F(IntConvertTest, TableIsComputedAtCompileTime) {
  constexpr ConversionTable table = makeConversionTable();
  static_assert(table[kindIndex(IntKind::Int16)][kindIndex(IntKind::Int128)].direction ==
                Rule::Direction::Widen);
  for (unsigned i = 0; i < intKindCount; ++i) {
    for (unsigned j = 0; j < intKindCount; ++j) {
      auto from = static_cast<IntKind>(i), to = static_cast<IntKind>(j);
      EXPECT_EQ(conversionRule(from, to).checks, table[i][j].checks);
      EXPECT_EQ(conversionRule(from, to).direction, table[i][j].direction);
    }
  }
}

// =============================================================================
// Checked Conversion Tests
// =============================================================================

TEST_F(IntConvertTest, ConvertExamples) {
  EXPECT_EQ(convertTo(Lit(IntKind::Int8, "-1"), IntKind::Int64), Lit(IntKind::Int64, "-1"));
  EXPECT_EQ(convertTo(Lit(IntKind::UInt8, "255"), IntKind::Int16), Lit(IntKind::Int16, "255"));
  EXPECT_EQ(convertTo(Lit(IntKind::Int64, "127"), IntKind::Int8), Lit(IntKind::Int8, "127"));
  EXPECT_EQ(convertTo(Lit(IntKind::Int64, "-128"), IntKind::Int8), Lit(IntKind::Int8, "-128"));

  ExpectInexact(Lit(IntKind::Int8, "-1"), IntKind::UInt64);
  ExpectInexact(Lit(IntKind::Int64, "128"), IntKind::Int8);
  ExpectInexact(Lit(IntKind::Int64, "-129"), IntKind::Int8);
  ExpectInexact(Lit(IntKind::UInt64, "256"), IntKind::UInt8);
  ExpectInexact(Lit(IntKind::UInt32, "2147483648"), IntKind::Int32);
  ExpectInexact(Lit(IntKind::UInt128, "0x80000000000000000000000000000000"), IntKind::Int128);
}

TEST_F(IntConvertTest, ConvertExhaustive8) {
  for (int v = -128; v <= 255; ++v) {
    IntKind from = v < 128 ? IntKind::Int8 : IntKind::UInt8;
    auto x = IntValue::fromBig(from, BigInt(v));
    for (IntKind to : {IntKind::Int8, IntKind::UInt8, IntKind::Int16, IntKind::UInt16}) {
      BigInt lo = IntValue::minOf(to).toBig(), hi = IntValue::maxOf(to).toBig();
      bool fits = BigInt(v) >= lo && BigInt(v) <= hi;
      if (fits) {
        EXPECT_EQ(convertTo(x, to).toBig(), BigInt(v));
        EXPECT_EQ(convertTo(x, to).kind(), to);
      } else {
        EXPECT_THROW(convertTo(x, to), ArithException) << v << " to " << kindName(to);
      }
    }
  }
}

TEST_F(IntConvertTest, ConvertBoundaries) {
  for (unsigned i = 0; i < intKindCount; ++i) {
    auto from = static_cast<IntKind>(i);
    for (unsigned j = 0; j < intKindCount; ++j) {
      auto to = static_cast<IntKind>(j);
      BigInt lo = IntValue::minOf(to).toBig(), hi = IntValue::maxOf(to).toBig();
      for (const IntValue& x : {IntValue::minOf(from), IntValue::maxOf(from),
                                IntValue::fromBig(from, 0)}) {
        BigInt v = x.toBig();
        if (v >= lo && v <= hi) {
          EXPECT_EQ(convertTo(x, to).toBig(), v);
        } else {
          EXPECT_THROW(convertTo(x, to), ArithException)
              << x << " to " << kindName(to);
        }
      }
    }
  }
}

TEST_F(IntConvertTest, WidenThenNarrowIsIdentity) {
  for (unsigned i = 0; i < intKindCount; ++i) {
    auto from = static_cast<IntKind>(i);
    for (unsigned j = 0; j < intKindCount; ++j) {
      auto to = static_cast<IntKind>(j);
      if (kindWidth(to) <= kindWidth(from) || kindIsSigned(to) != kindIsSigned(from)) {
        continue;
      }
      for (const IntValue& x : {IntValue::minOf(from), IntValue::maxOf(from)}) {
        EXPECT_EQ(convertTo(convertTo(x, to), from), x);
      }
    }
  }
}

// =============================================================================
// Modular Conversion Tests
// =============================================================================

TEST_F(IntConvertTest, TruncateIsModular) {
  EXPECT_EQ(truncateTo(Lit(IntKind::Int64, "300"), IntKind::UInt8), Lit(IntKind::UInt8, "44"));
  EXPECT_EQ(truncateTo(Lit(IntKind::Int64, "200"), IntKind::Int8), Lit(IntKind::Int8, "-56"));
  EXPECT_EQ(truncateTo(Lit(IntKind::Int8, "-1"), IntKind::UInt64),
            Lit(IntKind::UInt64, "18446744073709551615"));
  EXPECT_EQ(truncateTo(Lit(IntKind::Int8, "-1"), IntKind::UInt128),
            IntValue::maxOf(IntKind::UInt128));
  EXPECT_EQ(truncateTo(Lit(IntKind::UInt8, "255"), IntKind::Int8), Lit(IntKind::Int8, "-1"));
  EXPECT_EQ(truncateTo(Lit(IntKind::UInt8, "255"), IntKind::Int32), Lit(IntKind::Int32, "255"));
}

TEST_F(IntConvertTest, TruncateExhaustive16To8) {
  for (int v = -32768; v <= 32767; v += 7) {
    auto x = IntValue::fromBig(IntKind::Int16, BigInt(v));
    EXPECT_EQ(truncateTo(x, IntKind::UInt8).toBig(), BigInt(v & 0xff));
    int s = (v & 0xff) >= 128 ? (v & 0xff) - 256 : (v & 0xff);
    EXPECT_EQ(truncateTo(x, IntKind::Int8).toBig(), BigInt(s));
  }
}

TEST_F(IntConvertTest, Reinterpret) {
  EXPECT_EQ(reinterpretAs(Lit(IntKind::Int8, "-1"), IntKind::UInt8), Lit(IntKind::UInt8, "255"));
  EXPECT_EQ(toSigned(Lit(IntKind::UInt16, "65535")), Lit(IntKind::Int16, "-1"));
  EXPECT_EQ(toUnsigned(IntValue::minOf(IntKind::Int128)),
            Lit(IntKind::UInt128, "0x80000000000000000000000000000000"));
  EXPECT_THROW(reinterpretAs(Lit(IntKind::Int8, "1"), IntKind::UInt16), std::invalid_argument);
}

// =============================================================================
// Floating Point Conversion Tests
// =============================================================================

TEST_F(IntConvertTest, FromDouble) {
  EXPECT_EQ(fromDouble(3.0, IntKind::Int8), Lit(IntKind::Int8, "3"));
  EXPECT_EQ(fromDouble(-128.0, IntKind::Int8), Lit(IntKind::Int8, "-128"));
  EXPECT_EQ(fromDouble(255.0, IntKind::UInt8), Lit(IntKind::UInt8, "255"));
  EXPECT_EQ(fromDouble(-0.0, IntKind::UInt8), Lit(IntKind::UInt8, "0"));
  EXPECT_EQ(fromDouble(std::ldexp(1.0, 100), IntKind::UInt128),
            Lit(IntKind::UInt128, "1267650600228229401496703205376"));
  EXPECT_EQ(fromDouble(-std::ldexp(1.0, 63), IntKind::Int64), IntValue::minOf(IntKind::Int64));
  EXPECT_EQ(fromDouble(-std::ldexp(1.0, 127), IntKind::Int128),
            IntValue::minOf(IntKind::Int128));
  EXPECT_EQ(fromFloat(-42.0f, IntKind::Int32), Lit(IntKind::Int32, "-42"));
}

TEST_F(IntConvertTest, FromDoubleRejectsInexact) {
  EXPECT_THROW(fromDouble(3.5, IntKind::Int32), ArithException);
  EXPECT_THROW(fromDouble(128.0, IntKind::Int8), ArithException);
  EXPECT_THROW(fromDouble(-129.0, IntKind::Int8), ArithException);
  EXPECT_THROW(fromDouble(256.0, IntKind::UInt8), ArithException);
  EXPECT_THROW(fromDouble(-1.0, IntKind::UInt64), ArithException);
  EXPECT_THROW(fromDouble(std::ldexp(1.0, 63), IntKind::Int64), ArithException);
  EXPECT_THROW(fromDouble(std::ldexp(1.0, 64), IntKind::UInt64), ArithException);
  EXPECT_THROW(fromDouble(std::numeric_limits<double>::infinity(), IntKind::Int64),
               ArithException);
  EXPECT_THROW(fromDouble(std::numeric_limits<double>::quiet_NaN(), IntKind::UInt8),
               ArithException);
  EXPECT_THROW(fromFloat(0.5f, IntKind::Int8), ArithException);
}

TEST_F(IntConvertTest, ToDouble) {
  EXPECT_EQ(toDouble(Lit(IntKind::Int8, "-128")), -128.0);
  EXPECT_EQ(toDouble(Lit(IntKind::UInt64, "18446744073709551615")), std::ldexp(1.0, 64));
  EXPECT_EQ(toDouble(IntValue::minOf(IntKind::Int128)), -std::ldexp(1.0, 127));
  EXPECT_EQ(toDouble(Lit(IntKind::UInt128, "1267650600228229401496703205376")),
            std::ldexp(1.0, 100));
  EXPECT_EQ(toDouble(Lit(IntKind::Int32, "-7")), -7.0);
}

}  // namespace
}  // namespace FixInt
