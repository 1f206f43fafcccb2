#include <gtest/gtest.h>

#include <initializer_list>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

#include "ArithException.hpp"
#include "ArithConfig.hpp"
#include "Args.hpp"
#include "Session.hpp"

namespace FixInt {
namespace {

class SessionTest : public ::testing::Test {
 protected:
  // Parse the given command line (program name excluded) into args_.
  bool Parse(std::initializer_list<const char*> words) {
    std::vector<std::string> argv = {"fixint"};
    for (const char* word : words) {
      argv.emplace_back(word);
    }
    args_ = Args();
    return args_.parseCmdLineArgs(argv);
  }

  // Parse the given command line, configure a session and evaluate.
  std::string Eval(std::initializer_list<const char*> words) {
    EXPECT_TRUE(Parse(words));
    EXPECT_TRUE(session_.configure(args_, config_));
    return session_.evaluate(args_);
  }

  Args args_;
  ArithConfig config_;
  Session session_;
};

// =============================================================================
// Command Line Tests
// =============================================================================

TEST_F(SessionTest, ParseArguments) {
  ASSERT_TRUE(Parse({"--op", "Checked_Add", "--type", "uint8", "--wordsize", "32", "200", "55"}));
  EXPECT_EQ(args_.op, "checked_add");
  ASSERT_TRUE(args_.kind.has_value());
  EXPECT_EQ(*args_.kind, IntKind::UInt8);
  EXPECT_FALSE(args_.kind2.has_value());
  ASSERT_TRUE(args_.wordSize.has_value());
  EXPECT_EQ(*args_.wordSize, 32u);
  ASSERT_EQ(args_.operands.size(), 2u);
  EXPECT_EQ(args_.operands.at(0), "200");
  EXPECT_EQ(args_.operands.at(1), "55");
}

TEST_F(SessionTest, NegativeOperandsFollowSeparator) {
  ASSERT_TRUE(Parse({"--op", "fld", "--type", "Int8", "--", "-7", "2"}));
  ASSERT_EQ(args_.operands.size(), 2u);
  EXPECT_EQ(args_.operands.at(0), "-7");
}

TEST_F(SessionTest, ParseErrors) {
  EXPECT_FALSE(Parse({"--type", "Int8", "1", "2"}));
  EXPECT_FALSE(Parse({"--op", "add", "1", "2"}));
  EXPECT_FALSE(Parse({"--op", "add", "--type", "Int9", "1", "2"}));
  EXPECT_FALSE(Parse({"--op", "add", "--type", "Int8", "--wordsize", "16", "1", "2"}));
  EXPECT_FALSE(Parse({"--op", "add", "--type", "Int8", "--bogus"}));
}

TEST_F(SessionTest, TypeNamesIgnoreCase) {
  IntKind kind = IntKind::Int8;
  EXPECT_TRUE(Args::parseTypeName("type", "UINT128", kind));
  EXPECT_EQ(kind, IntKind::UInt128);
  EXPECT_FALSE(Args::parseTypeName("type", "UInt256", kind));
  EXPECT_EQ(kind, IntKind::UInt128);
}

TEST_F(SessionTest, OperationNames) {
  OpCode op = OpCode::Add;
  EXPECT_TRUE(Session::parseOpName("trailing_ones", op));
  EXPECT_EQ(op, OpCode::TrailingOnes);
  EXPECT_FALSE(Session::parseOpName("frobnicate", op));

  for (unsigned i = 0; i <= unsigned(OpCode::Typemax); ++i) {
    auto code = static_cast<OpCode>(i);
    OpCode parsed = OpCode::Add;
    EXPECT_TRUE(Session::parseOpName(Session::opName(code), parsed));
    EXPECT_EQ(parsed, code);
  }
}

// =============================================================================
// Configuration Tests
// =============================================================================

TEST_F(SessionTest, WordSizePriority) {
  ASSERT_TRUE(Parse({"--op", "add", "--type", "Int8", "1", "2"}));
  EXPECT_EQ(Session::determineWordSize(args_, config_), hostWordSize());

  config_.setWordSize(32);
  EXPECT_EQ(Session::determineWordSize(args_, config_), 32u);

  ASSERT_TRUE(Parse({"--op", "add", "--type", "Int8", "--wordsize", "64", "1", "2"}));
  EXPECT_EQ(Session::determineWordSize(args_, config_), 64u);

  EXPECT_TRUE(session_.configure(args_, config_));
  EXPECT_EQ(session_.arith().wordSize(), 64u);
}

TEST_F(SessionTest, ConfigureRejectsBadConfig) {
  ASSERT_TRUE(config_.loadConfigString(R"({ "word_size" : 48 })"));
  ASSERT_TRUE(Parse({"--op", "add", "--type", "Int8", "1", "2"}));
  EXPECT_FALSE(session_.configure(args_, config_));
}

// =============================================================================
// Evaluation Tests
// =============================================================================

TEST_F(SessionTest, DivisionFamily) {
  EXPECT_EQ(Eval({"--op", "fld", "--type", "Int8", "--", "-7", "2"}), "-4::Int8");
  EXPECT_EQ(Eval({"--op", "mod", "--type", "Int8", "--", "-7", "2"}), "1::Int8");
  EXPECT_EQ(Eval({"--op", "cld", "--type", "Int8", "--", "-7", "2"}), "-3::Int8");
  EXPECT_EQ(Eval({"--op", "div", "--type", "Int8", "--", "-7", "2"}), "-3::Int8");
  EXPECT_EQ(Eval({"--op", "rem", "--type", "Int8", "--", "-7", "2"}), "-1::Int8");
}

TEST_F(SessionTest, MixedTypesFollowWordSize) {
  EXPECT_EQ(Eval({"--op", "add", "--type", "Int8", "--type2", "UInt32", "--wordsize", "64",
                  "--", "-1", "1"}),
            "0::Int64");
  EXPECT_EQ(Eval({"--op", "add", "--type", "Int8", "--type2", "UInt32", "--wordsize", "32",
                  "--", "-1", "1"}),
            "0::UInt32");
  EXPECT_EQ(Eval({"--op", "promote", "--type", "Int8", "--type2", "UInt64", "--", "-1", "5"}),
            "18446744073709551615::UInt64 5::UInt64");
}

TEST_F(SessionTest, CheckedOperations) {
  EXPECT_EQ(Eval({"--op", "checked_mul", "--type", "Int8", "63", "2"}), "126::Int8");
  EXPECT_EQ(Eval({"--op", "checked_add", "--type", "UInt8", "200", "55"}), "255::UInt8");
  EXPECT_EQ(Eval({"--op", "checked_add", "--type", "Int16", "1", "2", "3", "4"}), "10::Int16");
  EXPECT_THROW(Eval({"--op", "checked_add", "--type", "UInt8", "200", "100"}), ArithException);
  EXPECT_THROW(Eval({"--op", "checked_neg", "--type", "Int8", "--", "-128"}), ArithException);
}

TEST_F(SessionTest, UnaryAndCounts) {
  EXPECT_EQ(Eval({"--op", "neg", "--type", "Int8", "--", "-128"}), "-128::Int8");
  EXPECT_EQ(Eval({"--op", "not", "--type", "UInt16", "0"}), "65535::UInt16");
  EXPECT_EQ(Eval({"--op", "bswap", "--type", "UInt32", "0x12345678"}), "2018915346::UInt32");
  EXPECT_EQ(Eval({"--op", "count_ones", "--type", "Int64", "--", "-1"}), "64");
  EXPECT_EQ(Eval({"--op", "leading_zeros", "--type", "UInt128", "1"}), "127");
  EXPECT_EQ(Eval({"--op", "widen", "--type", "UInt64", "7"}), "7::UInt128");
}

TEST_F(SessionTest, Shifts) {
  EXPECT_EQ(Eval({"--op", "shl", "--type", "UInt8", "1", "7"}), "128::UInt8");
  EXPECT_EQ(Eval({"--op", "shr", "--type", "Int8", "--", "-128", "3"}), "-16::Int8");
  EXPECT_EQ(Eval({"--op", "lshr", "--type", "Int8", "--", "-128", "3"}), "16::Int8");
  EXPECT_EQ(Eval({"--op", "shl", "--type", "UInt8", "1", "8"}), "0::UInt8");
}

TEST_F(SessionTest, Conversions) {
  EXPECT_EQ(Eval({"--op", "convert", "--type", "Int16", "--type2", "UInt8", "255"}),
            "255::UInt8");
  EXPECT_EQ(Eval({"--op", "truncate", "--type", "Int16", "--type2", "UInt8", "300"}),
            "44::UInt8");
  EXPECT_EQ(Eval({"--op", "reinterpret", "--type", "Int8", "--type2", "UInt8", "--", "-1"}),
            "255::UInt8");
  EXPECT_THROW(Eval({"--op", "convert", "--type", "Int16", "--type2", "UInt8", "256"}),
               ArithException);
  EXPECT_THROW(Eval({"--op", "convert", "--type", "Int16", "1"}), std::invalid_argument);
}

TEST_F(SessionTest, ComparisonsAndLimits) {
  EXPECT_EQ(Eval({"--op", "lt", "--type", "Int8", "--type2", "UInt64", "--", "-1", "0"}), "true");
  EXPECT_EQ(Eval({"--op", "eq", "--type", "Int8", "--type2", "UInt8", "--", "-1", "255"}),
            "false");
  EXPECT_EQ(Eval({"--op", "le", "--type", "UInt8", "3", "3"}), "true");
  EXPECT_EQ(Eval({"--op", "typemin", "--type", "Int128"}),
            "-170141183460469231731687303715884105728::Int128");
  EXPECT_EQ(Eval({"--op", "typemax", "--type", "UInt16"}), "65535::UInt16");
  EXPECT_EQ(Eval({"--op", "widemul", "--type", "UInt64", "0xffffffffffffffff", "2"}),
            "36893488147419103230::UInt128");
}

TEST_F(SessionTest, UsageErrors) {
  EXPECT_THROW(Eval({"--op", "frobnicate", "--type", "Int8", "1"}), std::invalid_argument);
  EXPECT_THROW(Eval({"--op", "add", "--type", "Int8", "1"}), std::invalid_argument);
  EXPECT_THROW(Eval({"--op", "neg", "--type", "Int8", "1", "2"}), std::invalid_argument);
  EXPECT_THROW(Eval({"--op", "add", "--type", "Int8", "1", "x"}), std::invalid_argument);
  EXPECT_THROW(Eval({"--op", "typemax", "--type", "Int8", "1"}), std::invalid_argument);
}

TEST_F(SessionTest, RunReportsErrors) {
  ASSERT_TRUE(Parse({"--op", "div", "--type", "Int32", "1", "0"}));
  ASSERT_TRUE(session_.configure(args_, config_));
  std::ostringstream out;
  EXPECT_FALSE(session_.run(args_, out));
  EXPECT_TRUE(out.str().empty());

  ASSERT_TRUE(Parse({"--op", "mul", "--type", "Int32", "6", "7"}));
  EXPECT_TRUE(session_.run(args_, out));
  EXPECT_EQ(out.str(), "42::Int32\n");
}

}  // namespace
}  // namespace FixInt
