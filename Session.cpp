// Copyright 2024 Tenstorrent Corporation or its affiliates.
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


#include <iostream>
#include <stdexcept>
#include <boost/bimap.hpp>
#include <boost/assign.hpp>

#include "Session.hpp"
#include "IntConvert.hpp"
#include "ArithException.hpp"


using namespace FixInt;

typedef boost::bimap<std::string, OpCode> StringOpCode;
static const StringOpCode opTable = boost::assign::list_of< StringOpCode::relation >
  ( "add",             OpCode::Add)
  ( "sub",             OpCode::Sub)
  ( "mul",             OpCode::Mul)
  ( "neg",             OpCode::Neg)
  ( "abs",             OpCode::Abs)
  ( "div",             OpCode::Div)
  ( "rem",             OpCode::Rem)
  ( "fld",             OpCode::Fld)
  ( "mod",             OpCode::Mod)
  ( "cld",             OpCode::Cld)
  ( "checked_add",     OpCode::CheckedAdd)
  ( "checked_sub",     OpCode::CheckedSub)
  ( "checked_mul",     OpCode::CheckedMul)
  ( "checked_neg",     OpCode::CheckedNeg)
  ( "checked_abs",     OpCode::CheckedAbs)
  ( "checked_div",     OpCode::CheckedDiv)
  ( "checked_rem",     OpCode::CheckedRem)
  ( "checked_fld",     OpCode::CheckedFld)
  ( "checked_mod",     OpCode::CheckedMod)
  ( "checked_cld",     OpCode::CheckedCld)
  ( "and",             OpCode::And)
  ( "or",              OpCode::Or)
  ( "xor",             OpCode::Xor)
  ( "not",             OpCode::Not)
  ( "shl",             OpCode::Shl)
  ( "shr",             OpCode::Shr)
  ( "lshr",            OpCode::Lshr)
  ( "bswap",           OpCode::Bswap)
  ( "count_ones",      OpCode::CountOnes)
  ( "count_zeros",     OpCode::CountZeros)
  ( "leading_zeros",   OpCode::LeadingZeros)
  ( "leading_ones",    OpCode::LeadingOnes)
  ( "trailing_zeros",  OpCode::TrailingZeros)
  ( "trailing_ones",   OpCode::TrailingOnes)
  ( "convert",         OpCode::Convert)
  ( "truncate",        OpCode::Truncate)
  ( "reinterpret",     OpCode::Reinterpret)
  ( "promote",         OpCode::Promote)
  ( "widen",           OpCode::Widen)
  ( "widemul",         OpCode::Widemul)
  ( "eq",              OpCode::Eq)
  ( "lt",              OpCode::Lt)
  ( "le",              OpCode::Le)
  ( "typemin",         OpCode::Typemin)
  ( "typemax",         OpCode::Typemax);


namespace
{
  std::string
  valueText(const IntValue& x)
  {
    return x.toString() + "::" + kindName(x.kind());
  }

  std::string
  boolText(bool flag)
  {
    return flag ? "true" : "false";
  }
}


Session::Session()
{
}


bool
Session::parseOpName(const std::string& name, OpCode& op)
{
  auto it = opTable.left.find(name);
  if (it == opTable.left.end())
    return false;
  op = it->second;
  return true;
}


std::string
Session::opName(OpCode op)
{
  auto it = opTable.right.find(op);
  if (it == opTable.right.end())
    return "?";
  return it->second;
}


unsigned
Session::determineWordSize(const Args& args, const ArithConfig& config)
{
  // 1. If command line specifies word size, go with that.
  if (args.wordSize)
    {
      if (args.verbose)
        std::cerr << "Setting word size from command line: " << *args.wordSize << "\n";
      return *args.wordSize;
    }

  // 2. If config file has word_size tag, go with that.
  unsigned size = 64;
  if (config.getWordSize(size))
    {
      if (args.verbose)
	std::cerr << "Setting word size from config file: " << size << "\n";
      return size;
    }

  // 3. Use the word size of the host.
  size = hostWordSize();
  if (args.verbose)
    std::cerr << "Using host word size: " << size << "\n";

  return size;
}


bool
Session::configure(const Args& args, const ArithConfig& config)
{
  unsigned wordSize = hostWordSize();
  bool verbose = args.verbose;
  if (not config.applyConfig(wordSize, verbose))
    return false;

  verbose_ = args.verbose or verbose;

  Args effective = args;
  effective.verbose = verbose_;
  arith_ = IntArith(determineWordSize(effective, config));

  if (verbose_)
    std::cerr << "128-bit integers: " << (hasNativeInt128() ? "native" : "emulated") << "\n";

  return true;
}


std::vector<IntValue>
Session::parseOperands(const Args& args, size_t minCount, size_t maxCount) const
{
  const auto& texts = args.operands;
  if (texts.size() < minCount or texts.size() > maxCount)
    {
      std::string expect = minCount == maxCount ? std::to_string(minCount) :
        std::to_string(minCount) + " or more";
      throw std::invalid_argument("Operation " + args.op + " expects " + expect +
                                  " operand(s), got " + std::to_string(texts.size()));
    }

  if (not args.kind)
    throw std::invalid_argument("Missing operand type");

  IntKind first = *args.kind;
  IntKind rest = args.kind2 ? *args.kind2 : first;

  std::vector<IntValue> values;
  for (size_t i = 0; i < texts.size(); ++i)
    values.push_back(IntValue::fromLiteral(i == 0 ? first : rest, texts.at(i)));
  return values;
}


uint64_t
Session::parseShiftCount(const Args& args) const
{
  if (args.operands.size() != 2)
    throw std::invalid_argument("Operation " + args.op + " expects 2 operands (value and count)");
  IntValue count = IntValue::fromLiteral(IntKind::UInt64, args.operands.at(1));
  return count.low();
}


IntKind
Session::destinationKind(const Args& args) const
{
  if (not args.kind2)
    throw std::invalid_argument("Operation " + args.op + " requires a destination type (--type2)");
  return *args.kind2;
}


void
Session::reportPromotion(const IntValue& x, const IntValue& y) const
{
  if (not verbose_)
    return;
  IntKind kind = arith_.resultKind(x.kind(), y.kind());
  std::cerr << "Promoting " << kindName(x.kind()) << " and " << kindName(y.kind())
            << " to " << kindName(kind) << " (word size " << arith_.wordSize() << ")\n";
}


std::string
Session::evaluate(const Args& args) const
{
  OpCode op = OpCode::Add;
  if (not parseOpName(args.op, op))
    throw std::invalid_argument("Unknown operation: " + args.op);

  const size_t many = ~size_t(0);
  const IntArith& ar = arith_;

  switch (op)
    {
    case OpCode::Typemin:
    case OpCode::Typemax:
      {
        parseOperands(args, 0, 0);
        IntKind kind = *args.kind;
        return valueText(op == OpCode::Typemin ? IntValue::minOf(kind) : IntValue::maxOf(kind));
      }

    case OpCode::Shl:
    case OpCode::Shr:
    case OpCode::Lshr:
      {
        if (not args.kind or args.operands.empty())
          throw std::invalid_argument("Operation " + args.op + " expects a value and a count");
        IntValue x = IntValue::fromLiteral(*args.kind, args.operands.at(0));
        uint64_t n = parseShiftCount(args);
        if (op == OpCode::Shl)
          return valueText(ar.shl(x, n));
        if (op == OpCode::Shr)
          return valueText(ar.shr(x, n));
        return valueText(ar.lshr(x, n));
      }

    case OpCode::Convert:
    case OpCode::Truncate:
    case OpCode::Reinterpret:
      {
        IntKind to = destinationKind(args);
        Args single = args;
        single.kind2.reset();
        IntValue x = parseOperands(single, 1, 1).at(0);
        if (op == OpCode::Convert)
          return valueText(convertTo(x, to));
        if (op == OpCode::Truncate)
          return valueText(truncateTo(x, to));
        return valueText(reinterpretAs(x, to));
      }

    case OpCode::CheckedAdd:
    case OpCode::CheckedMul:
      {
        auto xs = parseOperands(args, 2, many);
        if (xs.size() == 2)
          {
            reportPromotion(xs.at(0), xs.at(1));
            if (op == OpCode::CheckedAdd)
              return valueText(ar.checkedAdd(xs.at(0), xs.at(1)));
            return valueText(ar.checkedMul(xs.at(0), xs.at(1)));
          }
        if (op == OpCode::CheckedAdd)
          return valueText(ar.checkedAdd(xs));
        return valueText(ar.checkedMul(xs));
      }

    default:
      break;
    }

  // Unary operations.
  switch (op)
    {
    case OpCode::Neg:
    case OpCode::Abs:
    case OpCode::Not:
    case OpCode::Bswap:
    case OpCode::CheckedNeg:
    case OpCode::CheckedAbs:
    case OpCode::Widen:
    case OpCode::CountOnes:
    case OpCode::CountZeros:
    case OpCode::LeadingZeros:
    case OpCode::LeadingOnes:
    case OpCode::TrailingZeros:
    case OpCode::TrailingOnes:
      {
        IntValue x = parseOperands(args, 1, 1).at(0);
        switch (op)
          {
          case OpCode::Neg:           return valueText(ar.neg(x));
          case OpCode::Abs:           return valueText(ar.abs(x));
          case OpCode::Not:           return valueText(ar.bitNot(x));
          case OpCode::Bswap:         return valueText(ar.bswap(x));
          case OpCode::CheckedNeg:    return valueText(ar.checkedNeg(x));
          case OpCode::CheckedAbs:    return valueText(ar.checkedAbs(x));
          case OpCode::Widen:         return valueText(ar.widen(x));
          case OpCode::CountOnes:     return std::to_string(ar.countOnes(x));
          case OpCode::CountZeros:    return std::to_string(ar.countZeros(x));
          case OpCode::LeadingZeros:  return std::to_string(ar.leadingZeros(x));
          case OpCode::LeadingOnes:   return std::to_string(ar.leadingOnes(x));
          case OpCode::TrailingZeros: return std::to_string(ar.trailingZeros(x));
          default:                    return std::to_string(ar.trailingOnes(x));
          }
      }

    default:
      break;
    }

  // Binary operations.
  auto xs = parseOperands(args, 2, 2);
  const IntValue& x = xs.at(0);
  const IntValue& y = xs.at(1);
  reportPromotion(x, y);

  switch (op)
    {
    case OpCode::Add:         return valueText(ar.add(x, y));
    case OpCode::Sub:         return valueText(ar.sub(x, y));
    case OpCode::Mul:         return valueText(ar.mul(x, y));
    case OpCode::Div:         return valueText(ar.div(x, y));
    case OpCode::Rem:         return valueText(ar.rem(x, y));
    case OpCode::Fld:         return valueText(ar.fld(x, y));
    case OpCode::Mod:         return valueText(ar.mod(x, y));
    case OpCode::Cld:         return valueText(ar.cld(x, y));
    case OpCode::CheckedSub:  return valueText(ar.checkedSub(x, y));
    case OpCode::CheckedDiv:  return valueText(ar.checkedDiv(x, y));
    case OpCode::CheckedRem:  return valueText(ar.checkedRem(x, y));
    case OpCode::CheckedFld:  return valueText(ar.checkedFld(x, y));
    case OpCode::CheckedMod:  return valueText(ar.checkedMod(x, y));
    case OpCode::CheckedCld:  return valueText(ar.checkedCld(x, y));
    case OpCode::And:         return valueText(ar.bitAnd(x, y));
    case OpCode::Or:          return valueText(ar.bitOr(x, y));
    case OpCode::Xor:         return valueText(ar.bitXor(x, y));
    case OpCode::Widemul:     return valueText(ar.widemul(x, y));
    case OpCode::Eq:          return boolText(ar.isEqual(x, y));
    case OpCode::Lt:          return boolText(ar.isLess(x, y));
    case OpCode::Le:          return boolText(ar.isLessEqual(x, y));
    case OpCode::Promote:
      {
        auto [a, b] = ar.promote(x, y);
        return valueText(a) + " " + valueText(b);
      }
    default:
      break;
    }

  throw std::invalid_argument("Unsupported operation: " + args.op);
}


bool
Session::run(const Args& args, std::ostream& out)
{
  try
    {
      out << evaluate(args) << '\n';
    }
  catch (const ArithException& e)
    {
      std::cerr << ArithException::typeName(e.type()) << ": " << e.what() << '\n';
      return false;
    }
  catch (const std::invalid_argument& e)
    {
      std::cerr << e.what() << '\n';
      return false;
    }

  return true;
}
