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

#pragma once

#include <cstdint>
#include <iosfwd>
#include <string>
#include <vector>
#include "Args.hpp"
#include "ArithConfig.hpp"
#include "IntArith.hpp"
#include "IntValue.hpp"


namespace FixInt
{

  /// Operations of the evaluator.
  enum class OpCode : uint8_t
    {
      Add, Sub, Mul, Neg, Abs, Div, Rem, Fld, Mod, Cld,
      CheckedAdd, CheckedSub, CheckedMul, CheckedNeg, CheckedAbs,
      CheckedDiv, CheckedRem, CheckedFld, CheckedMod, CheckedCld,
      And, Or, Xor, Not, Shl, Shr, Lshr, Bswap,
      CountOnes, CountZeros, LeadingZeros, LeadingOnes, TrailingZeros, TrailingOnes,
      Convert, Truncate, Reinterpret, Promote, Widen, Widemul,
      Eq, Lt, Le, Typemin, Typemax
    };


  /// Manage a fixint session: resolve the configuration from the
  /// command line and the configuration file then evaluate the
  /// requested operation.
  class Session
  {
  public:

    Session();

    /// Configure this session. Return true on success and false on
    /// failure (invalid configuration).
    bool configure(const Args& args, const ArithConfig& config);

    /// Evaluate the operation requested on the command line and print
    /// its result on the given stream. Return true on success. On an
    /// arithmetic or usage error print the error on the standard
    /// error stream and return false.
    bool run(const Args& args, std::ostream& out);

    /// Return the text of the result of the operation requested on
    /// the command line. Throw ArithException on an arithmetic error
    /// and std::invalid_argument on a usage error (unknown operation,
    /// wrong operand count, bad literal).
    std::string evaluate(const Args& args) const;

    /// Obtain the promotion word size. Command line has top priority,
    /// then config file, then host.
    static
    unsigned determineWordSize(const Args& args, const ArithConfig& config);

    /// Set op to the operation of the given name (e.g. "checked_add").
    /// Return true on success and false if name is not recognized.
    static bool parseOpName(const std::string& name, OpCode& op);

    /// Return the name of the given operation.
    static std::string opName(OpCode op);

    const IntArith& arith() const
    { return arith_; }

    bool verbose() const
    { return verbose_; }

  protected:

    /// Parse the operands of the command line. The first operand has
    /// the type of --type, the others the type of --type2 if present
    /// and of --type otherwise.
    std::vector<IntValue> parseOperands(const Args& args, size_t minCount,
                                        size_t maxCount) const;

    /// Parse the shift count operand.
    uint64_t parseShiftCount(const Args& args) const;

    /// Return the destination type (--type2) of a conversion.
    IntKind destinationKind(const Args& args) const;

    /// Report the promotion of a binary operation if verbose.
    void reportPromotion(const IntValue& x, const IntValue& y) const;

  private:

    IntArith arith_;
    bool verbose_ = false;
  };
}
