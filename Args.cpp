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


#include <iostream>
#include <boost/algorithm/string.hpp>
#include "Args.hpp"
#include "wideint.hpp"


using namespace FixInt;

namespace po = boost::program_options;


static void
printVersion()
{
  std::cout << "fixint " << 1 << "." << 4 << " (built " << __DATE__ << ' '
            << __TIME__ << ")\n";
  std::cout << "128-bit integers: " << (hasNativeInt128() ? "native" : "emulated");
#ifdef FIXINT_SOFT_INT128
  std::cout << " (FIXINT_SOFT_INT128)";
#endif
  std::cout << '\n';
}


static void
printUsage(const po::options_description& desc)
{
  std::cout <<
    "Usage: fixint [options] --op NAME --type TYPE [--type2 TYPE] [--] OPERAND...\n"
    "Evaluate an operation on fixed width integers and print the result as\n"
    "value::Type. Operands of different types are brought to their promoted\n"
    "type first. Negative operands go after \"--\".\n"
    "Examples:\n"
    "  fixint --op fld --type Int8 -- -7 2\n"
    "  fixint --op checked_add --type UInt8 200 100\n"
    "  fixint --op add --type Int8 --type2 UInt32 --wordsize 32 -- -1 1\n"
    "  fixint --op convert --type Int16 --type2 UInt8 255\n\n";
  std::cout << desc;
}


bool
Args::parseTypeName(const std::string& option, const std::string& name, IntKind& kind)
{
  std::string trimmed = boost::algorithm::trim_copy(name);
  for (unsigned ix = 0; ix < intKindCount; ++ix)
    {
      IntKind candidate = static_cast<IntKind>(ix);
      if (not boost::iequals(trimmed, kindName(candidate)))
        continue;
      kind = candidate;
      return true;
    }

  std::cerr << "Bad --" << option << " value: " << name << " (expecting one of";
  for (unsigned ix = 0; ix < intKindCount; ++ix)
    std::cerr << ' ' << kindName(static_cast<IntKind>(ix));
  std::cerr << ")\n";
  return false;
}


bool
Args::finalize(const po::variables_map& varMap)
{
  unsigned errors = 0;

  if (varMap.count("wordsize"))
    {
      unsigned size = varMap["wordsize"].as<unsigned>();
      if (isValidWordSize(size))
        wordSize = size;
      else
        {
          std::cerr << "Bad --wordsize value: " << size << " (expecting 32 or 64)\n";
          errors++;
        }
    }

  boost::algorithm::to_lower(op);
  if (op.empty())
    {
      std::cerr << "No operation given (use --op)\n";
      errors++;
    }

  IntKind k = IntKind::Int64;
  if (typeName.empty())
    {
      std::cerr << "No operand type given (use --type)\n";
      errors++;
    }
  else if (parseTypeName("type", typeName, k))
    kind = k;
  else
    errors++;

  if (not typeName2.empty())
    {
      if (parseTypeName("type2", typeName2, k))
        kind2 = k;
      else
        errors++;
    }

  for (auto& operand : operands)
    boost::algorithm::trim(operand);

  return errors == 0;
}


bool
Args::parseCmdLineArgs(std::span<char*> argv)
{
  po::options_description desc("Options");
  desc.add_options()
    ("help,h", po::bool_switch(&help),
     "Print this help and exit.")
    ("version", po::bool_switch(&version),
     "Print version and exit.")
    ("configfile", po::value(&configFile),
     "JSON configuration file. Recognized entries: word_size, verbose and "
     "soft_int128_required.")
    ("wordsize", po::value<unsigned>(),
     "Word size (32 or 64) selecting the promotion table. Takes precedence over "
     "the configuration file. Defaults to the word size of the host.")
    ("op", po::value(&op),
     "Operation: add sub mul neg abs div rem fld mod cld checked_add checked_sub "
     "checked_mul checked_neg checked_abs checked_div checked_rem checked_fld "
     "checked_mod checked_cld and or xor not shl shr lshr bswap count_ones "
     "count_zeros leading_zeros leading_ones trailing_zeros trailing_ones convert "
     "truncate reinterpret promote widen widemul eq lt le typemin typemax.")
    ("type", po::value(&typeName),
     "Operand type: Int8 Int16 Int32 Int64 Int128 UInt8 UInt16 UInt32 UInt64 UInt128.")
    ("type2", po::value(&typeName2),
     "Type of the second and later operands, or destination type of convert, "
     "truncate and reinterpret.")
    ("operand", po::value(&operands)->multitoken(),
     "Operand literal: decimal, or hexadecimal with a 0x prefix. Remaining "
     "positional arguments are operands too.")
    ("verbose,v", po::bool_switch(&verbose),
     "Report configuration and promotions on the standard error stream.");

  po::positional_options_description positional;
  positional.add("operand", -1);

  po::variables_map varMap;
  try
    {
      auto parsed = po::command_line_parser(static_cast<int>(argv.size()), argv.data())
        .options(desc).positional(positional).run();
      po::store(parsed, varMap);
      po::notify(varMap);
    }
  catch (const po::error& e)
    {
      std::cerr << "Bad command line: " << e.what() << '\n';
      return false;
    }

  if (version)
    printVersion();
  if (help)
    printUsage(desc);
  if (help or version)
    return true;

  return finalize(varMap);
}
