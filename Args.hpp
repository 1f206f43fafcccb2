#pragma once

#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <vector>
#include <boost/program_options.hpp>
#include "IntType.hpp"


namespace FixInt
{

  /// Command line of the fixint evaluator.
  struct Args
  {
    /// Parse the given command line (argv[0] being the program name)
    /// and fill this object. Return true on success and false on a
    /// malformed command line (a diagnostic is printed).
    bool parseCmdLineArgs(std::span<char*> argv);

    /// Same as above for a vector of words. Used by the tests.
    bool parseCmdLineArgs(std::vector<std::string>& words)
    {
      std::vector<char*> argv;
      argv.reserve(words.size());
      for (auto& word : words)
	argv.push_back(word.data());
      return parseCmdLineArgs(std::span<char*>(argv));
    }

    /// Validate the parsed option values and derive the typed fields
    /// (kind, kind2, wordSize). Return true if all values are valid.
    bool finalize(const boost::program_options::variables_map& varMap);

    /// Set kind to the integer type named by the given string ignoring
    /// case (e.g. "uint8" for UInt8). Return true on success and false
    /// if the name is not recognized. Option is the command line
    /// option holding the name and is used in diagnostics.
    static bool
    parseTypeName(const std::string& option, const std::string& name, IntKind& kind);

    std::string configFile;                 // JSON configuration.
    std::string op;                         // Operation name, lower case.
    std::string typeName;                   // Type of the (first) operand.
    std::string typeName2;                  // Type of the other operands or
                                            // destination of a conversion.
    std::vector<std::string> operands;      // Operand literals.

    std::optional<unsigned> wordSize;       // 32 or 64 when given.
    std::optional<IntKind> kind;
    std::optional<IntKind> kind2;

    bool help = false;
    bool verbose = false;
    bool version = false;
  };
}
