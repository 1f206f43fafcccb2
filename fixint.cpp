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
#include <span>
#include "ArithConfig.hpp"
#include "Args.hpp"
#include "Session.hpp"


using namespace FixInt;


int
main(int argc, char* argv[])
{
  bool ok = true;
  try
    {
      Args args;
      if (not args.parseCmdLineArgs(std::span(argv, argc)))
        return 1;
      if (args.help or args.version)
        return 0;

      // Load configuration file.
      ArithConfig config;
      if (not args.configFile.empty())
        if (not config.loadConfigFile(args.configFile))
          return 1;

      Session session{};
      ok = session.configure(args, config);
      ok = ok and session.run(args, std::cout);
    }
  catch (std::exception& e)
    {
      std::cerr << e.what() << '\n';
      ok = false;
    }

  return ok? 0 : 1;
}
