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

#include <nlohmann/json.hpp>
#include <cerrno>
#include <cstdint>
#include <cstdlib>
#include <limits>
#include <fstream>
#include <iostream>
#include "ArithConfig.hpp"
#include "IntType.hpp"
#include "wideint.hpp"


using namespace FixInt;


ArithConfig::ArithConfig()
  : config_(std::make_unique<nlohmann::json>())
{
}


ArithConfig::~ArithConfig() = default;


bool
ArithConfig::loadConfigFile(const std::string& filePath)
{
  std::ifstream ifs(filePath);
  if (not ifs.good())
    {
      std::cerr << "Failed to open config file '" << filePath
		<< "' for input.\n";
      return false;
    }

  try
    {
      // Use json::parse rather than operator>> to allow comments to be ignored
      *config_ = nlohmann::json::parse(ifs, nullptr /* callback */, true /* allow_exceptions */, true /* ignore_comments */);
    }
  catch (std::exception& e)
    {
      std::cerr << "Failed to parse config file '" << filePath << "': "
		<< e.what() << "\n";
      return false;
    }

  if (not config_->is_object())
    {
      std::cerr << "Config file '" << filePath << "' must contain a JSON object\n";
      return false;
    }

  return true;
}


bool
ArithConfig::loadConfigString(const std::string& text)
{
  try
    {
      *config_ = nlohmann::json::parse(text, nullptr, true, true);
    }
  catch (std::exception& e)
    {
      std::cerr << e.what() << "\n";
      return false;
    }

  if (not config_->is_object())
    {
      std::cerr << "Configuration must be a JSON object\n";
      return false;
    }

  return true;
}


namespace FixInt
{

  /// Convert given json entry to an unsigned integer value honoring
  /// hexadecimal prefix (0x) if any. Return true on success and false
  /// if given entry does not represent an integer that fits in an
  /// unsigned.
  static bool
  getJsonUnsigned(std::string_view tag, const nlohmann::json& js, unsigned& value)
  {
    value = 0;

    if (js.is_number_unsigned())
      {
        uint64_t u64 = js.get<uint64_t>();
        if (u64 > std::numeric_limits<unsigned>::max())
          {
            std::cerr << "Config file value for '" << tag << "' out of range: "
                      << u64 << '\n';
            return false;
          }
        value = static_cast<unsigned>(u64);
        return true;
      }

    if (js.is_string())
      {
        char*       end = nullptr;
        std::string str = js.get<std::string>();
        errno = 0;
        uint64_t    u64 = strtoull(str.c_str(), &end, 0);
        if (str.empty() or (end and *end) or str.front() == '-' or errno == ERANGE or
            u64 > std::numeric_limits<unsigned>::max())
          {
            std::cerr << "Invalid config file unsigned value for '" << tag << "': "
                      << str << '\n';
            return false;
          }
        value = static_cast<unsigned>(u64);
        return true;
      }

    std::cerr << "Config file entry '" << tag << "' must contain a non-negative number\n";
    return false;
  }


  /// Convert given json entry to a boolean value. Return true on
  /// success and false if given entry does not represent a boolean.
  static bool
  getJsonBoolean(std::string_view tag, const nlohmann::json& js, bool& value)
  {
    value = false;

    if (js.is_boolean())
      {
        value = js.get<bool>();
        return true;
      }

    if (js.is_number_unsigned())
      {
        value = js.get<uint64_t>() != 0;
        return true;
      }

    if (js.is_string())
      {
        std::string str = js.get<std::string>();
        if (str == "0" or str == "false" or str == "False")
          value = false;
        else if (str == "1" or str == "true" or str == "True")
          value = true;
        else
          {
            std::cerr << "Invalid config file boolean value for '" << tag << "': "
                      << str << '\n';
            return false;
          }
        return true;
      }

    std::cerr << "Config file entry '" << tag << "' must contain a bool\n";
    return false;
  }

}


bool
ArithConfig::getWordSize(unsigned& size) const
{
  std::string tag = "word_size";
  if (not config_->contains(tag))
    return false;

  unsigned value = 0;
  if (not getJsonUnsigned(tag, config_->at(tag), value))
    return false;

  if (not isValidWordSize(value))
    {
      std::cerr << "Invalid config file value for '" << tag << "': " << value
		<< " (expecting 32 or 64)\n";
      return false;
    }

  size = value;
  return true;
}


bool
ArithConfig::getVerbose(bool& flag) const
{
  std::string tag = "verbose";
  if (not config_->contains(tag))
    return false;
  return getJsonBoolean(tag, config_->at(tag), flag);
}


bool
ArithConfig::getSoftInt128Required(bool& flag) const
{
  std::string tag = "soft_int128_required";
  if (not config_->contains(tag))
    return false;
  return getJsonBoolean(tag, config_->at(tag), flag);
}


bool
ArithConfig::applyConfig(unsigned& wordSize, bool& verbose) const
{
  unsigned errors = 0;

  if (hasEntry("word_size"))
    getWordSize(wordSize) or errors++;

  if (hasEntry("verbose"))
    getVerbose(verbose) or errors++;

  if (hasEntry("soft_int128_required"))
    {
      bool required = false;
      if (not getSoftInt128Required(required))
        errors++;
      else if (required and hasNativeInt128())
        {
          std::cerr << "Config file requires emulated 128-bit integers but this build "
                    << "uses the compiler native type (rebuild with FIXINT_SOFT_INT128)\n";
          errors++;
        }
    }

  return errors == 0;
}


void
ArithConfig::setWordSize(unsigned size)
{
  (*config_)["word_size"] = size;
}


bool
ArithConfig::hasEntry(std::string_view tag) const
{
  return config_->contains(std::string(tag));
}


void
ArithConfig::clear()
{
  config_->clear();
}
