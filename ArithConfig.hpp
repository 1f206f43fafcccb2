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

#include <memory>
#include <string>
#include <string_view>
#include <nlohmann/json_fwd.hpp>


namespace FixInt
{

  /// Manage the arithmetic configuration file (JSON). Recognized
  /// entries:
  ///   "word_size"            : 32 or 64, native word used for promotion.
  ///   "soft_int128_required" : true to refuse a build using the
  ///                            compiler native 128-bit types.
  ///   "verbose"              : true to report the resolved settings.
  class ArithConfig
  {
  public:

    /// Constructor.
    ArithConfig();

    /// Destructor.
    ~ArithConfig();

    /// Load given configuration file (JSON format, comments allowed).
    /// Return true on success and false on failure (a message is
    /// printed on the standard error stream).
    bool loadConfigFile(const std::string& filePath);

    /// Load configuration from the given JSON text. Return true on
    /// success and false on failure.
    bool loadConfigString(const std::string& text);

    /// Set size to the word size of the configuration. Return true on
    /// success and false if the entry is missing or invalid (an
    /// invalid entry is reported on the standard error stream).
    bool getWordSize(unsigned& size) const;

    /// Set flag to the value of the verbose entry. Return false if the
    /// entry is missing or not a boolean.
    bool getVerbose(bool& flag) const;

    /// Set flag to the value of the soft_int128_required entry. Return
    /// false if the entry is missing or not a boolean.
    bool getSoftInt128Required(bool& flag) const;

    /// Apply the configuration: set wordSize and verbose from the
    /// corresponding entries leaving them unmodified for missing
    /// entries. Return true on success and false if an entry is
    /// invalid or if the build does not satisfy the
    /// soft_int128_required entry.
    bool applyConfig(unsigned& wordSize, bool& verbose) const;

    /// Unconditionally set the word size entry.
    void setWordSize(unsigned size);

    /// Return true if the configuration has the given top-level entry.
    bool hasEntry(std::string_view tag) const;

    /// Clear all configuration.
    void clear();

  private:

    ArithConfig(const ArithConfig&) = delete;
    void operator= (const ArithConfig&) = delete;

    std::unique_ptr<nlohmann::json> config_;
  };
}
