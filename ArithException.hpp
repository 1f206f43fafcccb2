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

#include <exception>


namespace FixInt
{

  /// Thrown by arithmetic operations that cannot produce a value of
  /// the result type. Wrapping operations never throw.
  class ArithException : public std::exception
  {
  public:

    enum Type { Overflow, DivideByZero, Inexact };

    ArithException(Type type, const char* message = "")
      : type_(type), msg_(message)
    { }

    const char* what() const noexcept override
    { return msg_; }

    Type type() const
    { return type_; }

    /// Return the name of the given exception type.
    static const char* typeName(Type type)
    {
      switch (type)
	{
	case Overflow:     return "OverflowError";
	case DivideByZero: return "DivideError";
	case Inexact:      return "InexactError";
	}
      return "?";
    }

  private:
    Type type_ = Overflow;
    const char* msg_ = "";
  };

}
