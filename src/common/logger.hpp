/*
   Part of the negotiate project, under the MIT License
   SPDX-License-Identifier: MIT

   Copyright (c) 2024-2025 Mikhail Smirnov

   Permission is hereby granted, free of charge, to any person obtaining a copy
   of this software and associated documentation files (the "Software"), to deal
   in the Software without restriction, including without limitation the rights
   to use, copy, modify, merge, publish, distribute, sublicense, and/or sell
   copies of the Software, and to permit persons to whom the Software is
   furnished to do so, subject to the following conditions:

   The above copyright notice and this permission notice shall be included in all
   copies or substantial portions of the Software.

   THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR
   IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY,
   FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE
   AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER
   LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM,
   OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE
   SOFTWARE.
*/

#pragma once

#include <iostream> ///< for std::cerr
#include <ostream> ///< for std::endl
#include <source_location> ///< for std::source_location
#include <string_view> ///< for std::string_view
#include <syncstream> ///< for std::osyncstream
#include <system_error> ///< for std::error_code
#include <utility> ///< for std::forward

namespace negotiate
{

template<typename ...types>
void log_error(std::source_location const &sourceLocation, types &&...values)
{
   std::osyncstream sink{std::cerr,};
   sink << sourceLocation.file_name() << ":" << sourceLocation.line() << " ";
   (sink << ... << std::forward<types>(values));
   sink << std::endl;
}

inline void log_system_error(
   std::string_view const &prefix,
   std::error_code const &errorCode,
   std::source_location const &sourceLocation = std::source_location::current()
)
{
   log_error(sourceLocation, prefix, ": (", errorCode.value(), ") - ", errorCode.message());
}

}
