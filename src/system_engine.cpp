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

#include "negotiate/negotiate_engine.hpp" ///< for negotiate::negotiate_engine
#include "negotiate/system_engine.hpp" ///< for negotiate::make_system_engine
#if (defined(NEGOTIATE_GSSAPI))
#  include "gssapi/gssapi_engine.hpp" ///< for negotiate::gssapi_engine
#elif (defined(NEGOTIATE_SSPI))
#  include "windows/sspi_engine.hpp" ///< for negotiate::sspi_engine
#endif

#include <memory> ///< for std::make_shared, std::shared_ptr

namespace negotiate
{

std::shared_ptr<negotiate_engine> make_system_engine()
{
#if (defined(NEGOTIATE_GSSAPI))
   return std::make_shared<gssapi_engine>();
#elif (defined(NEGOTIATE_SSPI))
   return std::make_shared<sspi_engine>();
#endif
}

}
