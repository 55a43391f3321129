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

#include "negotiate/negotiate_status.hpp" ///< for negotiate::negotiate_status

#include <gssapi/gssapi.h> ///< for gss_OID, OM_uint32

#include <source_location> ///< for std::source_location
#include <string_view> ///< for std::string_view
#include <system_error> ///< for std::error_code

namespace negotiate
{

/// Major status onto the negotiate taxonomy, supplementary replay and sequence bits count as negotiate_status::message_expired
[[nodiscard]] negotiate_status map_gssapi_status(OM_uint32 majorStatus) noexcept;

/// Error code of the "gssapi" category, the value is the routine error part of the major status
[[nodiscard]] std::error_code make_gssapi_error_code(OM_uint32 majorStatus) noexcept;

/// Logs the major status through the "gssapi" category, followed by the mechanism text of a non-zero minor status
void log_gssapi_error(
   std::string_view const &prefix,
   OM_uint32 majorStatus,
   OM_uint32 minorStatus,
   gss_OID mechanism,
   std::source_location const &sourceLocation = std::source_location::current()
);

}
