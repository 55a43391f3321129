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

#include "common/logger.hpp" ///< for negotiate::log_system_error
#include "negotiate/negotiate_status.hpp" ///< for negotiate::negotiate_status

#include <Windows.h> ///< for security.h
/// for
///   SEC_E_*,
///   SEC_I_*,
///   SECURITY_STATUS
#include <security.h>

#include <source_location> ///< for std::source_location
#include <string_view> ///< for std::string_view
#include <system_error> ///< for std::error_code, std::system_category

namespace negotiate
{

[[nodiscard]] constexpr negotiate_status map_sspi_status(SECURITY_STATUS const securityStatus) noexcept
{
   switch (securityStatus)
   {
   case SEC_E_OK: return negotiate_status::completed;

   case SEC_I_CONTINUE_NEEDED: [[fallthrough]];
   case SEC_I_COMPLETE_AND_CONTINUE: return negotiate_status::continue_needed;

   case SEC_E_INVALID_TOKEN: [[fallthrough]];
   case SEC_E_INCOMPLETE_MESSAGE: return negotiate_status::invalid_token;

   case SEC_E_LOGON_DENIED: [[fallthrough]];
   case SEC_E_NO_AUTHENTICATING_AUTHORITY: return negotiate_status::invalid_credentials;

   case SEC_E_NO_CREDENTIALS: [[fallthrough]];
   case SEC_E_UNKNOWN_CREDENTIALS: return negotiate_status::unknown_credentials;

   case SEC_E_TARGET_UNKNOWN: [[fallthrough]];
   case SEC_E_WRONG_PRINCIPAL: return negotiate_status::target_unknown;

   case SEC_E_CONTEXT_EXPIRED: [[fallthrough]];
   case SEC_I_CONTEXT_EXPIRED: return negotiate_status::context_expired;

   case SEC_E_QOP_NOT_SUPPORTED: return negotiate_status::qop_not_supported;

   case SEC_E_SECPKG_NOT_FOUND: [[fallthrough]];
   case SEC_E_UNSUPPORTED_FUNCTION: return negotiate_status::unsupported;

   case SEC_E_MESSAGE_ALTERED: return negotiate_status::message_modified;

   case SEC_E_OUT_OF_SEQUENCE: return negotiate_status::message_expired;

   default: return negotiate_status::generic_failure;
   }
}

inline std::error_code check_sspi_error(
   std::string_view const &prefix,
   SECURITY_STATUS const securityStatus,
   std::source_location const &sourceLocation = std::source_location::current()
)
{
   std::error_code const errorCode{static_cast<int>(securityStatus), std::system_category(),};
   log_system_error(prefix, errorCode, sourceLocation);
   auto const status{map_sspi_status(securityStatus),};
   return make_error_code((true == is_failure(status)) ? status : negotiate_status::generic_failure);
}

}
