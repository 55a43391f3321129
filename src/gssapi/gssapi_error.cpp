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

#include "common/logger.hpp" ///< for negotiate::log_error, negotiate::log_system_error
#include "gssapi/gssapi_error.hpp" ///< for negotiate::log_gssapi_error, negotiate::make_gssapi_error_code, negotiate::map_gssapi_status
#include "negotiate/negotiate_status.hpp" ///< for negotiate::negotiate_status

/// for
///   GSS_C_GSS_CODE,
///   GSS_C_MECH_CODE,
///   GSS_C_NO_OID,
///   gss_buffer_desc,
///   gss_display_status,
///   GSS_ERROR,
///   gss_release_buffer,
///   GSS_ROUTINE_ERROR,
///   GSS_S_*,
///   GSS_SUPPLEMENTARY_INFO,
///   OM_uint32
#include <gssapi/gssapi.h>

#include <cstdint> ///< for uint32_t
#include <memory> ///< for std::addressof
#include <source_location> ///< for std::source_location
#include <string> ///< for std::string
#include <string_view> ///< for std::string_view
#include <system_error> ///< for std::error_category, std::error_code

namespace negotiate
{

namespace
{

[[nodiscard]] std::string display_status(OM_uint32 const statusValue, int const statusType, gss_OID const mechanism)
{
   std::string text{};
   OM_uint32 messageContext{0,};
   do
   {
      OM_uint32 minorStatus{0,};
      gss_buffer_desc statusString{.length = 0, .value = nullptr,};
      auto const majorStatus
      {
         gss_display_status(
            std::addressof(minorStatus),
            statusValue,
            statusType,
            mechanism,
            std::addressof(messageContext),
            std::addressof(statusString)
         ),
      };
      if (GSS_ERROR(majorStatus)) [[unlikely]]
      {
         break;
      }
      if (false == text.empty())
      {
         text.append("; ");
      }
      text.append(static_cast<char const *>(statusString.value), statusString.length);
      gss_release_buffer(std::addressof(minorStatus), std::addressof(statusString));
   }
   while (0 != messageContext);
   return text;
}

struct gssapi_error_category final
{
private:
   class gssapi_error_category_impl final : public std::error_category
   {
   public:
      [[nodiscard]] constexpr gssapi_error_category_impl() noexcept = default;
      gssapi_error_category_impl(gssapi_error_category_impl &&) = delete;
      gssapi_error_category_impl(gssapi_error_category_impl const &) = delete;

      gssapi_error_category_impl &operator = (gssapi_error_category_impl &&) = delete;
      gssapi_error_category_impl &operator = (gssapi_error_category_impl const &) = delete;

      [[nodiscard]] const char *name() const noexcept override
      {
         return "gssapi";
      }

      [[nodiscard]] std::string message(int const value) const override
      {
         auto text{display_status(static_cast<OM_uint32>(value), GSS_C_GSS_CODE, GSS_C_NO_OID),};
         return (true == text.empty()) ? std::string{"Unknown GSSAPI status",} : text;
      }
   };

   static inline gssapi_error_category_impl impl{};

public:
   [[nodiscard]] static std::error_category const &instance() noexcept
   {
      return impl;
   }
};

}

negotiate_status map_gssapi_status(OM_uint32 const majorStatus) noexcept
{
   if (0 != GSS_CALLING_ERROR(majorStatus)) [[unlikely]]
   {
      return negotiate_status::generic_failure;
   }
   switch (GSS_ROUTINE_ERROR(majorStatus))
   {
   case GSS_S_COMPLETE:
   {
      constexpr OM_uint32 sequenceViolationMask{GSS_S_DUPLICATE_TOKEN | GSS_S_OLD_TOKEN | GSS_S_UNSEQ_TOKEN | GSS_S_GAP_TOKEN,};
      if (0 != (GSS_SUPPLEMENTARY_INFO(majorStatus) & sequenceViolationMask))
      {
         return negotiate_status::message_expired;
      }
      return (0 != (GSS_SUPPLEMENTARY_INFO(majorStatus) & GSS_S_CONTINUE_NEEDED))
         ? negotiate_status::continue_needed
         : negotiate_status::completed
      ;
   }

   case GSS_S_BAD_MECH: [[fallthrough]];
   case GSS_S_UNAVAILABLE: return negotiate_status::unsupported;

   case GSS_S_BAD_NAME: [[fallthrough]];
   case GSS_S_BAD_NAMETYPE: return negotiate_status::target_unknown;

   case GSS_S_DEFECTIVE_TOKEN: return negotiate_status::invalid_token;

   case GSS_S_BAD_SIG: return negotiate_status::message_modified;

   case GSS_S_NO_CRED: return negotiate_status::unknown_credentials;

   case GSS_S_DEFECTIVE_CREDENTIAL: return negotiate_status::invalid_credentials;

   case GSS_S_CREDENTIALS_EXPIRED: [[fallthrough]];
   case GSS_S_CONTEXT_EXPIRED: return negotiate_status::context_expired;

   case GSS_S_BAD_QOP: return negotiate_status::qop_not_supported;

   default: return negotiate_status::generic_failure;
   }
}

std::error_code make_gssapi_error_code(OM_uint32 const majorStatus) noexcept
{
   return std::error_code{static_cast<int>(GSS_ROUTINE_ERROR(majorStatus)), gssapi_error_category::instance(),};
}

void log_gssapi_error(
   std::string_view const &prefix,
   OM_uint32 const majorStatus,
   OM_uint32 const minorStatus,
   gss_OID const mechanism,
   std::source_location const &sourceLocation
)
{
   auto const errorCode{make_gssapi_error_code(majorStatus),};
   if (0 == minorStatus)
   {
      log_system_error(prefix, errorCode, sourceLocation);
      return;
   }
   log_error(
      sourceLocation,
      prefix,
      ": (",
      errorCode.value(),
      ") - ",
      errorCode.message(),
      "\n\t[mech(",
      static_cast<uint32_t>(minorStatus),
      ")] ",
      display_status(minorStatus, GSS_C_MECH_CODE, mechanism)
   );
}

}
