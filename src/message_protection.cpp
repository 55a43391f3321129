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

#include "common/logger.hpp" ///< for negotiate::log_system_error
#include "common/utility.hpp" ///< for negotiate::unreachable
#include "message_protection.hpp" ///< for negotiate::protect_message, negotiate::unprotect_message
#include "negotiate/negotiate_status.hpp" ///< for negotiate::make_error_code, negotiate::negotiate_status, negotiate::to_negotiate_status

#include <string_view> ///< for std::string_view
#include <system_error> ///< for std::error_code

namespace negotiate
{

namespace
{

/// Engines may report native error codes, callers only ever see the taxonomy
[[nodiscard]] std::error_code normalize_error(std::error_code const &errorCode, std::string_view const &prefix)
{
   if (false == bool{errorCode,})
   {
      return errorCode;
   }
   if (negotiate_category() != errorCode.category())
   {
      log_system_error(prefix, errorCode);
   }
   return make_error_code(to_negotiate_status(errorCode));
}

}

std::error_code protect_message(
   negotiate_engine &engine,
   security_context &securityContext,
   protection_level const negotiatedLevel,
   blob_view const &plaintext,
   blob &protectedMessage
)
{
   protectedMessage.clear();
   std::error_code errorCode{};
   switch (negotiatedLevel)
   {
   case protection_level::none: return make_error_code(negotiate_status::not_supported);

   case protection_level::sign:
   {
      errorCode = normalize_error(engine.sign(securityContext, plaintext, protectedMessage), "[negotiate] failed to sign message");
   }
   break;

   case protection_level::encrypt_and_sign:
   {
      errorCode = normalize_error(engine.seal(securityContext, plaintext, protectedMessage), "[negotiate] failed to seal message");
   }
   break;

   [[unlikely]] default: unreachable();
   }
   if (true == bool{errorCode,})
   {
      protectedMessage.clear();
   }
   return errorCode;
}

std::error_code unprotect_message(
   negotiate_engine &engine,
   security_context &securityContext,
   protection_level const negotiatedLevel,
   blob_view const &protectedMessage,
   blob &plaintext
)
{
   plaintext.clear();
   std::error_code errorCode{};
   switch (negotiatedLevel)
   {
   case protection_level::none: return make_error_code(negotiate_status::not_supported);

   case protection_level::sign:
   {
      errorCode = normalize_error(engine.verify(securityContext, protectedMessage, plaintext), "[negotiate] failed to verify message");
   }
   break;

   case protection_level::encrypt_and_sign:
   {
      errorCode = normalize_error(engine.unseal(securityContext, protectedMessage, plaintext), "[negotiate] failed to unseal message");
   }
   break;

   [[unlikely]] default: unreachable();
   }
   if (true == bool{errorCode,})
   {
      plaintext.clear();
   }
   return errorCode;
}

}
