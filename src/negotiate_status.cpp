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

#include "common/utility.hpp" ///< for negotiate::to_underlying
#include "negotiate/negotiate_status.hpp" ///< for negotiate::negotiate_status

#include <string> ///< for std::string
#include <system_error> ///< for std::error_category, std::error_code

namespace negotiate
{

namespace
{

struct negotiate_error_category final
{
private:
   class negotiate_error_category_impl final : public std::error_category
   {
   public:
      [[nodiscard]] constexpr negotiate_error_category_impl() noexcept = default;
      negotiate_error_category_impl(negotiate_error_category_impl &&) = delete;
      negotiate_error_category_impl(negotiate_error_category_impl const &) = delete;

      negotiate_error_category_impl &operator = (negotiate_error_category_impl &&) = delete;
      negotiate_error_category_impl &operator = (negotiate_error_category_impl const &) = delete;

      [[nodiscard]] const char *name() const noexcept override
      {
         return "negotiate";
      }

      [[nodiscard]] std::string message(int const value) const override
      {
         switch (static_cast<negotiate_status>(value))
         {
         case negotiate_status::completed:
         return std::string{"Authentication completed",};

         case negotiate_status::continue_needed:
         return std::string{"Authentication exchange needs another round trip",};

         case negotiate_status::invalid_token:
         return std::string{"Token is malformed or was not produced by the expected mechanism",};

         case negotiate_status::invalid_credentials:
         return std::string{"Credentials are invalid or were rejected",};

         case negotiate_status::unknown_credentials:
         return std::string{"Credentials are not available or not known to the mechanism",};

         case negotiate_status::target_unknown:
         return std::string{"Target name is unknown or malformed",};

         case negotiate_status::context_expired:
         return std::string{"Security context or credentials expired",};

         case negotiate_status::qop_not_supported:
         return std::string{"Required protection level is not supported by the negotiated context",};

         case negotiate_status::unsupported:
         return std::string{"Security package is not supported",};

         case negotiate_status::message_modified:
         return std::string{"Message integrity check failed",};

         case negotiate_status::message_expired:
         return std::string{"Message is a replay or out of sequence",};

         case negotiate_status::invalid_operation:
         return std::string{"Operation is not valid in the current session phase",};

         case negotiate_status::not_supported:
         return std::string{"Message protection was not negotiated",};

         case negotiate_status::generic_failure:
         return std::string{"Authentication failed",};

         [[unlikely]] default: return std::string{"Unknown error, it must be a bug",};
         }
      }
   };

   static inline negotiate_error_category_impl impl{};

public:
   [[nodiscard]] static std::error_category const &instance() noexcept
   {
      return impl;
   }
};

}

std::error_category const &negotiate_category() noexcept
{
   return negotiate_error_category::instance();
}

std::error_code make_error_code(negotiate_status const status) noexcept
{
   return std::error_code{to_underlying(status), negotiate_error_category::instance(),};
}

negotiate_status to_negotiate_status(std::error_code const &errorCode) noexcept
{
   if (false == bool{errorCode,})
   {
      return negotiate_status::completed;
   }
   if (
      true
      && (negotiate_error_category::instance() == errorCode.category())
      && (to_underlying(negotiate_status::generic_failure) >= errorCode.value())
      && (to_underlying(negotiate_status::completed) < errorCode.value())
   )
   {
      return static_cast<negotiate_status>(errorCode.value());
   }
   return negotiate_status::generic_failure;
}

}
