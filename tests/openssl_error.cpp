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

#include "openssl_error.hpp"

#include <openssl/err.h>

#include <array>
#include <cstddef>
#include <iostream>
#include <ostream>
#include <source_location>
#include <sstream>
#include <string>
#include <string_view>
#include <syncstream>
#include <system_error>

namespace negotiate::tests
{

namespace
{

constexpr size_t openssl_error_text_size{256,};

[[nodiscard]] std::string openssl_error_text(unsigned long const errorCode)
{
   std::array<char, openssl_error_text_size> errorText{};
   ERR_error_string_n(errorCode, errorText.data(), errorText.size());
   return std::string{errorText.data(),};
}

struct openssl_error_category final
{
private:
   class openssl_error_category_impl final : public std::error_category
   {
   public:
      [[nodiscard]] constexpr openssl_error_category_impl() noexcept = default;
      openssl_error_category_impl(openssl_error_category_impl &&) = delete;
      openssl_error_category_impl(openssl_error_category_impl const &) = delete;

      openssl_error_category_impl &operator = (openssl_error_category_impl &&) = delete;
      openssl_error_category_impl &operator = (openssl_error_category_impl const &) = delete;

      [[nodiscard]] const char *name() const noexcept override
      {
         return "openssl";
      }

      [[nodiscard]] std::string message(int const value) const override
      {
         return (0 > value) ? std::string{"empty error queue",} : openssl_error_text(static_cast<unsigned long>(value));
      }
   };

   static inline openssl_error_category_impl impl{};

public:
   [[nodiscard]] static std::error_category const &instance() noexcept
   {
      return impl;
   }
};

}

void log_openssl_errors(std::string_view const &prefix, std::source_location const &sourceLocation)
{
   std::stringstream record{};
   record << sourceLocation.file_name() << ":" << sourceLocation.line() << " " << prefix;
   for (auto errorCode{ERR_get_error(),}; 0 != errorCode; errorCode = ERR_get_error())
   {
      record << "\n\t" << openssl_error_text(errorCode);
   }
   std::osyncstream{std::cerr,} << record.str() << std::endl;
}

std::error_code make_openssl_error_code()
{
   auto const errorCode{ERR_peek_error(),};
   return std::error_code{(0 == errorCode) ? -1 : static_cast<int>(errorCode), openssl_error_category::instance(),};
}

}
