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

#include <system_error> ///< for std::error_code, std::is_error_code_enum
#include <type_traits> ///< for std::true_type

namespace negotiate
{

/// Outcome of a negotiation step or of a message protection call.
/// `completed` is zero, so a `std::error_code` made of it evaluates to false.
enum struct negotiate_status : int
{
   completed = 0,
   continue_needed,

   invalid_token,
   invalid_credentials,
   unknown_credentials,
   target_unknown,
   context_expired,
   qop_not_supported,
   unsupported,
   message_modified,
   message_expired,
   invalid_operation,
   not_supported,
   generic_failure,
};

[[nodiscard]] constexpr bool is_terminal(negotiate_status const status) noexcept
{
   return negotiate_status::continue_needed != status;
}

[[nodiscard]] constexpr bool is_failure(negotiate_status const status) noexcept
{
   return (negotiate_status::continue_needed != status) && (negotiate_status::completed != status);
}

[[nodiscard]] std::error_category const &negotiate_category() noexcept;
[[nodiscard]] std::error_code make_error_code(negotiate_status status) noexcept;

/// Maps an error code of the negotiate category back onto the taxonomy, any other category is a generic failure
[[nodiscard]] negotiate_status to_negotiate_status(std::error_code const &errorCode) noexcept;

}

template<>
struct std::is_error_code_enum<negotiate::negotiate_status> : std::true_type
{};
