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

#include "negotiate/blob.hpp" ///< for negotiate::blob, negotiate::blob_view
#include "negotiate/negotiate_engine.hpp" ///< for negotiate::negotiate_engine, negotiate::security_context
#include "negotiate/session_config.hpp" ///< for negotiate::protection_level

#include <system_error> ///< for std::error_code

namespace negotiate
{

/// Signs or seals according to the negotiated level, protection_level::none is negotiate_status::not_supported
[[nodiscard]] std::error_code protect_message(
   negotiate_engine &engine,
   security_context &securityContext,
   protection_level negotiatedLevel,
   blob_view const &plaintext,
   blob &protectedMessage
);

[[nodiscard]] std::error_code unprotect_message(
   negotiate_engine &engine,
   security_context &securityContext,
   protection_level negotiatedLevel,
   blob_view const &protectedMessage,
   blob &plaintext
);

}
