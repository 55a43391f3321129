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

#include "negotiate/blob.hpp" ///< for negotiate::blob, negotiate::blob_view
#include "negotiate/blob_codec.hpp" ///< for negotiate::decode_blob, negotiate::encode_blob
#include "negotiate/negotiate_status.hpp" ///< for negotiate::make_error_code, negotiate::negotiate_status
#if (defined(NEGOTIATE_OPENSSL))
#  include "openssl/base64.hpp" ///< for negotiate::base64_decode, negotiate::base64_encode
#elif (defined(NEGOTIATE_SSPI))
#  include "windows/base64.hpp" ///< for negotiate::base64_decode, negotiate::base64_encode
#endif

#include <cassert> ///< for assert
#include <cstddef> ///< for size_t
#include <cstdint> ///< for uint8_t
#include <string> ///< for std::string
#include <string_view> ///< for std::string_view
#include <system_error> ///< for std::error_code

namespace negotiate
{

namespace
{

constexpr uint8_t invalid_sextet{0xff,};

[[nodiscard]] constexpr uint8_t decode_sextet(char const value) noexcept
{
   if (('A' <= value) && ('Z' >= value))
   {
      return static_cast<uint8_t>(value - 'A');
   }
   if (('a' <= value) && ('z' >= value))
   {
      return static_cast<uint8_t>(value - 'a' + 26);
   }
   if (('0' <= value) && ('9' >= value))
   {
      return static_cast<uint8_t>(value - '0' + 52);
   }
   if ('+' == value)
   {
      return 62;
   }
   if ('/' == value)
   {
      return 63;
   }
   return invalid_sextet;
}

/// Strict RFC 4648 section 4 check, returns the number of padding characters or -1
[[nodiscard]] int validate_base64(std::string_view const &text) noexcept
{
   if (0 != (text.size() % 4))
   {
      return -1;
   }
   size_t paddingLength{0,};
   while ((paddingLength < text.size()) && ('=' == text[text.size() - paddingLength - 1]))
   {
      ++paddingLength;
   }
   if (2 < paddingLength)
   {
      return -1;
   }
   auto const payloadLength{text.size() - paddingLength,};
   for (size_t index{0,}; payloadLength > index; ++index)
   {
      if (invalid_sextet == decode_sextet(text[index]))
      {
         return -1;
      }
   }
   if (0 < paddingLength)
   {
      /// Bits beyond the last full byte must be zero, otherwise two texts would decode to the same bytes
      auto const lastSextet{decode_sextet(text[payloadLength - 1]),};
      auto const unusedBitsMask{static_cast<uint8_t>((1 == paddingLength) ? 0x03 : 0x0f),};
      if (0 != (lastSextet & unusedBitsMask))
      {
         return -1;
      }
   }
   return static_cast<int>(paddingLength);
}

}

std::string encode_blob(blob_view const &bytes)
{
   if (true == bytes.empty())
   {
      return std::string{};
   }
   std::string text(4 * ((bytes.size() + 2) / 3) + 1, '\0');
   auto const textLength{base64_encode(text, bytes),};
   assert((text.size() - 1) == textLength);
   text.resize(textLength);
   return text;
}

blob decode_blob(std::string_view const &text, std::error_code &errorCode)
{
   errorCode = std::error_code{};
   if (true == text.empty())
   {
      return blob{};
   }
   auto const paddingLength{validate_base64(text),};
   if (0 > paddingLength)
   {
      errorCode = make_error_code(negotiate_status::invalid_token);
      return blob{};
   }
   auto const bytesLength{3 * (text.size() / 4) - static_cast<size_t>(paddingLength),};
   blob bytes(3 * (text.size() / 4));
   size_t bytesWritten{0,};
   if ((false == base64_decode(bytes, text, bytesWritten)) || (bytesLength > bytesWritten)) [[unlikely]]
   {
      errorCode = make_error_code(negotiate_status::invalid_token);
      return blob{};
   }
   bytes.resize(bytesLength);
   return bytes;
}

}
