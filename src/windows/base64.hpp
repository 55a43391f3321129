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

#include <Windows.h> ///< for BYTE, DWORD, LPSTR, TRUE, wincrypt.h
/// for
///   CRYPT_STRING_BASE64,
///   CRYPT_STRING_NOCRLF,
///   CryptBinaryToStringA,
///   CryptStringToBinaryA
#include <wincrypt.h>

#include <algorithm> ///< for std::min
#include <bit> ///< for std::bit_cast
#include <cassert> ///< for assert
#include <cstddef> ///< for size_t
#include <iterator> ///< for std::data, std::size
#include <limits> ///< for std::numeric_limits
#include <memory> ///< for std::addressof

#pragma comment(lib, "Crypt32")

namespace negotiate
{

/// Crypt32 takes DWORD lengths, inputs are passed in blocks whose encoded length still fits
constexpr size_t base64_encode_block_size{3 * (static_cast<size_t>(std::numeric_limits<int>::max()) / 4),};
constexpr size_t base64_decode_block_size{4 * (static_cast<size_t>(std::numeric_limits<int>::max()) / 4),};

template<size_t block_size = base64_encode_block_size, typename string_output, typename binary_input>
[[nodiscard]] size_t base64_encode(string_output &stringOutput, binary_input const &binaryInput)
{
   static_assert((0 < block_size) && (0 == (block_size % 3)) && (base64_encode_block_size >= block_size));
   assert((4 * ((std::size(binaryInput) + 2) / 3) + 1) <= std::size(stringOutput));
   auto const *input{std::bit_cast<BYTE const *>(std::data(binaryInput)),};
   auto *output{std::bit_cast<LPSTR>(std::data(stringOutput)),};
   size_t outputLength{0,};
   for (size_t offset{0,}; std::size(binaryInput) > offset; offset += block_size)
   {
      auto const blockLength{static_cast<DWORD>(std::min(block_size, std::size(binaryInput) - offset)),};
      auto outputBytesLength
      {
         static_cast<DWORD>(std::min<size_t>(std::size(stringOutput) - outputLength, std::numeric_limits<DWORD>::max())),
      };
      [[maybe_unused]] auto const returnCode = CryptBinaryToStringA(
         input + offset,
         blockLength,
         CRYPT_STRING_BASE64 | CRYPT_STRING_NOCRLF,
         output + outputLength,
         std::addressof(outputBytesLength)
      );
      assert(TRUE == returnCode);
      outputLength += outputBytesLength;
   }
   return outputLength;
}

/// Expects validated, padded input; unlike the OpenSSL variant padding bytes are not part of the result
template<size_t block_size = base64_decode_block_size, typename binary_output, typename string_input>
[[nodiscard]] bool base64_decode(binary_output &binaryOutput, string_input const &stringInput, size_t &bytesWritten)
{
   static_assert((0 < block_size) && (0 == (block_size % 4)) && (base64_decode_block_size >= block_size));
   assert((3 * (std::size(stringInput) / 4)) <= std::size(binaryOutput));
   auto const *input{std::data(stringInput),};
   auto *output{std::bit_cast<BYTE *>(std::data(binaryOutput)),};
   bytesWritten = 0;
   for (size_t offset{0,}; std::size(stringInput) > offset; offset += block_size)
   {
      auto const blockLength{static_cast<DWORD>(std::min(block_size, std::size(stringInput) - offset)),};
      auto outputBytesLength
      {
         static_cast<DWORD>(std::min<size_t>(std::size(binaryOutput) - bytesWritten, std::numeric_limits<DWORD>::max())),
      };
      if (
         TRUE != CryptStringToBinaryA(
            input + offset,
            blockLength,
            CRYPT_STRING_BASE64,
            output + bytesWritten,
            std::addressof(outputBytesLength),
            nullptr,
            nullptr
         )
      ) [[unlikely]]
      {
         bytesWritten = 0;
         return false;
      }
      bytesWritten += outputBytesLength;
   }
   return true;
}

}
