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

#include <openssl/evp.h> ///< for EVP_DecodeBlock, EVP_EncodeBlock

#include <algorithm> ///< for std::min
#include <bit> ///< for std::bit_cast
#include <cassert> ///< for assert
#include <cstddef> ///< for size_t
#include <cstdint> ///< for uint8_t
#include <iterator> ///< for std::data, std::size
#include <limits> ///< for std::numeric_limits

namespace negotiate
{

/// EVP_EncodeBlock and EVP_DecodeBlock take int lengths, inputs are passed in blocks whose encoded length still fits
constexpr size_t base64_encode_block_size{3 * (static_cast<size_t>(std::numeric_limits<int>::max()) / 4),};
constexpr size_t base64_decode_block_size{4 * (static_cast<size_t>(std::numeric_limits<int>::max()) / 4),};

template<size_t block_size = base64_encode_block_size, typename string_output, typename binary_input>
[[nodiscard]] size_t base64_encode(string_output &stringOutput, binary_input const &binaryInput)
{
   static_assert((0 < block_size) && (0 == (block_size % 3)) && (base64_encode_block_size >= block_size));
   assert((4 * ((std::size(binaryInput) + 2) / 3) + 1) <= std::size(stringOutput));
   auto const *input{std::bit_cast<uint8_t const *>(std::data(binaryInput)),};
   auto *output{std::bit_cast<uint8_t *>(std::data(stringOutput)),};
   size_t outputLength{0,};
   for (size_t offset{0,}; std::size(binaryInput) > offset; offset += block_size)
   {
      auto const blockLength{std::min(block_size, std::size(binaryInput) - offset),};
      outputLength += static_cast<size_t>(EVP_EncodeBlock(output + outputLength, input + offset, static_cast<int>(blockLength)));
   }
   return outputLength;
}

/// Expects validated, padded input; the result includes the zero bytes decoded from padding
template<size_t block_size = base64_decode_block_size, typename binary_output, typename string_input>
[[nodiscard]] bool base64_decode(binary_output &binaryOutput, string_input const &stringInput, size_t &bytesWritten)
{
   static_assert((0 < block_size) && (0 == (block_size % 4)) && (base64_decode_block_size >= block_size));
   assert((3 * (std::size(stringInput) / 4)) <= std::size(binaryOutput));
   auto const *input{std::bit_cast<uint8_t const *>(std::data(stringInput)),};
   auto *output{std::bit_cast<uint8_t *>(std::data(binaryOutput)),};
   bytesWritten = 0;
   for (size_t offset{0,}; std::size(stringInput) > offset; offset += block_size)
   {
      auto const blockLength{std::min(block_size, std::size(stringInput) - offset),};
      auto const returnCode{EVP_DecodeBlock(output + bytesWritten, input + offset, static_cast<int>(blockLength)),};
      if (0 > returnCode) [[unlikely]]
      {
         bytesWritten = 0;
         return false;
      }
      bytesWritten += static_cast<size_t>(returnCode);
   }
   return true;
}

}
