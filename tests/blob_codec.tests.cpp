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

#include "testsuite.hpp"
#if (defined(NEGOTIATE_OPENSSL))
#  include "openssl/base64.hpp"
#elif (defined(NEGOTIATE_SSPI))
#  include "windows/base64.hpp"
#endif

#include <negotiate/blob.hpp>
#include <negotiate/blob_codec.hpp>
#include <negotiate/negotiate_status.hpp>

#include <bit>
#include <cstddef>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>

namespace negotiate::tests
{

namespace
{

using blob_codec = testsuite;

[[nodiscard]] blob to_blob(std::string_view const &text)
{
   auto const *first{std::bit_cast<std::byte const *>(text.data()),};
   return blob{first, first + text.size(),};
}

}

TEST_F(blob_codec, known_vectors)
{
   constexpr std::pair<std::string_view, std::string_view> testVectors[] =
   {
      {"", ""},
      {"f", "Zg=="},
      {"fo", "Zm8="},
      {"foo", "Zm9v"},
      {"foob", "Zm9vYg=="},
      {"fooba", "Zm9vYmE="},
      {"foobar", "Zm9vYmFy"},
   };
   for (auto const &[testBytes, testText] : testVectors)
   {
      EXPECT_EQ(testText, encode_blob(to_blob(testBytes)));
      std::error_code testErrorCode{make_error_code(negotiate_status::generic_failure),};
      EXPECT_EQ(to_blob(testBytes), decode_blob(testText, testErrorCode)) << testText;
      EXPECT_FALSE(testErrorCode) << testText;
   }
}

TEST_F(blob_codec, round_trip)
{
   for (size_t testLength{0,}; 64 >= testLength; ++testLength)
   {
      auto const testBytes{random_bytes(testLength),};
      auto const testText{encode_blob(testBytes),};
      EXPECT_EQ(0, testText.size() % 4);
      std::error_code testErrorCode{};
      EXPECT_EQ(testBytes, decode_blob(testText, testErrorCode));
      EXPECT_FALSE(testErrorCode);
   }
}

TEST_F(blob_codec, malformed_text)
{
   constexpr std::string_view testTexts[] =
   {
      "not-valid-base64!!",
      "Zm9",
      "Zm9vY",
      "Z===",
      "Zh==",
      "Zm9=",
      "Zg==Zg==",
      "Zm9v\n",
      "Zm 9",
      "Zm9v-_==",
   };
   for (auto const &testText : testTexts)
   {
      std::error_code testErrorCode{};
      EXPECT_TRUE(decode_blob(testText, testErrorCode).empty()) << testText;
      EXPECT_EQ(make_error_code(negotiate_status::invalid_token), testErrorCode) << testText;
   }
}

TEST_F(blob_codec, block_wise_encoding_matches_single_pass)
{
   constexpr size_t testEncodeBlockSize{6,};
   constexpr size_t testDecodeBlockSize{8,};
   for (size_t testSize{0,}; 64 >= testSize; ++testSize)
   {
      auto const testBytes{random_bytes(testSize),};
      auto const testText{encode_blob(testBytes),};

      std::string testBlockText(4 * ((testSize + 2) / 3) + 1, '\0');
      testBlockText.resize(base64_encode<testEncodeBlockSize>(testBlockText, testBytes));
      EXPECT_EQ(testText, testBlockText);

      blob testBlockBytes(3 * (testText.size() / 4));
      size_t testBytesWritten{0,};
      ASSERT_TRUE(base64_decode<testDecodeBlockSize>(testBlockBytes, testText, testBytesWritten));
      ASSERT_LE(testSize, testBytesWritten);
      testBlockBytes.resize(testSize);
      EXPECT_EQ(testBytes, testBlockBytes);
   }
}

}
