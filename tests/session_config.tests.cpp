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

#include <negotiate/credential.hpp>
#include <negotiate/session_config.hpp>

#include <string_view>
#include <utility>

namespace negotiate::tests
{

namespace
{

using config = testsuite;

}

TEST_F(config, defaults)
{
   session_config const testConfig{};
   EXPECT_EQ("Negotiate", testConfig.package());
   EXPECT_TRUE(testConfig.credential().is_default());
   EXPECT_TRUE(testConfig.target_name().empty());
   EXPECT_EQ(protection_level::none, testConfig.required_protection_level());
}

TEST_F(config, builders)
{
   auto const testUserName{random_string(1, 16),};
   auto const testPassword{random_string(1, 16),};
   session_config const testDefaultConfig{};
   auto const testConfig
   {
      testDefaultConfig
         .with_package("Kerberos")
         .with_credential(credential{testUserName, testPassword, "EXAMPLE.COM",})
         .with_target_name("HTTP/localhost")
         .with_required_protection_level(protection_level::encrypt_and_sign)
   };
   EXPECT_EQ("Kerberos", testConfig.package());
   EXPECT_FALSE(testConfig.credential().is_default());
   EXPECT_EQ(testUserName, testConfig.credential().user_name());
   EXPECT_EQ(testPassword, testConfig.credential().password());
   EXPECT_EQ("EXAMPLE.COM", testConfig.credential().domain());
   EXPECT_EQ("HTTP/localhost", testConfig.target_name());
   EXPECT_EQ(protection_level::encrypt_and_sign, testConfig.required_protection_level());

   EXPECT_EQ("Negotiate", testDefaultConfig.package());
   EXPECT_TRUE(testDefaultConfig.credential().is_default());
   EXPECT_TRUE(testDefaultConfig.target_name().empty());
   EXPECT_EQ(protection_level::none, testDefaultConfig.required_protection_level());
}

TEST_F(config, names)
{
   EXPECT_EQ("client", to_string(authentication_role::client));
   EXPECT_EQ("server", to_string(authentication_role::server));
   EXPECT_EQ("none", to_string(protection_level::none));
   EXPECT_EQ("sign", to_string(protection_level::sign));
   EXPECT_EQ("encrypt_and_sign", to_string(protection_level::encrypt_and_sign));
   EXPECT_LT(protection_level::none, protection_level::sign);
   EXPECT_LT(protection_level::sign, protection_level::encrypt_and_sign);
}

}
