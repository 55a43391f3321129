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

#include "gssapi/gssapi_engine.hpp"
#include "gssapi/gssapi_error.hpp"

#include <negotiate/authentication_session.hpp>
#include <negotiate/credential.hpp>
#include <negotiate/negotiate_status.hpp>
#include <negotiate/session_config.hpp>
#include <negotiate/system_engine.hpp>

#include <gssapi/gssapi.h>

#include <memory>
#include <optional>
#include <string>

namespace negotiate::tests
{

namespace
{

using gssapi = testsuite;

}

TEST_F(gssapi, status_mapping)
{
   EXPECT_EQ(negotiate_status::completed, map_gssapi_status(GSS_S_COMPLETE));
   EXPECT_EQ(negotiate_status::continue_needed, map_gssapi_status(GSS_S_CONTINUE_NEEDED));
   EXPECT_EQ(negotiate_status::message_expired, map_gssapi_status(GSS_S_COMPLETE | GSS_S_DUPLICATE_TOKEN));
   EXPECT_EQ(negotiate_status::message_expired, map_gssapi_status(GSS_S_COMPLETE | GSS_S_UNSEQ_TOKEN));
   EXPECT_EQ(negotiate_status::unsupported, map_gssapi_status(GSS_S_BAD_MECH));
   EXPECT_EQ(negotiate_status::unsupported, map_gssapi_status(GSS_S_UNAVAILABLE));
   EXPECT_EQ(negotiate_status::target_unknown, map_gssapi_status(GSS_S_BAD_NAME));
   EXPECT_EQ(negotiate_status::target_unknown, map_gssapi_status(GSS_S_BAD_NAMETYPE));
   EXPECT_EQ(negotiate_status::invalid_token, map_gssapi_status(GSS_S_DEFECTIVE_TOKEN));
   EXPECT_EQ(negotiate_status::message_modified, map_gssapi_status(GSS_S_BAD_SIG));
   EXPECT_EQ(negotiate_status::unknown_credentials, map_gssapi_status(GSS_S_NO_CRED));
   EXPECT_EQ(negotiate_status::invalid_credentials, map_gssapi_status(GSS_S_DEFECTIVE_CREDENTIAL));
   EXPECT_EQ(negotiate_status::context_expired, map_gssapi_status(GSS_S_CREDENTIALS_EXPIRED));
   EXPECT_EQ(negotiate_status::context_expired, map_gssapi_status(GSS_S_CONTEXT_EXPIRED));
   EXPECT_EQ(negotiate_status::qop_not_supported, map_gssapi_status(GSS_S_BAD_QOP));
   EXPECT_EQ(negotiate_status::generic_failure, map_gssapi_status(GSS_S_FAILURE));
   EXPECT_EQ(negotiate_status::generic_failure, map_gssapi_status(GSS_S_CALL_INACCESSIBLE_READ));

   auto const testErrorCode{make_gssapi_error_code(GSS_S_BAD_SIG),};
   EXPECT_TRUE(testErrorCode);
   EXPECT_STREQ("gssapi", testErrorCode.category().name());
   EXPECT_FALSE(testErrorCode.message().empty());
}

TEST_F(gssapi, error_log_uses_gssapi_category)
{
   auto const testErrorCode{make_gssapi_error_code(GSS_S_BAD_SIG | GSS_S_DUPLICATE_TOKEN),};
   EXPECT_EQ(make_gssapi_error_code(GSS_S_BAD_SIG), testErrorCode);

   testing::internal::CaptureStderr();
   log_gssapi_error("[gssapi] wrap failed", GSS_S_BAD_SIG, 0, GSS_C_NO_OID);
   auto const testRecord{testing::internal::GetCapturedStderr(),};
   EXPECT_NE(std::string::npos, testRecord.find("[gssapi] wrap failed: ("));
   EXPECT_NE(std::string::npos, testRecord.find(testErrorCode.message()));
}

TEST_F(gssapi, package_and_service_names)
{
   EXPECT_NE(GSS_C_NO_OID, gssapi_mechanism("Negotiate"));
   EXPECT_EQ(gssapi_mechanism("Negotiate"), gssapi_mechanism("negotiate"));
   EXPECT_NE(GSS_C_NO_OID, gssapi_mechanism("Kerberos"));
   EXPECT_NE(GSS_C_NO_OID, gssapi_mechanism("NTLM"));
   EXPECT_NE(gssapi_mechanism("Kerberos"), gssapi_mechanism("NTLM"));
   EXPECT_EQ(GSS_C_NO_OID, gssapi_mechanism("Digest"));
   EXPECT_EQ(GSS_C_NO_OID, gssapi_mechanism(""));

   EXPECT_EQ("HTTP@localhost", gssapi_service_name("HTTP/localhost"));
   EXPECT_EQ("HTTP@localhost", gssapi_service_name("HTTP@localhost"));
   EXPECT_EQ("host@server.example.com", gssapi_service_name("host/server.example.com"));
   EXPECT_EQ("HTTP/localhost@EXAMPLE.COM", gssapi_service_name("HTTP/localhost@EXAMPLE.COM"));
}

TEST_F(gssapi, rejected_configuration)
{
   auto const testEngine{make_system_engine(),};
   ASSERT_NE(nullptr, testEngine);
   blob testOutgoingBlob{};

   authentication_session testUnknownPackage
   {
      testEngine,
      authentication_role::client,
      session_config{}.with_package("Digest").with_target_name("HTTP/localhost"),
   };
   EXPECT_EQ(negotiate_status::unsupported, testUnknownPackage.produce_next_blob(std::nullopt, testOutgoingBlob));
   EXPECT_EQ(authentication_phase::failed, testUnknownPackage.phase());

   authentication_session testNoTarget{testEngine, authentication_role::client, session_config{},};
   EXPECT_EQ(negotiate_status::target_unknown, testNoTarget.produce_next_blob(std::nullopt, testOutgoingBlob));
   EXPECT_EQ(authentication_phase::failed, testNoTarget.phase());
   EXPECT_TRUE(testOutgoingBlob.empty());

   authentication_session testNoUserName
   {
      testEngine,
      authentication_role::client,
      session_config{}.with_target_name("HTTP/localhost").with_credential(credential{"", "s3cret", "CORP",}),
   };
   EXPECT_EQ(negotiate_status::invalid_credentials, testNoUserName.produce_next_blob(std::nullopt, testOutgoingBlob));
   EXPECT_EQ(authentication_phase::failed, testNoUserName.phase());
}

}
