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

#include "loopback_engine.hpp"
#include "testsuite.hpp"

#include <negotiate/authentication_session.hpp>
#include <negotiate/blob.hpp>
#include <negotiate/negotiate_status.hpp>
#include <negotiate/session_config.hpp>

#include <atomic>
#include <cstddef>
#include <initializer_list>
#include <memory>
#include <optional>
#include <string>
#include <system_error>
#include <thread>
#include <vector>

namespace negotiate::tests
{

namespace
{

using exchange = testsuite;

constexpr size_t test_max_round_trips{8,};

[[nodiscard]] session_config make_client_config(protection_level const testLevel)
{
   return session_config{}
      .with_package("Negotiate")
      .with_target_name("HTTP/localhost")
      .with_required_protection_level(testLevel)
   ;
}

/// Alternates blobs between both parties, false when either fails or the round trip budget runs out
[[nodiscard]] bool exchange_until_complete(authentication_session &testClient, authentication_session &testServer)
{
   blob testClientBlob{};
   blob testServerBlob{};
   auto testClientStatus{testClient.produce_next_blob(std::nullopt, testClientBlob),};
   auto testServerStatus{negotiate_status::continue_needed,};
   for (size_t testRoundTrip{0,}; test_max_round_trips > testRoundTrip; ++testRoundTrip)
   {
      if ((true == is_failure(testClientStatus)) || (true == is_failure(testServerStatus)))
      {
         return false;
      }
      if (negotiate_status::continue_needed == testServerStatus)
      {
         testServerStatus = testServer.produce_next_blob(blob_view{testClientBlob,}, testServerBlob);
      }
      if ((negotiate_status::completed == testClientStatus) && (negotiate_status::completed == testServerStatus))
      {
         return true;
      }
      if (negotiate_status::continue_needed == testClientStatus)
      {
         testClientStatus = testClient.produce_next_blob(blob_view{testServerBlob,}, testClientBlob);
      }
      if ((negotiate_status::completed == testClientStatus) && (negotiate_status::completed == testServerStatus))
      {
         return true;
      }
   }
   return false;
}

[[nodiscard]] bool exchange_base64_until_complete(authentication_session &testClient, authentication_session &testServer)
{
   std::string testClientText{};
   std::string testServerText{};
   auto testClientStatus{testClient.produce_next_base64_blob(std::nullopt, testClientText),};
   auto testServerStatus{negotiate_status::continue_needed,};
   for (size_t testRoundTrip{0,}; test_max_round_trips > testRoundTrip; ++testRoundTrip)
   {
      if ((true == is_failure(testClientStatus)) || (true == is_failure(testServerStatus)))
      {
         return false;
      }
      if (negotiate_status::continue_needed == testServerStatus)
      {
         testServerStatus = testServer.produce_next_base64_blob(testClientText, testServerText);
      }
      if ((negotiate_status::completed == testClientStatus) && (negotiate_status::completed == testServerStatus))
      {
         return true;
      }
      if (negotiate_status::continue_needed == testClientStatus)
      {
         testClientStatus = testClient.produce_next_base64_blob(testServerText, testClientText);
      }
      if ((negotiate_status::completed == testClientStatus) && (negotiate_status::completed == testServerStatus))
      {
         return true;
      }
   }
   return false;
}

}

TEST_F(exchange, two_party_scenario)
{
   auto testEngine{std::make_shared<loopback_engine>(),};
   {
      authentication_session testServer{testEngine, authentication_role::server, session_config{},};
      authentication_session testClient{testEngine, authentication_role::client, make_client_config(protection_level::sign),};

      blob testClientBlob{};
      ASSERT_EQ(negotiate_status::continue_needed, testClient.produce_next_blob(std::nullopt, testClientBlob));
      EXPECT_FALSE(testClientBlob.empty());
      EXPECT_EQ(authentication_phase::exchange_in_progress, testClient.phase());
      blob testServerBlob{};
      auto const testServerStatus{testServer.produce_next_blob(blob_view{testClientBlob,}, testServerBlob),};
      ASSERT_TRUE((negotiate_status::continue_needed == testServerStatus) || (negotiate_status::completed == testServerStatus));
      EXPECT_EQ(size_t{2}, testEngine->live_contexts());
   }
   EXPECT_EQ(size_t{0}, testEngine->live_contexts());

   authentication_session testServer{testEngine, authentication_role::server, session_config{},};
   authentication_session testClient{testEngine, authentication_role::client, make_client_config(protection_level::sign),};
   ASSERT_TRUE(exchange_until_complete(testClient, testServer));
   EXPECT_EQ(authentication_phase::completed, testClient.phase());
   EXPECT_EQ(authentication_phase::completed, testServer.phase());
   ASSERT_TRUE(testClient.negotiated_protection_level().has_value());
   EXPECT_GE(testClient.negotiated_protection_level().value(), protection_level::sign);
   EXPECT_EQ(testClient.negotiated_protection_level(), testServer.negotiated_protection_level());
   EXPECT_EQ("Negotiate", testClient.negotiated_package());
   EXPECT_EQ("HTTP/localhost", testClient.remote_identity());
   EXPECT_EQ(loopback_engine::identity(), testServer.remote_identity());
   EXPECT_TRUE(testClient.is_mutually_authenticated());
   EXPECT_TRUE(testClient.requires_ordering());
   EXPECT_TRUE(testServer.requires_ordering());

   blob testOutgoingBlob{};
   EXPECT_EQ(negotiate_status::invalid_operation, testClient.produce_next_blob(std::nullopt, testOutgoingBlob));
   EXPECT_EQ(negotiate_status::invalid_operation, testServer.produce_next_blob(std::nullopt, testOutgoingBlob));
}

TEST_F(exchange, protect_unprotect_round_trip)
{
   for (auto const testLevel : {protection_level::sign, protection_level::encrypt_and_sign,})
   {
      auto testEngine{std::make_shared<loopback_engine>(testLevel),};
      authentication_session testServer{testEngine, authentication_role::server, session_config{}.with_required_protection_level(testLevel),};
      authentication_session testClient{testEngine, authentication_role::client, make_client_config(testLevel),};
      ASSERT_TRUE(exchange_until_complete(testClient, testServer));
      EXPECT_EQ(testLevel, testClient.negotiated_protection_level().value());

      std::vector<blob> testPayloads{blob{},};
      for (auto testIteration{0,}; 16 > testIteration; ++testIteration)
      {
         testPayloads.push_back(random_bytes(0, 512));
      }
      for (auto const &testPayload : testPayloads)
      {
         blob testProtectedMessage{};
         ASSERT_FALSE(testClient.protect(testPayload, testProtectedMessage));
         EXPECT_LT(testPayload.size(), testProtectedMessage.size());
         blob testPlaintext{};
         ASSERT_FALSE(testServer.unprotect(testProtectedMessage, testPlaintext));
         EXPECT_EQ(testPayload, testPlaintext);

         ASSERT_FALSE(testServer.protect(testPayload, testProtectedMessage));
         ASSERT_FALSE(testClient.unprotect(testProtectedMessage, testPlaintext));
         EXPECT_EQ(testPayload, testPlaintext);
      }
   }
}

TEST_F(exchange, tampered_replayed_and_reordered_messages)
{
   for (auto const testLevel : {protection_level::sign, protection_level::encrypt_and_sign,})
   {
      auto testEngine{std::make_shared<loopback_engine>(testLevel),};
      authentication_session testServer{testEngine, authentication_role::server, session_config{},};
      authentication_session testClient{testEngine, authentication_role::client, make_client_config(testLevel),};
      ASSERT_TRUE(exchange_until_complete(testClient, testServer));

      auto const testPayload{random_bytes(1, 128),};
      blob testProtectedMessage{};
      ASSERT_FALSE(testClient.protect(testPayload, testProtectedMessage));
      auto testTamperedMessage{testProtectedMessage,};
      testTamperedMessage[random_number<size_t>(0, testTamperedMessage.size() - 1)] ^= std::byte{0x01,};
      blob testPlaintext{};
      EXPECT_EQ(make_error_code(negotiate_status::message_modified), testServer.unprotect(testTamperedMessage, testPlaintext));
      EXPECT_TRUE(testPlaintext.empty());
      testTamperedMessage.resize(testProtectedMessage.size() / 4);
      EXPECT_EQ(make_error_code(negotiate_status::message_modified), testServer.unprotect(testTamperedMessage, testPlaintext));

      ASSERT_FALSE(testServer.unprotect(testProtectedMessage, testPlaintext));
      EXPECT_EQ(testPayload, testPlaintext);
      EXPECT_EQ(make_error_code(negotiate_status::message_expired), testServer.unprotect(testProtectedMessage, testPlaintext));
      EXPECT_TRUE(testPlaintext.empty());

      blob testFirstMessage{};
      blob testSecondMessage{};
      ASSERT_FALSE(testClient.protect(testPayload, testFirstMessage));
      ASSERT_FALSE(testClient.protect(testPayload, testSecondMessage));
      EXPECT_EQ(make_error_code(negotiate_status::message_expired), testServer.unprotect(testSecondMessage, testPlaintext));
      ASSERT_FALSE(testServer.unprotect(testFirstMessage, testPlaintext));
      ASSERT_FALSE(testServer.unprotect(testSecondMessage, testPlaintext));
      EXPECT_EQ(testPayload, testPlaintext);

      /// A message protected by the server cannot be looped back to the server
      ASSERT_FALSE(testServer.protect(testPayload, testProtectedMessage));
      EXPECT_EQ(make_error_code(negotiate_status::message_modified), testServer.unprotect(testProtectedMessage, testPlaintext));

      EXPECT_EQ(authentication_phase::completed, testClient.phase());
      EXPECT_EQ(authentication_phase::completed, testServer.phase());
   }
}

TEST_F(exchange, required_protection_level_not_met)
{
   auto testEngine{std::make_shared<loopback_engine>(protection_level::sign),};
   authentication_session testServer{testEngine, authentication_role::server, session_config{},};
   authentication_session testClient{testEngine, authentication_role::client, make_client_config(protection_level::encrypt_and_sign),};
   EXPECT_FALSE(exchange_until_complete(testClient, testServer));
   EXPECT_EQ(authentication_phase::failed, testClient.phase());
   EXPECT_EQ(negotiate_status::qop_not_supported, testClient.last_status());
   EXPECT_EQ(authentication_phase::exchange_in_progress, testServer.phase());
   EXPECT_EQ(size_t{1}, testEngine->live_contexts());

   testServer.abort(negotiate_status::qop_not_supported);
   EXPECT_EQ(authentication_phase::failed, testServer.phase());
   EXPECT_EQ(size_t{0}, testEngine->live_contexts());
}

TEST_F(exchange, protection_not_negotiated)
{
   auto testEngine{std::make_shared<loopback_engine>(protection_level::none),};
   authentication_session testServer{testEngine, authentication_role::server, session_config{},};
   authentication_session testClient{testEngine, authentication_role::client, make_client_config(protection_level::none),};
   ASSERT_TRUE(exchange_until_complete(testClient, testServer));
   EXPECT_EQ(protection_level::none, testClient.negotiated_protection_level().value());
   EXPECT_FALSE(testClient.requires_ordering());
   auto const testPayload{random_bytes(0, 64),};
   blob testProtectedMessage{};
   EXPECT_EQ(make_error_code(negotiate_status::not_supported), testClient.protect(testPayload, testProtectedMessage));
   EXPECT_EQ(make_error_code(negotiate_status::not_supported), testServer.unprotect(testPayload, testProtectedMessage));
}

TEST_F(exchange, base64_exchange)
{
   auto testEngine{std::make_shared<loopback_engine>(),};
   authentication_session testServer{testEngine, authentication_role::server, session_config{},};
   authentication_session testClient{testEngine, authentication_role::client, make_client_config(protection_level::encrypt_and_sign),};
   ASSERT_TRUE(exchange_base64_until_complete(testClient, testServer));
   EXPECT_EQ(protection_level::encrypt_and_sign, testServer.negotiated_protection_level().value());
   auto const testPayload{random_bytes(0, 128),};
   blob testProtectedMessage{};
   ASSERT_FALSE(testServer.protect(testPayload, testProtectedMessage));
   blob testPlaintext{};
   ASSERT_FALSE(testClient.unprotect(testProtectedMessage, testPlaintext));
   EXPECT_EQ(testPayload, testPlaintext);
}

TEST_F(exchange, rejected_configuration_and_tokens)
{
   auto testEngine{std::make_shared<loopback_engine>(),};
   blob testOutgoingBlob{};

   authentication_session testUnknownPackage{testEngine, authentication_role::client, make_client_config(protection_level::none).with_package("Digest"),};
   EXPECT_EQ(negotiate_status::unsupported, testUnknownPackage.produce_next_blob(std::nullopt, testOutgoingBlob));
   EXPECT_EQ(authentication_phase::failed, testUnknownPackage.phase());

   authentication_session testNoTarget{testEngine, authentication_role::client, session_config{},};
   EXPECT_EQ(negotiate_status::target_unknown, testNoTarget.produce_next_blob(std::nullopt, testOutgoingBlob));
   EXPECT_EQ(authentication_phase::failed, testNoTarget.phase());

   authentication_session testServer{testEngine, authentication_role::server, session_config{},};
   EXPECT_EQ(negotiate_status::continue_needed, testServer.produce_next_blob(std::nullopt, testOutgoingBlob));
   EXPECT_TRUE(testOutgoingBlob.empty());
   auto const testGarbage{random_bytes(64, 128),};
   EXPECT_EQ(negotiate_status::invalid_token, testServer.produce_next_blob(blob_view{testGarbage,}, testOutgoingBlob));
   EXPECT_TRUE(testOutgoingBlob.empty());
   EXPECT_EQ(authentication_phase::failed, testServer.phase());
   EXPECT_EQ(size_t{0}, testEngine->live_contexts());
}

TEST_F(exchange, mismatched_identities)
{
   auto testClientEngine{std::make_shared<loopback_engine>(),};
   auto testServerEngine{std::make_shared<loopback_engine>(),};
   authentication_session testServer{testServerEngine, authentication_role::server, session_config{},};
   authentication_session testClient{testClientEngine, authentication_role::client, make_client_config(protection_level::sign),};
   EXPECT_FALSE(exchange_until_complete(testClient, testServer));
   EXPECT_EQ(authentication_phase::failed, testClient.phase());
   EXPECT_EQ(negotiate_status::invalid_credentials, testClient.last_status());
   EXPECT_EQ(size_t{0}, testClientEngine->live_contexts());
}

TEST_F(exchange, shared_engine_across_threads)
{
   auto testEngine{std::make_shared<loopback_engine>(),};
   std::atomic<size_t> testCompletedPairs{0,};
   std::vector<std::thread> testThreads{};
   constexpr size_t testThreadsCount{4,};
   for (size_t testThreadIndex{0,}; testThreadsCount > testThreadIndex; ++testThreadIndex)
   {
      testThreads.emplace_back(
         [testEngine, &testCompletedPairs] ()
         {
            for (auto testIteration{0,}; 32 > testIteration; ++testIteration)
            {
               authentication_session testServer{testEngine, authentication_role::server, session_config{},};
               authentication_session testClient{testEngine, authentication_role::client, make_client_config(protection_level::encrypt_and_sign),};
               if (false == exchange_until_complete(testClient, testServer))
               {
                  return;
               }
               blob const testPayload(static_cast<size_t>(testIteration), std::byte{0x42,});
               blob testProtectedMessage{};
               blob testPlaintext{};
               if (
                  false
                  || (true == bool{testClient.protect(testPayload, testProtectedMessage),})
                  || (true == bool{testServer.unprotect(testProtectedMessage, testPlaintext),})
                  || (testPayload != testPlaintext)
               )
               {
                  return;
               }
            }
            testCompletedPairs.fetch_add(1, std::memory_order_relaxed);
         }
      );
   }
   for (auto &testThread : testThreads)
   {
      testThread.join();
   }
   EXPECT_EQ(testThreadsCount, testCompletedPairs.load(std::memory_order_relaxed));
   EXPECT_EQ(size_t{0}, testEngine->live_contexts());
}

}
