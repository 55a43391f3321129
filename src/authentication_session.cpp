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

#include "common/logger.hpp" ///< for negotiate::log_error, negotiate::log_system_error
#include "common/utility.hpp" ///< for negotiate::to_underlying, negotiate::unreachable
#include "message_protection.hpp" ///< for negotiate::protect_message, negotiate::unprotect_message
#include "negotiate/authentication_session.hpp" ///< for negotiate::authentication_phase, negotiate::authentication_session
#include "negotiate/blob.hpp" ///< for negotiate::blob, negotiate::blob_view
#include "negotiate/blob_codec.hpp" ///< for negotiate::decode_blob, negotiate::encode_blob
#include "negotiate/negotiate_engine.hpp" ///< for negotiate::context_attributes, negotiate::security_context_handle, negotiate::security_context_release
#include "negotiate/negotiate_status.hpp" ///< for negotiate::is_failure, negotiate::make_error_code, negotiate::negotiate_status

#include <cassert> ///< for assert
#include <memory> ///< for std::shared_ptr
#include <mutex> ///< for std::scoped_lock
#include <optional> ///< for std::nullopt, std::optional
#include <source_location> ///< for std::source_location
#include <string> ///< for std::string
#include <string_view> ///< for std::string_view
#include <system_error> ///< for std::error_code
#include <utility> ///< for std::move

namespace negotiate
{

std::string_view to_string(authentication_phase const phase) noexcept
{
   switch (phase)
   {
   case authentication_phase::initialized: return std::string_view{"initialized",};
   case authentication_phase::exchange_in_progress: return std::string_view{"exchange_in_progress",};
   case authentication_phase::completed: return std::string_view{"completed",};
   case authentication_phase::failed: return std::string_view{"failed",};
   }
   unreachable();
}

authentication_session::authentication_session(
   std::shared_ptr<negotiate_engine> engine,
   authentication_role const role,
   session_config config
) :
   m_engine{std::move(engine),},
   m_role{role,},
   m_config{std::move(config),}
{
   assert(nullptr != m_engine);
}

authentication_session::~authentication_session() = default;

negotiate_status authentication_session::produce_next_blob(std::optional<blob_view> const &incomingBlob, blob &outgoingBlob)
{
   [[maybe_unused]] std::scoped_lock const sessionGuard{m_lock,};
   return exchange(incomingBlob, outgoingBlob);
}

negotiate_status authentication_session::produce_next_base64_blob(
   std::optional<std::string_view> const &incomingText,
   std::string &outgoingText
)
{
   [[maybe_unused]] std::scoped_lock const sessionGuard{m_lock,};
   outgoingText.clear();
   blob outgoingBlob{};
   if (false == incomingText.has_value())
   {
      auto const status{exchange(std::nullopt, outgoingBlob),};
      outgoingText = encode_blob(outgoingBlob);
      return status;
   }
   if (true == is_exchange_finished())
   {
      return exchange(std::nullopt, outgoingBlob);
   }
   std::error_code errorCode{};
   auto const incomingBlob{decode_blob(incomingText.value(), errorCode),};
   if (true == bool{errorCode,})
   {
      fail(negotiate_status::invalid_token);
      return m_lastStatus;
   }
   auto const status{exchange(blob_view{incomingBlob,}, outgoingBlob),};
   outgoingText = encode_blob(outgoingBlob);
   return status;
}

void authentication_session::abort(negotiate_status const reason)
{
   [[maybe_unused]] std::scoped_lock const sessionGuard{m_lock,};
   if (true == is_exchange_finished())
   {
      return;
   }
   fail((true == is_failure(reason)) ? reason : negotiate_status::generic_failure);
}

void authentication_session::dispose()
{
   [[maybe_unused]] std::scoped_lock const sessionGuard{m_lock,};
   if (true == m_disposed)
   {
      return;
   }
   m_disposed = true;
   if (false == is_exchange_finished())
   {
      m_phase = authentication_phase::failed;
      m_lastStatus = negotiate_status::generic_failure;
   }
   m_securityContext.reset();
}

std::error_code authentication_session::protect(blob_view const &plaintext, blob &protectedMessage)
{
   [[maybe_unused]] std::scoped_lock const sessionGuard{m_lock,};
   protectedMessage.clear();
   if (auto const status{check_protection_ready(),}; negotiate_status::completed != status)
   {
      return make_error_code(status);
   }
   return protect_message(*m_engine, *m_securityContext, m_contextAttributes->protectionLevel, plaintext, protectedMessage);
}

std::error_code authentication_session::unprotect(blob_view const &protectedMessage, blob &plaintext)
{
   [[maybe_unused]] std::scoped_lock const sessionGuard{m_lock,};
   plaintext.clear();
   if (auto const status{check_protection_ready(),}; negotiate_status::completed != status)
   {
      return make_error_code(status);
   }
   return unprotect_message(*m_engine, *m_securityContext, m_contextAttributes->protectionLevel, protectedMessage, plaintext);
}

authentication_phase authentication_session::phase() const
{
   [[maybe_unused]] std::scoped_lock const sessionGuard{m_lock,};
   return m_phase;
}

negotiate_status authentication_session::last_status() const
{
   [[maybe_unused]] std::scoped_lock const sessionGuard{m_lock,};
   return m_lastStatus;
}

std::optional<protection_level> authentication_session::negotiated_protection_level() const
{
   [[maybe_unused]] std::scoped_lock const sessionGuard{m_lock,};
   if (false == m_contextAttributes.has_value())
   {
      return std::nullopt;
   }
   return m_contextAttributes->protectionLevel;
}

std::string authentication_session::negotiated_package() const
{
   [[maybe_unused]] std::scoped_lock const sessionGuard{m_lock,};
   return (true == m_contextAttributes.has_value()) ? m_contextAttributes->negotiatedPackage : std::string{};
}

std::string authentication_session::remote_identity() const
{
   [[maybe_unused]] std::scoped_lock const sessionGuard{m_lock,};
   return (true == m_contextAttributes.has_value()) ? m_contextAttributes->remoteIdentity : std::string{};
}

bool authentication_session::is_mutually_authenticated() const
{
   [[maybe_unused]] std::scoped_lock const sessionGuard{m_lock,};
   return (true == m_contextAttributes.has_value()) && (true == m_contextAttributes->mutualAuthentication);
}

bool authentication_session::requires_ordering() const
{
   [[maybe_unused]] std::scoped_lock const sessionGuard{m_lock,};
   return (true == m_contextAttributes.has_value()) && (true == m_contextAttributes->sequenceDetect);
}

negotiate_status authentication_session::exchange(std::optional<blob_view> const &incomingBlob, blob &outgoingBlob)
{
   outgoingBlob.clear();
   if (true == is_exchange_finished())
   {
      log_error(
         std::source_location::current(),
         "[negotiate] ",
         to_string(m_role),
         " exchange requested in phase ",
         to_string(m_phase)
      );
      return negotiate_status::invalid_operation;
   }
   if (nullptr == m_securityContext)
   {
      assert(authentication_phase::initialized == m_phase);
      security_context_handle securityContext{nullptr, security_context_release{*m_engine,},};
      if (auto const errorCode{m_engine->create_context(m_role, m_config, securityContext),}; true == bool{errorCode,})
      {
         if (negotiate_category() != errorCode.category())
         {
            log_system_error("[negotiate] failed to create security context", errorCode);
         }
         auto const reason{to_negotiate_status(errorCode),};
         fail((true == is_failure(reason)) ? reason : negotiate_status::generic_failure);
         return m_lastStatus;
      }
      assert(nullptr != securityContext);
      m_securityContext = std::move(securityContext);
   }
   context_attributes contextAttributes{};
   auto const status{m_engine->step(*m_securityContext, incomingBlob, outgoingBlob, contextAttributes),};
   switch (status)
   {
   case negotiate_status::continue_needed:
   {
      m_phase = authentication_phase::exchange_in_progress;
      m_lastStatus = status;
   }
   break;

   case negotiate_status::completed:
   {
      if (contextAttributes.protectionLevel < m_config.required_protection_level())
      {
         log_error(
            std::source_location::current(),
            "[negotiate] ",
            to_string(m_role),
            " negotiated protection level ",
            to_string(contextAttributes.protectionLevel),
            " does not satisfy required level ",
            to_string(m_config.required_protection_level())
         );
         outgoingBlob.clear();
         fail(negotiate_status::qop_not_supported);
         break;
      }
      m_contextAttributes = std::move(contextAttributes);
      m_phase = authentication_phase::completed;
      m_lastStatus = status;
   }
   break;

   default:
   {
      outgoingBlob.clear();
      fail(status);
   }
   break;
   }
   return m_lastStatus;
}

bool authentication_session::is_exchange_finished() const noexcept
{
   return (authentication_phase::completed == m_phase) || (authentication_phase::failed == m_phase);
}

void authentication_session::fail(negotiate_status const reason)
{
   assert(true == is_failure(reason));
   log_error(
      std::source_location::current(),
      "[negotiate] ",
      to_string(m_role),
      " authentication with package '",
      m_config.package(),
      "' failed: (",
      to_underlying(reason),
      ") - ",
      make_error_code(reason).message()
   );
   m_phase = authentication_phase::failed;
   m_lastStatus = reason;
   m_contextAttributes.reset();
   m_securityContext.reset();
}

negotiate_status authentication_session::check_protection_ready() const
{
   if ((authentication_phase::completed != m_phase) || (true == m_disposed) || (nullptr == m_securityContext))
   {
      return negotiate_status::invalid_operation;
   }
   assert(true == m_contextAttributes.has_value());
   return negotiate_status::completed;
}

}
