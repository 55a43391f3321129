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
#include "negotiate/negotiate_engine.hpp" ///< for negotiate::context_attributes, negotiate::negotiate_engine, negotiate::security_context_handle
#include "negotiate/negotiate_status.hpp" ///< for negotiate::negotiate_status
#include "negotiate/session_config.hpp" ///< for negotiate::authentication_role, negotiate::protection_level, negotiate::session_config

#include <cstdint> ///< for uint8_t
#include <memory> ///< for std::shared_ptr
#include <mutex> ///< for std::mutex
#include <optional> ///< for std::optional
#include <string> ///< for std::string
#include <string_view> ///< for std::string_view
#include <system_error> ///< for std::error_code

namespace negotiate
{

enum struct authentication_phase : uint8_t
{
   initialized,
   exchange_in_progress,
   completed,
   failed,
};

[[nodiscard]] std::string_view to_string(authentication_phase phase) noexcept;

/// One party's side of a challenge/response negotiation.
///
/// Every public member function is serialized by an internal mutex, yet the exchange itself is a strictly
/// sequential protocol: the caller relays each outgoing blob to the peer and waits for the answer before the
/// next produce_next_blob call. No network I/O happens here.
class authentication_session final
{
public:
   authentication_session() = delete;
   authentication_session(authentication_session &&) = delete;
   authentication_session(authentication_session const &) = delete;
   [[nodiscard]] authentication_session(std::shared_ptr<negotiate_engine> engine, authentication_role role, session_config config);
   ~authentication_session();

   authentication_session &operator = (authentication_session &&) = delete;
   authentication_session &operator = (authentication_session const &) = delete;

   [[nodiscard]] negotiate_status produce_next_blob(std::optional<blob_view> const &incomingBlob, blob &outgoingBlob);
   /// Same exchange for text protocols, blobs travel base64 encoded
   [[nodiscard]] negotiate_status produce_next_base64_blob(std::optional<std::string_view> const &incomingText, std::string &outgoingText);

   /// Outer protocol rejected the authentication, reason must be a failure status
   void abort(negotiate_status reason = negotiate_status::generic_failure);
   void dispose();

   [[nodiscard]] std::error_code protect(blob_view const &plaintext, blob &protectedMessage);
   [[nodiscard]] std::error_code unprotect(blob_view const &protectedMessage, blob &plaintext);

   [[nodiscard]] authentication_role role() const noexcept
   {
      return m_role;
   }

   [[nodiscard]] session_config const &config() const noexcept
   {
      return m_config;
   }

   [[nodiscard]] authentication_phase phase() const;
   [[nodiscard]] negotiate_status last_status() const;
   [[nodiscard]] std::optional<protection_level> negotiated_protection_level() const;
   [[nodiscard]] std::string negotiated_package() const;
   [[nodiscard]] std::string remote_identity() const;
   [[nodiscard]] bool is_mutually_authenticated() const;
   /// Protected messages must be unprotected in send order
   [[nodiscard]] bool requires_ordering() const;

private:
   std::shared_ptr<negotiate_engine> const m_engine;
   authentication_role const m_role;
   session_config const m_config;
   mutable std::mutex m_lock{};
   authentication_phase m_phase{authentication_phase::initialized,};
   negotiate_status m_lastStatus{negotiate_status::continue_needed,};
   security_context_handle m_securityContext{nullptr,};
   std::optional<context_attributes> m_contextAttributes{std::nullopt,};
   bool m_disposed{false,};

   [[nodiscard]] negotiate_status exchange(std::optional<blob_view> const &incomingBlob, blob &outgoingBlob);
   [[nodiscard]] bool is_exchange_finished() const noexcept;
   void fail(negotiate_status reason);
   [[nodiscard]] negotiate_status check_protection_ready() const;
};

}
