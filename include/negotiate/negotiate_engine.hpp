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
#include "negotiate/negotiate_status.hpp" ///< for negotiate::negotiate_status
#include "negotiate/session_config.hpp" ///< for negotiate::authentication_role, negotiate::protection_level, negotiate::session_config

#include <cassert> ///< for assert
#include <memory> ///< for std::addressof, std::unique_ptr
#include <optional> ///< for std::optional
#include <string> ///< for std::string
#include <system_error> ///< for std::error_code

namespace negotiate
{

/// Engine-defined per-party state, created by create_context and destroyed by release_context only
class security_context
{
public:
   security_context(security_context &&) = delete;
   security_context(security_context const &) = delete;

   security_context &operator = (security_context &&) = delete;
   security_context &operator = (security_context const &) = delete;

protected:
   [[nodiscard]] security_context() noexcept = default;
   ~security_context() = default;
};

class negotiate_engine;

/// Deleter handing a context back to release_context of the engine that created it
class security_context_release final
{
public:
   [[nodiscard]] constexpr security_context_release() noexcept = default;
   [[nodiscard]] constexpr security_context_release(security_context_release &&) noexcept = default;
   [[nodiscard]] constexpr security_context_release(security_context_release const &) noexcept = default;

   [[nodiscard]] explicit constexpr security_context_release(negotiate_engine &engine) noexcept :
      m_engine{std::addressof(engine),}
   {}

   constexpr security_context_release &operator = (security_context_release &&) noexcept = default;
   constexpr security_context_release &operator = (security_context_release const &) noexcept = default;

   void operator () (security_context *securityContext) const noexcept;

private:
   negotiate_engine *m_engine{nullptr,};
};

using security_context_handle = std::unique_ptr<security_context, security_context_release>;

/// What the engine reports about an established context
struct context_attributes final
{
   protection_level protectionLevel{protection_level::none,};
   bool sequenceDetect{false,};
   bool replayDetect{false,};
   bool mutualAuthentication{false,};
   std::string negotiatedPackage{};
   std::string remoteIdentity{};
};

/// Opaque negotiation engine (GSSAPI, SSPI or a test double).
/// A single engine may serve any number of sessions, each context is driven by one session at a time.
class negotiate_engine
{
public:
   negotiate_engine(negotiate_engine &&) = delete;
   negotiate_engine(negotiate_engine const &) = delete;
   virtual ~negotiate_engine() = default;

   negotiate_engine &operator = (negotiate_engine &&) = delete;
   negotiate_engine &operator = (negotiate_engine const &) = delete;

   /// Resolves the credential and prepares a context.
   /// securityContext arrives empty, bound to this engine, and takes ownership through reset() as soon as the context exists.
   [[nodiscard]] virtual std::error_code create_context(
      authentication_role role,
      session_config const &config,
      security_context_handle &securityContext
   ) = 0;

   /// Consumes the peer token (absent on the first client step) and produces the next local token.
   /// Fills contextAttributes when the result is negotiate_status::completed.
   [[nodiscard]] virtual negotiate_status step(
      security_context &securityContext,
      std::optional<blob_view> const &incomingBlob,
      blob &outgoingBlob,
      context_attributes &contextAttributes
   ) = 0;

   [[nodiscard]] virtual std::error_code sign(security_context &securityContext, blob_view const &input, blob &output) = 0;
   [[nodiscard]] virtual std::error_code verify(security_context &securityContext, blob_view const &input, blob &output) = 0;
   [[nodiscard]] virtual std::error_code seal(security_context &securityContext, blob_view const &input, blob &output) = 0;
   [[nodiscard]] virtual std::error_code unseal(security_context &securityContext, blob_view const &input, blob &output) = 0;

   /// Tears down the native state and frees a context created by this engine
   virtual void release_context(security_context &securityContext) noexcept = 0;

protected:
   [[nodiscard]] negotiate_engine() noexcept = default;
};

inline void security_context_release::operator () (security_context *const securityContext) const noexcept
{
   assert(nullptr != m_engine);
   m_engine->release_context(*securityContext);
}

}
