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
#include "negotiate/negotiate_engine.hpp" ///< for negotiate::context_attributes, negotiate::negotiate_engine, negotiate::security_context, negotiate::security_context_handle
#include "negotiate/negotiate_status.hpp" ///< for negotiate::negotiate_status
#include "negotiate/session_config.hpp" ///< for negotiate::authentication_role, negotiate::session_config

#include <Windows.h> ///< for security.h
/// for
///   CredHandle,
///   CtxtHandle,
///   SecPkgContext_Sizes,
///   ULONG
#include <security.h>

#include <optional> ///< for std::optional
#include <string> ///< for std::wstring
#include <string_view> ///< for std::string_view, std::wstring_view
#include <system_error> ///< for std::error_code

namespace negotiate
{

struct sspi_security_context final : public security_context
{
   [[nodiscard]] sspi_security_context() noexcept = default;
   ~sspi_security_context();

   authentication_role role{authentication_role::client,};
   std::wstring package{};
   std::wstring targetName{};
   ULONG requestFlags{0,};
   CredHandle credentialHandle{.dwLower = 0, .dwUpper = 0,};
   bool hasCredential{false,};
   CtxtHandle contextHandle{.dwLower = 0, .dwUpper = 0,};
   bool hasContext{false,};
   bool streamUnsupported{false,};
   SecPkgContext_Sizes sizes{.cbMaxToken = 0, .cbMaxSignature = 0, .cbBlockSize = 0, .cbSecurityTrailer = 0,};
};

/// Canonical SSPI package name, empty when the package is unknown
[[nodiscard]] std::wstring_view sspi_package(std::string_view const &package) noexcept;

class sspi_engine final : public negotiate_engine
{
public:
   [[nodiscard]] sspi_engine() noexcept = default;
   ~sspi_engine() override = default;

   [[nodiscard]] std::error_code create_context(
      authentication_role role,
      session_config const &config,
      security_context_handle &securityContext
   ) override;

   [[nodiscard]] negotiate_status step(
      security_context &securityContext,
      std::optional<blob_view> const &incomingBlob,
      blob &outgoingBlob,
      context_attributes &contextAttributes
   ) override;

   [[nodiscard]] std::error_code sign(security_context &securityContext, blob_view const &input, blob &output) override;
   [[nodiscard]] std::error_code verify(security_context &securityContext, blob_view const &input, blob &output) override;
   [[nodiscard]] std::error_code seal(security_context &securityContext, blob_view const &input, blob &output) override;
   [[nodiscard]] std::error_code unseal(security_context &securityContext, blob_view const &input, blob &output) override;

   void release_context(security_context &securityContext) noexcept override;

private:
   [[nodiscard]] std::error_code acquire_credential(sspi_security_context &securityContext, session_config const &config);
   [[nodiscard]] std::error_code query_attributes(sspi_security_context &securityContext, ULONG contextFlags, context_attributes &contextAttributes);
   [[nodiscard]] std::error_code wrap(sspi_security_context &securityContext, blob_view const &input, bool encrypt, blob &output);
   [[nodiscard]] std::error_code unwrap(sspi_security_context &securityContext, blob_view const &input, bool requireEncryption, blob &output);
};

}
