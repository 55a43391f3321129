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

/// for
///   gss_cred_id_t,
///   gss_ctx_id_t,
///   gss_name_t,
///   gss_OID,
///   GSS_C_NO_CONTEXT,
///   GSS_C_NO_CREDENTIAL,
///   GSS_C_NO_NAME,
///   GSS_C_NO_OID,
///   OM_uint32
#include <gssapi/gssapi.h>

#include <optional> ///< for std::optional
#include <string> ///< for std::string
#include <string_view> ///< for std::string_view
#include <system_error> ///< for std::error_code

namespace negotiate
{

struct gssapi_security_context final : public security_context
{
   [[nodiscard]] gssapi_security_context() noexcept = default;
   ~gssapi_security_context();

   authentication_role role{authentication_role::client,};
   gss_OID mechanism{GSS_C_NO_OID,};
   OM_uint32 requestFlags{0,};
   gss_cred_id_t credentialHandle{GSS_C_NO_CREDENTIAL,};
   gss_name_t targetName{GSS_C_NO_NAME,};
   gss_ctx_id_t contextHandle{GSS_C_NO_CONTEXT,};
};

/// Mechanism object identifier for a package name, GSS_C_NO_OID when the package is unknown
[[nodiscard]] gss_OID gssapi_mechanism(std::string_view const &package) noexcept;

/// "HTTP/host" as used by SSPI becomes the host based service name "HTTP@host"
[[nodiscard]] std::string gssapi_service_name(std::string_view const &targetName);

class gssapi_engine final : public negotiate_engine
{
public:
   [[nodiscard]] gssapi_engine() noexcept = default;
   ~gssapi_engine() override = default;

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
   [[nodiscard]] std::error_code acquire_credential(gssapi_security_context &securityContext, session_config const &config);
   [[nodiscard]] std::error_code import_target_name(gssapi_security_context &securityContext, std::string_view const &targetName);
   void query_attributes(gssapi_security_context &securityContext, gss_OID actualMechanism, gss_name_t sourceName, OM_uint32 returnFlags, context_attributes &contextAttributes);
   [[nodiscard]] std::error_code wrap(gssapi_security_context &securityContext, blob_view const &input, bool encrypt, blob &output);
   [[nodiscard]] std::error_code unwrap(gssapi_security_context &securityContext, blob_view const &input, bool requireEncryption, blob &output);
};

}
