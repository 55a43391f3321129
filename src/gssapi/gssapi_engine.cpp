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

#include "common/logger.hpp" ///< for negotiate::log_error
#include "gssapi/gssapi_engine.hpp" ///< for negotiate::gssapi_engine, negotiate::gssapi_security_context
#include "gssapi/gssapi_error.hpp" ///< for negotiate::log_gssapi_error, negotiate::map_gssapi_status
#include "negotiate/negotiate_status.hpp" ///< for negotiate::is_failure, negotiate::make_error_code, negotiate::negotiate_status

/// for
///   gss_accept_sec_context,
///   gss_acquire_cred,
///   gss_buffer_desc,
///   GSS_C_ACCEPT,
///   GSS_C_CONF_FLAG,
///   GSS_C_INDEFINITE,
///   GSS_C_INITIATE,
///   GSS_C_INTEG_FLAG,
///   GSS_C_MUTUAL_FLAG,
///   GSS_C_NO_BUFFER,
///   GSS_C_NO_CHANNEL_BINDINGS,
///   GSS_C_NT_HOSTBASED_SERVICE,
///   GSS_C_NT_USER_NAME,
///   GSS_C_QOP_DEFAULT,
///   GSS_C_REPLAY_FLAG,
///   GSS_C_SEQUENCE_FLAG,
///   gss_delete_sec_context,
///   gss_display_name,
///   GSS_ERROR,
///   gss_import_name,
///   gss_init_sec_context,
///   gss_OID_desc,
///   gss_OID_set_desc,
///   gss_oid_to_str,
///   gss_release_buffer,
///   gss_release_cred,
///   gss_release_name,
///   GSS_S_COMPLETE,
///   GSS_S_CONTINUE_NEEDED,
///   gss_unwrap,
///   gss_wrap
#include <gssapi/gssapi.h>
#include <gssapi/gssapi_ext.h> ///< for gss_acquire_cred_with_password

#include <algorithm> ///< for std::equal
#include <cassert> ///< for assert
#include <cctype> ///< for std::tolower
#include <cstddef> ///< for std::byte
#include <cstring> ///< for std::memcmp
#include <memory> ///< for std::addressof, std::make_unique, std::unique_ptr
#include <optional> ///< for std::optional
#include <source_location> ///< for std::source_location
#include <string> ///< for std::string
#include <string_view> ///< for std::string_view
#include <system_error> ///< for std::error_code

namespace negotiate
{

namespace
{

gss_OID_desc spnego_mechanism_oid{6, const_cast<char *>("\x2b\x06\x01\x05\x05\x02"),};
gss_OID_desc kerberos_mechanism_oid{9, const_cast<char *>("\x2a\x86\x48\x86\xf7\x12\x01\x02\x02"),};
gss_OID_desc microsoft_kerberos_mechanism_oid{9, const_cast<char *>("\x2a\x86\x48\x82\xf7\x12\x01\x02\x02"),};
gss_OID_desc ntlm_mechanism_oid{10, const_cast<char *>("\x2b\x06\x01\x04\x01\x82\x37\x02\x02\x0a"),};

[[nodiscard]] bool oid_equal(gss_OID const lhs, gss_OID const rhs) noexcept
{
   if ((GSS_C_NO_OID == lhs) || (GSS_C_NO_OID == rhs))
   {
      return lhs == rhs;
   }
   return (lhs->length == rhs->length) && (0 == std::memcmp(lhs->elements, rhs->elements, lhs->length));
}

[[nodiscard]] bool equal_ignore_case(std::string_view const &lhs, std::string_view const &rhs) noexcept
{
   return std::equal(
      lhs.begin(),
      lhs.end(),
      rhs.begin(),
      rhs.end(),
      [] (char const lhsChar, char const rhsChar)
      {
         return std::tolower(static_cast<unsigned char>(lhsChar)) == std::tolower(static_cast<unsigned char>(rhsChar));
      }
   );
}

[[nodiscard]] negotiate_status to_failure(OM_uint32 const majorStatus) noexcept
{
   auto const status{map_gssapi_status(majorStatus),};
   return (true == is_failure(status)) ? status : negotiate_status::generic_failure;
}

[[nodiscard]] std::string display_name(gss_name_t const name)
{
   if (GSS_C_NO_NAME == name)
   {
      return std::string{};
   }
   OM_uint32 minorStatus{0,};
   gss_buffer_desc nameBuffer{.length = 0, .value = nullptr,};
   if (auto const majorStatus{gss_display_name(std::addressof(minorStatus), name, std::addressof(nameBuffer), nullptr),}; GSS_ERROR(majorStatus))
   {
      log_gssapi_error("[negotiate] failed to display name", majorStatus, minorStatus, GSS_C_NO_OID);
      return std::string{};
   }
   std::string text{static_cast<char const *>(nameBuffer.value), nameBuffer.length,};
   gss_release_buffer(std::addressof(minorStatus), std::addressof(nameBuffer));
   return text;
}

[[nodiscard]] std::string package_name(gss_OID const mechanism)
{
   if (true == oid_equal(mechanism, std::addressof(spnego_mechanism_oid)))
   {
      return std::string{"Negotiate",};
   }
   if (
      false
      || (true == oid_equal(mechanism, std::addressof(kerberos_mechanism_oid)))
      || (true == oid_equal(mechanism, std::addressof(microsoft_kerberos_mechanism_oid)))
   )
   {
      return std::string{"Kerberos",};
   }
   if (true == oid_equal(mechanism, std::addressof(ntlm_mechanism_oid)))
   {
      return std::string{"NTLM",};
   }
   if (GSS_C_NO_OID == mechanism)
   {
      return std::string{};
   }
   OM_uint32 minorStatus{0,};
   gss_buffer_desc oidBuffer{.length = 0, .value = nullptr,};
   if (auto const majorStatus{gss_oid_to_str(std::addressof(minorStatus), mechanism, std::addressof(oidBuffer)),}; GSS_ERROR(majorStatus))
   {
      return std::string{};
   }
   std::string text{static_cast<char const *>(oidBuffer.value), oidBuffer.length,};
   gss_release_buffer(std::addressof(minorStatus), std::addressof(oidBuffer));
   return text;
}

[[nodiscard]] OM_uint32 request_flags(protection_level const requiredProtectionLevel) noexcept
{
   OM_uint32 requestFlags{GSS_C_MUTUAL_FLAG,};
   if (protection_level::none != requiredProtectionLevel)
   {
      requestFlags |= GSS_C_INTEG_FLAG | GSS_C_SEQUENCE_FLAG | GSS_C_REPLAY_FLAG;
   }
   if (protection_level::encrypt_and_sign == requiredProtectionLevel)
   {
      requestFlags |= GSS_C_CONF_FLAG;
   }
   return requestFlags;
}

[[nodiscard]] gss_buffer_desc make_input_buffer(blob_view const &bytes) noexcept
{
   return gss_buffer_desc
   {
      .length = bytes.size(),
      .value = const_cast<std::byte *>(bytes.data()),
   };
}

void move_to_blob(gss_buffer_desc &buffer, blob &bytes)
{
   auto const *first{static_cast<std::byte const *>(buffer.value),};
   if (0 < buffer.length)
   {
      bytes.assign(first, first + buffer.length);
   }
   OM_uint32 minorStatus{0,};
   gss_release_buffer(std::addressof(minorStatus), std::addressof(buffer));
}

}

gssapi_security_context::~gssapi_security_context()
{
   OM_uint32 minorStatus{0,};
   if (GSS_C_NO_CONTEXT != contextHandle)
   {
      if (
         auto const majorStatus{gss_delete_sec_context(std::addressof(minorStatus), std::addressof(contextHandle), GSS_C_NO_BUFFER),};
         GSS_ERROR(majorStatus)
      ) [[unlikely]]
      {
         log_gssapi_error("[negotiate] failed to delete security context", majorStatus, minorStatus, mechanism);
      }
   }
   if (GSS_C_NO_NAME != targetName)
   {
      gss_release_name(std::addressof(minorStatus), std::addressof(targetName));
   }
   if (GSS_C_NO_CREDENTIAL != credentialHandle)
   {
      gss_release_cred(std::addressof(minorStatus), std::addressof(credentialHandle));
   }
}

gss_OID gssapi_mechanism(std::string_view const &package) noexcept
{
   if (true == equal_ignore_case(package, "Negotiate"))
   {
      return std::addressof(spnego_mechanism_oid);
   }
   if (true == equal_ignore_case(package, "Kerberos"))
   {
      return std::addressof(kerberos_mechanism_oid);
   }
   if (true == equal_ignore_case(package, "NTLM"))
   {
      return std::addressof(ntlm_mechanism_oid);
   }
   return GSS_C_NO_OID;
}

std::string gssapi_service_name(std::string_view const &targetName)
{
   std::string serviceName{targetName,};
   if (std::string::npos == serviceName.find('@'))
   {
      if (auto const separator{serviceName.find('/'),}; std::string::npos != separator)
      {
         serviceName[separator] = '@';
      }
   }
   return serviceName;
}

std::error_code gssapi_engine::create_context(
   authentication_role const role,
   session_config const &config,
   security_context_handle &securityContext
)
{
   auto const mechanism{gssapi_mechanism(config.package()),};
   if (GSS_C_NO_OID == mechanism)
   {
      log_error(std::source_location::current(), "[negotiate] unsupported security package '", config.package(), "'");
      return make_error_code(negotiate_status::unsupported);
   }
   if (true == config.credential().is_incomplete())
   {
      log_error(std::source_location::current(), "[negotiate] credential without user name");
      return make_error_code(negotiate_status::invalid_credentials);
   }
   auto gssapiContext{std::make_unique<gssapi_security_context>(),};
   gssapiContext->role = role;
   gssapiContext->mechanism = mechanism;
   gssapiContext->requestFlags = request_flags(config.required_protection_level());
   if (authentication_role::client == role)
   {
      if (auto const errorCode{import_target_name(*gssapiContext, config.target_name()),}; true == bool{errorCode,})
      {
         return errorCode;
      }
   }
   if (auto const errorCode{acquire_credential(*gssapiContext, config),}; true == bool{errorCode,})
   {
      return errorCode;
   }
   securityContext.reset(gssapiContext.release());
   return std::error_code{};
}

negotiate_status gssapi_engine::step(
   security_context &securityContext,
   std::optional<blob_view> const &incomingBlob,
   blob &outgoingBlob,
   context_attributes &contextAttributes
)
{
   auto &gssapiContext{static_cast<gssapi_security_context &>(securityContext),};
   outgoingBlob.clear();
   auto inputToken{make_input_buffer((true == incomingBlob.has_value()) ? incomingBlob.value() : blob_view{}),};
   gss_buffer_desc outputToken{.length = 0, .value = nullptr,};
   gss_OID actualMechanism{GSS_C_NO_OID,};
   gss_name_t sourceName{GSS_C_NO_NAME,};
   OM_uint32 returnFlags{0,};
   OM_uint32 minorStatus{0,};
   OM_uint32 majorStatus{GSS_S_COMPLETE,};
   if (authentication_role::client == gssapiContext.role)
   {
      majorStatus = gss_init_sec_context(
         std::addressof(minorStatus),
         gssapiContext.credentialHandle,
         std::addressof(gssapiContext.contextHandle),
         gssapiContext.targetName,
         gssapiContext.mechanism,
         gssapiContext.requestFlags,
         GSS_C_INDEFINITE,
         GSS_C_NO_CHANNEL_BINDINGS,
         (true == incomingBlob.has_value()) ? std::addressof(inputToken) : GSS_C_NO_BUFFER,
         std::addressof(actualMechanism),
         std::addressof(outputToken),
         std::addressof(returnFlags),
         nullptr
      );
   }
   else
   {
      if (false == incomingBlob.has_value())
      {
         if (GSS_C_NO_CONTEXT == gssapiContext.contextHandle)
         {
            /// Acceptor speaks first with an empty challenge, the initiator answers with its first token
            return negotiate_status::continue_needed;
         }
         log_error(std::source_location::current(), "[negotiate] server exchange in progress requires a client token");
         return negotiate_status::invalid_token;
      }
      majorStatus = gss_accept_sec_context(
         std::addressof(minorStatus),
         std::addressof(gssapiContext.contextHandle),
         gssapiContext.credentialHandle,
         std::addressof(inputToken),
         GSS_C_NO_CHANNEL_BINDINGS,
         std::addressof(sourceName),
         std::addressof(actualMechanism),
         std::addressof(outputToken),
         std::addressof(returnFlags),
         nullptr,
         nullptr
      );
   }
   move_to_blob(outputToken, outgoingBlob);
   if (GSS_ERROR(majorStatus))
   {
      log_gssapi_error(
         (authentication_role::client == gssapiContext.role)
            ? std::string_view{"[negotiate] failed to initialize security context",}
            : std::string_view{"[negotiate] failed to accept security context",},
         majorStatus,
         minorStatus,
         gssapiContext.mechanism
      );
      if (GSS_C_NO_NAME != sourceName)
      {
         gss_release_name(std::addressof(minorStatus), std::addressof(sourceName));
      }
      return to_failure(majorStatus);
   }
   if (0 != (majorStatus & GSS_S_CONTINUE_NEEDED))
   {
      if (GSS_C_NO_NAME != sourceName)
      {
         gss_release_name(std::addressof(minorStatus), std::addressof(sourceName));
      }
      return negotiate_status::continue_needed;
   }
   query_attributes(gssapiContext, actualMechanism, sourceName, returnFlags, contextAttributes);
   if (GSS_C_NO_NAME != sourceName)
   {
      gss_release_name(std::addressof(minorStatus), std::addressof(sourceName));
   }
   return negotiate_status::completed;
}

std::error_code gssapi_engine::sign(security_context &securityContext, blob_view const &input, blob &output)
{
   return wrap(static_cast<gssapi_security_context &>(securityContext), input, false, output);
}

std::error_code gssapi_engine::verify(security_context &securityContext, blob_view const &input, blob &output)
{
   return unwrap(static_cast<gssapi_security_context &>(securityContext), input, false, output);
}

std::error_code gssapi_engine::seal(security_context &securityContext, blob_view const &input, blob &output)
{
   return wrap(static_cast<gssapi_security_context &>(securityContext), input, true, output);
}

std::error_code gssapi_engine::unseal(security_context &securityContext, blob_view const &input, blob &output)
{
   return unwrap(static_cast<gssapi_security_context &>(securityContext), input, true, output);
}

void gssapi_engine::release_context(security_context &securityContext) noexcept
{
   [[maybe_unused]] std::unique_ptr<gssapi_security_context> const gssapiContext{std::addressof(static_cast<gssapi_security_context &>(securityContext)),};
}

std::error_code gssapi_engine::acquire_credential(gssapi_security_context &securityContext, session_config const &config)
{
   gss_OID_set_desc mechanismSet{.count = 1, .elements = securityContext.mechanism,};
   auto const credentialUsage{(authentication_role::client == securityContext.role) ? GSS_C_INITIATE : GSS_C_ACCEPT,};
   OM_uint32 minorStatus{0,};
   OM_uint32 majorStatus{GSS_S_COMPLETE,};
   if (auto const &credential{config.credential(),}; true == credential.is_default())
   {
      majorStatus = gss_acquire_cred(
         std::addressof(minorStatus),
         GSS_C_NO_NAME,
         GSS_C_INDEFINITE,
         std::addressof(mechanismSet),
         credentialUsage,
         std::addressof(securityContext.credentialHandle),
         nullptr,
         nullptr
      );
   }
   else
   {
      std::string principal{credential.user_name(),};
      if (false == credential.domain().empty())
      {
         principal.append("@").append(credential.domain());
      }
      gss_buffer_desc principalBuffer{.length = principal.size(), .value = principal.data(),};
      gss_name_t desiredName{GSS_C_NO_NAME,};
      majorStatus = gss_import_name(std::addressof(minorStatus), std::addressof(principalBuffer), GSS_C_NT_USER_NAME, std::addressof(desiredName));
      if (GSS_ERROR(majorStatus))
      {
         log_gssapi_error("[negotiate] failed to import user name", majorStatus, minorStatus, GSS_C_NO_OID);
         return make_error_code(negotiate_status::invalid_credentials);
      }
      gss_buffer_desc passwordBuffer
      {
         .length = credential.password().size(),
         .value = const_cast<char *>(credential.password().data()),
      };
      majorStatus = gss_acquire_cred_with_password(
         std::addressof(minorStatus),
         desiredName,
         std::addressof(passwordBuffer),
         GSS_C_INDEFINITE,
         std::addressof(mechanismSet),
         credentialUsage,
         std::addressof(securityContext.credentialHandle),
         nullptr,
         nullptr
      );
      OM_uint32 releaseMinorStatus{0,};
      gss_release_name(std::addressof(releaseMinorStatus), std::addressof(desiredName));
   }
   if (GSS_ERROR(majorStatus))
   {
      log_gssapi_error("[negotiate] failed to acquire credentials", majorStatus, minorStatus, securityContext.mechanism);
      return make_error_code(to_failure(majorStatus));
   }
   return std::error_code{};
}

std::error_code gssapi_engine::import_target_name(gssapi_security_context &securityContext, std::string_view const &targetName)
{
   if (true == targetName.empty())
   {
      log_error(std::source_location::current(), "[negotiate] client session requires a target name");
      return make_error_code(negotiate_status::target_unknown);
   }
   auto serviceName{gssapi_service_name(targetName),};
   gss_buffer_desc serviceNameBuffer{.length = serviceName.size(), .value = serviceName.data(),};
   OM_uint32 minorStatus{0,};
   if (
      auto const majorStatus
      {
         gss_import_name(
            std::addressof(minorStatus),
            std::addressof(serviceNameBuffer),
            GSS_C_NT_HOSTBASED_SERVICE,
            std::addressof(securityContext.targetName)
         ),
      };
      GSS_ERROR(majorStatus)
   )
   {
      log_gssapi_error("[negotiate] failed to import target name", majorStatus, minorStatus, GSS_C_NO_OID);
      return make_error_code(negotiate_status::target_unknown);
   }
   return std::error_code{};
}

void gssapi_engine::query_attributes(
   gssapi_security_context &securityContext,
   gss_OID const actualMechanism,
   gss_name_t const sourceName,
   OM_uint32 const returnFlags,
   context_attributes &contextAttributes
)
{
   if ((0 != (returnFlags & GSS_C_CONF_FLAG)) && (0 != (returnFlags & GSS_C_INTEG_FLAG)))
   {
      contextAttributes.protectionLevel = protection_level::encrypt_and_sign;
   }
   else if (0 != (returnFlags & GSS_C_INTEG_FLAG))
   {
      contextAttributes.protectionLevel = protection_level::sign;
   }
   else
   {
      contextAttributes.protectionLevel = protection_level::none;
   }
   contextAttributes.sequenceDetect = (0 != (returnFlags & GSS_C_SEQUENCE_FLAG));
   contextAttributes.replayDetect = (0 != (returnFlags & GSS_C_REPLAY_FLAG));
   contextAttributes.mutualAuthentication = (0 != (returnFlags & GSS_C_MUTUAL_FLAG));
   contextAttributes.negotiatedPackage = package_name(actualMechanism);
   contextAttributes.remoteIdentity = display_name(
      (authentication_role::client == securityContext.role) ? securityContext.targetName : sourceName
   );
}

std::error_code gssapi_engine::wrap(gssapi_security_context &securityContext, blob_view const &input, bool const encrypt, blob &output)
{
   assert(GSS_C_NO_CONTEXT != securityContext.contextHandle);
   output.clear();
   auto inputMessage{make_input_buffer(input),};
   gss_buffer_desc outputMessage{.length = 0, .value = nullptr,};
   int confidentialityState{0,};
   OM_uint32 minorStatus{0,};
   auto const majorStatus
   {
      gss_wrap(
         std::addressof(minorStatus),
         securityContext.contextHandle,
         (true == encrypt) ? 1 : 0,
         GSS_C_QOP_DEFAULT,
         std::addressof(inputMessage),
         std::addressof(confidentialityState),
         std::addressof(outputMessage)
      ),
   };
   if (GSS_ERROR(majorStatus))
   {
      log_gssapi_error("[negotiate] failed to wrap message", majorStatus, minorStatus, securityContext.mechanism);
      return make_error_code(to_failure(majorStatus));
   }
   move_to_blob(outputMessage, output);
   if ((true == encrypt) && (0 == confidentialityState))
   {
      log_error(std::source_location::current(), "[negotiate] mechanism refused to encrypt message");
      output.clear();
      return make_error_code(negotiate_status::qop_not_supported);
   }
   return std::error_code{};
}

std::error_code gssapi_engine::unwrap(gssapi_security_context &securityContext, blob_view const &input, bool const requireEncryption, blob &output)
{
   assert(GSS_C_NO_CONTEXT != securityContext.contextHandle);
   output.clear();
   auto inputMessage{make_input_buffer(input),};
   gss_buffer_desc outputMessage{.length = 0, .value = nullptr,};
   int confidentialityState{0,};
   gss_qop_t qualityOfProtection{GSS_C_QOP_DEFAULT,};
   OM_uint32 minorStatus{0,};
   auto const majorStatus
   {
      gss_unwrap(
         std::addressof(minorStatus),
         securityContext.contextHandle,
         std::addressof(inputMessage),
         std::addressof(outputMessage),
         std::addressof(confidentialityState),
         std::addressof(qualityOfProtection)
      ),
   };
   if (GSS_ERROR(majorStatus))
   {
      log_gssapi_error("[negotiate] failed to unwrap message", majorStatus, minorStatus, securityContext.mechanism);
      auto const status{to_failure(majorStatus),};
      /// A token that no longer parses was tampered with just like one that fails its checksum
      return make_error_code((negotiate_status::invalid_token == status) ? negotiate_status::message_modified : status);
   }
   if (auto const status{map_gssapi_status(majorStatus),}; negotiate_status::message_expired == status)
   {
      log_gssapi_error("[negotiate] unwrapped message out of sequence", majorStatus, minorStatus, securityContext.mechanism);
      OM_uint32 releaseMinorStatus{0,};
      gss_release_buffer(std::addressof(releaseMinorStatus), std::addressof(outputMessage));
      return make_error_code(status);
   }
   move_to_blob(outputMessage, output);
   if ((true == requireEncryption) && (0 == confidentialityState))
   {
      log_error(std::source_location::current(), "[negotiate] message was not encrypted under an encrypting context");
      output.clear();
      return make_error_code(negotiate_status::message_modified);
   }
   return std::error_code{};
}

}
