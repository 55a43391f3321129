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
#include "negotiate/negotiate_status.hpp" ///< for negotiate::make_error_code, negotiate::negotiate_status
#include "windows/sspi_engine.hpp" ///< for negotiate::sspi_engine, negotiate::sspi_security_context
#include "windows/sspi_error.hpp" ///< for negotiate::check_sspi_error, negotiate::map_sspi_status
#include "windows/wide_char.hpp" ///< for negotiate::utf8_to_wide_char, negotiate::wide_char_to_utf8

#include <Windows.h> ///< for security.h, SecureZeroMemory
/// for
///   AcceptSecurityContext,
///   AcquireCredentialsHandleW,
///   ASC_REQ_*,
///   ASC_RET_*,
///   CompleteAuthToken,
///   DecryptMessage,
///   DeleteSecurityContext,
///   EncryptMessage,
///   FreeContextBuffer,
///   FreeCredentialsHandle,
///   InitializeSecurityContextW,
///   ISC_REQ_*,
///   ISC_RET_*,
///   QueryContextAttributesW,
///   QuerySecurityPackageInfoW,
///   SEC_WINNT_AUTH_IDENTITY_W,
///   SecBuffer,
///   SecBufferDesc,
///   SECPKG_ATTR_NAMES,
///   SECPKG_ATTR_NEGOTIATION_INFO,
///   SECPKG_ATTR_SIZES,
///   SECQOP_WRAP_NO_ENCRYPT,
///   SECURITY_NATIVE_DREP
#include <security.h>

#include <algorithm> ///< for std::copy_n, std::equal
#include <cassert> ///< for assert
#include <cctype> ///< for std::tolower
#include <cstddef> ///< for std::byte, size_t
#include <memory> ///< for std::addressof, std::make_unique, std::unique_ptr
#include <optional> ///< for std::optional
#include <source_location> ///< for std::source_location
#include <string> ///< for std::string, std::wstring
#include <string_view> ///< for std::string_view, std::wstring_view
#include <system_error> ///< for std::error_code

#pragma comment(lib, "Secur32")

namespace negotiate
{

namespace
{

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

[[nodiscard]] ULONG request_flags(authentication_role const role, protection_level const requiredProtectionLevel) noexcept
{
   if (authentication_role::client == role)
   {
      ULONG requestFlags{ISC_REQ_ALLOCATE_MEMORY | ISC_REQ_MUTUAL_AUTH | ISC_REQ_CONNECTION,};
      if (protection_level::none != requiredProtectionLevel)
      {
         requestFlags |= ISC_REQ_INTEGRITY | ISC_REQ_SEQUENCE_DETECT | ISC_REQ_REPLAY_DETECT;
      }
      if (protection_level::encrypt_and_sign == requiredProtectionLevel)
      {
         requestFlags |= ISC_REQ_CONFIDENTIALITY;
      }
      return requestFlags;
   }
   ULONG requestFlags{ASC_REQ_ALLOCATE_MEMORY | ASC_REQ_MUTUAL_AUTH | ASC_REQ_CONNECTION,};
   if (protection_level::none != requiredProtectionLevel)
   {
      requestFlags |= ASC_REQ_INTEGRITY | ASC_REQ_SEQUENCE_DETECT | ASC_REQ_REPLAY_DETECT;
   }
   if (protection_level::encrypt_and_sign == requiredProtectionLevel)
   {
      requestFlags |= ASC_REQ_CONFIDENTIALITY;
   }
   return requestFlags;
}

void move_to_blob(SecBuffer &buffer, blob &bytes)
{
   if (nullptr == buffer.pvBuffer)
   {
      return;
   }
   auto const *first{static_cast<std::byte const *>(buffer.pvBuffer),};
   bytes.assign(first, first + buffer.cbBuffer);
   FreeContextBuffer(buffer.pvBuffer);
   buffer.pvBuffer = nullptr;
   buffer.cbBuffer = 0;
}

void append_buffer(SecBuffer const &buffer, blob &bytes)
{
   auto const *first{static_cast<std::byte const *>(buffer.pvBuffer),};
   bytes.insert(bytes.end(), first, first + buffer.cbBuffer);
}

}

sspi_security_context::~sspi_security_context()
{
   if (true == hasContext)
   {
      if (auto const securityStatus{DeleteSecurityContext(std::addressof(contextHandle)),}; SEC_E_OK != securityStatus) [[unlikely]]
      {
         log_system_error(
            "[negotiate] failed to delete security context",
            std::error_code{static_cast<int>(securityStatus), std::system_category(),}
         );
      }
   }
   if (true == hasCredential)
   {
      if (auto const securityStatus{FreeCredentialsHandle(std::addressof(credentialHandle)),}; SEC_E_OK != securityStatus) [[unlikely]]
      {
         log_system_error(
            "[negotiate] failed to free credentials handle",
            std::error_code{static_cast<int>(securityStatus), std::system_category(),}
         );
      }
   }
}

std::wstring_view sspi_package(std::string_view const &package) noexcept
{
   if (true == equal_ignore_case(package, "Negotiate"))
   {
      return std::wstring_view{L"Negotiate",};
   }
   if (true == equal_ignore_case(package, "Kerberos"))
   {
      return std::wstring_view{L"Kerberos",};
   }
   if (true == equal_ignore_case(package, "NTLM"))
   {
      return std::wstring_view{L"NTLM",};
   }
   return std::wstring_view{};
}

std::error_code sspi_engine::create_context(
   authentication_role const role,
   session_config const &config,
   security_context_handle &securityContext
)
{
   auto const package{sspi_package(config.package()),};
   if (true == package.empty())
   {
      log_error(std::source_location::current(), "[negotiate] unsupported security package '", config.package(), "'");
      return make_error_code(negotiate_status::unsupported);
   }
   if (true == config.credential().is_incomplete())
   {
      log_error(std::source_location::current(), "[negotiate] credential without user name");
      return make_error_code(negotiate_status::invalid_credentials);
   }
   auto sspiContext{std::make_unique<sspi_security_context>(),};
   sspiContext->role = role;
   sspiContext->package = package;
   sspiContext->requestFlags = request_flags(role, config.required_protection_level());
   if (authentication_role::client == role)
   {
      if (true == config.target_name().empty())
      {
         log_error(std::source_location::current(), "[negotiate] client session requires a target name");
         return make_error_code(negotiate_status::target_unknown);
      }
      std::error_code errorCode{};
      sspiContext->targetName = utf8_to_wide_char(config.target_name(), errorCode);
      if (true == bool{errorCode,}) [[unlikely]]
      {
         log_system_error("[negotiate] failed to convert target name", errorCode);
         return make_error_code(negotiate_status::target_unknown);
      }
   }
   if (auto const errorCode{acquire_credential(*sspiContext, config),}; true == bool{errorCode,})
   {
      return errorCode;
   }
   securityContext.reset(sspiContext.release());
   return std::error_code{};
}

negotiate_status sspi_engine::step(
   security_context &securityContext,
   std::optional<blob_view> const &incomingBlob,
   blob &outgoingBlob,
   context_attributes &contextAttributes
)
{
   auto &sspiContext{static_cast<sspi_security_context &>(securityContext),};
   outgoingBlob.clear();
   SecBuffer inputBuffer
   {
      .cbBuffer = 0,
      .BufferType = SECBUFFER_TOKEN,
      .pvBuffer = nullptr,
   };
   if (true == incomingBlob.has_value())
   {
      inputBuffer.cbBuffer = static_cast<ULONG>(incomingBlob->size());
      inputBuffer.pvBuffer = const_cast<std::byte *>(incomingBlob->data());
   }
   SecBufferDesc inputBufferDesc{.ulVersion = SECBUFFER_VERSION, .cBuffers = 1, .pBuffers = std::addressof(inputBuffer),};
   SecBuffer outputBuffer{.cbBuffer = 0, .BufferType = SECBUFFER_TOKEN, .pvBuffer = nullptr,};
   SecBufferDesc outputBufferDesc{.ulVersion = SECBUFFER_VERSION, .cBuffers = 1, .pBuffers = std::addressof(outputBuffer),};
   ULONG contextFlags{0,};
   TimeStamp expiry{};
   SECURITY_STATUS securityStatus{SEC_E_OK,};
   if (authentication_role::client == sspiContext.role)
   {
      securityStatus = InitializeSecurityContextW(
         std::addressof(sspiContext.credentialHandle),
         (true == sspiContext.hasContext) ? std::addressof(sspiContext.contextHandle) : nullptr,
         sspiContext.targetName.data(),
         sspiContext.requestFlags,
         0,
         SECURITY_NATIVE_DREP,
         (true == incomingBlob.has_value()) ? std::addressof(inputBufferDesc) : nullptr,
         0,
         std::addressof(sspiContext.contextHandle),
         std::addressof(outputBufferDesc),
         std::addressof(contextFlags),
         std::addressof(expiry)
      );
   }
   else
   {
      if (false == incomingBlob.has_value())
      {
         if (false == sspiContext.hasContext)
         {
            /// Acceptor speaks first with an empty challenge, the initiator answers with its first token
            return negotiate_status::continue_needed;
         }
         log_error(std::source_location::current(), "[negotiate] server exchange in progress requires a client token");
         return negotiate_status::invalid_token;
      }
      securityStatus = AcceptSecurityContext(
         std::addressof(sspiContext.credentialHandle),
         (true == sspiContext.hasContext) ? std::addressof(sspiContext.contextHandle) : nullptr,
         std::addressof(inputBufferDesc),
         sspiContext.requestFlags,
         SECURITY_NATIVE_DREP,
         std::addressof(sspiContext.contextHandle),
         std::addressof(outputBufferDesc),
         std::addressof(contextFlags),
         std::addressof(expiry)
      );
   }
   switch (securityStatus)
   {
   case SEC_E_OK: [[fallthrough]];
   case SEC_I_CONTINUE_NEEDED: [[fallthrough]];
   case SEC_I_COMPLETE_NEEDED: [[fallthrough]];
   case SEC_I_COMPLETE_AND_CONTINUE:
   {
      sspiContext.hasContext = true;
   }
   break;

   default:
   {
      if (nullptr != outputBuffer.pvBuffer)
      {
         FreeContextBuffer(outputBuffer.pvBuffer);
      }
      auto const errorCode
      {
         check_sspi_error(
            (authentication_role::client == sspiContext.role)
               ? std::string_view{"[negotiate] failed to initialize security context",}
               : std::string_view{"[negotiate] failed to accept security context",},
            securityStatus
         ),
      };
      return static_cast<negotiate_status>(errorCode.value());
   }
   }
   if ((SEC_I_COMPLETE_NEEDED == securityStatus) || (SEC_I_COMPLETE_AND_CONTINUE == securityStatus))
   {
      if (
         auto const completeStatus{CompleteAuthToken(std::addressof(sspiContext.contextHandle), std::addressof(outputBufferDesc)),};
         SEC_E_OK != completeStatus
      ) [[unlikely]]
      {
         FreeContextBuffer(outputBuffer.pvBuffer);
         return static_cast<negotiate_status>(check_sspi_error("[negotiate] failed to complete authentication token", completeStatus).value());
      }
   }
   move_to_blob(outputBuffer, outgoingBlob);
   if ((SEC_I_CONTINUE_NEEDED == securityStatus) || (SEC_I_COMPLETE_AND_CONTINUE == securityStatus))
   {
      return negotiate_status::continue_needed;
   }
   if (auto const errorCode{query_attributes(sspiContext, contextFlags, contextAttributes),}; true == bool{errorCode,})
   {
      outgoingBlob.clear();
      return static_cast<negotiate_status>(errorCode.value());
   }
   return negotiate_status::completed;
}

std::error_code sspi_engine::sign(security_context &securityContext, blob_view const &input, blob &output)
{
   return wrap(static_cast<sspi_security_context &>(securityContext), input, false, output);
}

std::error_code sspi_engine::verify(security_context &securityContext, blob_view const &input, blob &output)
{
   return unwrap(static_cast<sspi_security_context &>(securityContext), input, false, output);
}

std::error_code sspi_engine::seal(security_context &securityContext, blob_view const &input, blob &output)
{
   return wrap(static_cast<sspi_security_context &>(securityContext), input, true, output);
}

std::error_code sspi_engine::unseal(security_context &securityContext, blob_view const &input, blob &output)
{
   return unwrap(static_cast<sspi_security_context &>(securityContext), input, true, output);
}

void sspi_engine::release_context(security_context &securityContext) noexcept
{
   [[maybe_unused]] std::unique_ptr<sspi_security_context> const sspiContext{std::addressof(static_cast<sspi_security_context &>(securityContext)),};
}

std::error_code sspi_engine::acquire_credential(sspi_security_context &securityContext, session_config const &config)
{
   auto const credentialUsage{(authentication_role::client == securityContext.role) ? SECPKG_CRED_OUTBOUND : SECPKG_CRED_INBOUND,};
   TimeStamp expiry{};
   SECURITY_STATUS securityStatus{SEC_E_OK,};
   if (auto const &credential{config.credential(),}; true == credential.is_default())
   {
      securityStatus = AcquireCredentialsHandleW(
         nullptr,
         securityContext.package.data(),
         credentialUsage,
         nullptr,
         nullptr,
         nullptr,
         nullptr,
         std::addressof(securityContext.credentialHandle),
         std::addressof(expiry)
      );
   }
   else
   {
      std::error_code errorCode{};
      auto userName{utf8_to_wide_char(credential.user_name(), errorCode),};
      auto domain{(false == bool{errorCode,}) ? utf8_to_wide_char(credential.domain(), errorCode) : std::wstring{},};
      auto password{(false == bool{errorCode,}) ? utf8_to_wide_char(credential.password(), errorCode) : std::wstring{},};
      if (false == bool{errorCode,})
      {
         SEC_WINNT_AUTH_IDENTITY_W authIdentity
         {
            .User = reinterpret_cast<unsigned short *>(userName.data()),
            .UserLength = static_cast<unsigned long>(userName.size()),
            .Domain = reinterpret_cast<unsigned short *>(domain.data()),
            .DomainLength = static_cast<unsigned long>(domain.size()),
            .Password = reinterpret_cast<unsigned short *>(password.data()),
            .PasswordLength = static_cast<unsigned long>(password.size()),
            .Flags = SEC_WINNT_AUTH_IDENTITY_UNICODE,
         };
         securityStatus = AcquireCredentialsHandleW(
            nullptr,
            securityContext.package.data(),
            credentialUsage,
            nullptr,
            std::addressof(authIdentity),
            nullptr,
            nullptr,
            std::addressof(securityContext.credentialHandle),
            std::addressof(expiry)
         );
      }
      SecureZeroMemory(password.data(), password.size() * sizeof(wchar_t));
      if (true == bool{errorCode,}) [[unlikely]]
      {
         log_system_error("[negotiate] failed to convert credential", errorCode);
         return make_error_code(negotiate_status::invalid_credentials);
      }
   }
   if (SEC_E_OK != securityStatus)
   {
      return check_sspi_error("[negotiate] failed to acquire credentials", securityStatus);
   }
   securityContext.hasCredential = true;
   return std::error_code{};
}

std::error_code sspi_engine::query_attributes(
   sspi_security_context &securityContext,
   ULONG const contextFlags,
   context_attributes &contextAttributes
)
{
   if (
      auto const securityStatus
      {
         QueryContextAttributesW(std::addressof(securityContext.contextHandle), SECPKG_ATTR_SIZES, std::addressof(securityContext.sizes)),
      };
      SEC_E_OK != securityStatus
   ) [[unlikely]]
   {
      return check_sspi_error("[negotiate] failed to query context sizes", securityStatus);
   }
   auto const isClient{authentication_role::client == securityContext.role,};
   auto const integrity{0 != (contextFlags & ((true == isClient) ? ISC_RET_INTEGRITY : ASC_RET_INTEGRITY)),};
   auto const confidentiality{0 != (contextFlags & ((true == isClient) ? ISC_RET_CONFIDENTIALITY : ASC_RET_CONFIDENTIALITY)),};
   if ((true == confidentiality) && (true == integrity))
   {
      contextAttributes.protectionLevel = protection_level::encrypt_and_sign;
   }
   else if (true == integrity)
   {
      contextAttributes.protectionLevel = protection_level::sign;
   }
   else
   {
      contextAttributes.protectionLevel = protection_level::none;
   }
   contextAttributes.sequenceDetect = (0 != (contextFlags & ((true == isClient) ? ISC_RET_SEQUENCE_DETECT : ASC_RET_SEQUENCE_DETECT)));
   contextAttributes.replayDetect = (0 != (contextFlags & ((true == isClient) ? ISC_RET_REPLAY_DETECT : ASC_RET_REPLAY_DETECT)));
   contextAttributes.mutualAuthentication = (0 != (contextFlags & ((true == isClient) ? ISC_RET_MUTUAL_AUTH : ASC_RET_MUTUAL_AUTH)));

   std::wstring negotiatedPackage{securityContext.package,};
   SecPkgContext_NegotiationInfoW negotiationInfo{.PackageInfo = nullptr, .NegotiationState = 0,};
   if (
      auto const securityStatus
      {
         QueryContextAttributesW(std::addressof(securityContext.contextHandle), SECPKG_ATTR_NEGOTIATION_INFO, std::addressof(negotiationInfo)),
      };
      (SEC_E_OK == securityStatus) && (nullptr != negotiationInfo.PackageInfo)
   )
   {
      negotiatedPackage = negotiationInfo.PackageInfo->Name;
      FreeContextBuffer(negotiationInfo.PackageInfo);
   }
   contextAttributes.negotiatedPackage = wide_char_to_utf8(negotiatedPackage);
   /// NTLM tokens cannot be unwrapped through a stream buffer
   securityContext.streamUnsupported = (L"NTLM" == negotiatedPackage);

   if (true == isClient)
   {
      contextAttributes.remoteIdentity = wide_char_to_utf8(securityContext.targetName);
   }
   else
   {
      SecPkgContext_NamesW names{.sUserName = nullptr,};
      if (
         auto const securityStatus
         {
            QueryContextAttributesW(std::addressof(securityContext.contextHandle), SECPKG_ATTR_NAMES, std::addressof(names)),
         };
         (SEC_E_OK == securityStatus) && (nullptr != names.sUserName)
      )
      {
         contextAttributes.remoteIdentity = wide_char_to_utf8(names.sUserName);
         FreeContextBuffer(names.sUserName);
      }
   }
   return std::error_code{};
}

std::error_code sspi_engine::wrap(sspi_security_context &securityContext, blob_view const &input, bool const encrypt, blob &output)
{
   assert(true == securityContext.hasContext);
   output.clear();
   blob tokenBytes(securityContext.sizes.cbSecurityTrailer);
   blob dataBytes{input.begin(), input.end(),};
   blob paddingBytes(securityContext.sizes.cbBlockSize);
   SecBuffer buffers[3]
   {
      SecBuffer{.cbBuffer = static_cast<ULONG>(tokenBytes.size()), .BufferType = SECBUFFER_TOKEN, .pvBuffer = tokenBytes.data(),},
      SecBuffer{.cbBuffer = static_cast<ULONG>(dataBytes.size()), .BufferType = SECBUFFER_DATA, .pvBuffer = dataBytes.data(),},
      SecBuffer{.cbBuffer = static_cast<ULONG>(paddingBytes.size()), .BufferType = SECBUFFER_PADDING, .pvBuffer = paddingBytes.data(),},
   };
   SecBufferDesc bufferDesc{.ulVersion = SECBUFFER_VERSION, .cBuffers = 3, .pBuffers = buffers,};
   if (
      auto const securityStatus
      {
         EncryptMessage(
            std::addressof(securityContext.contextHandle),
            (true == encrypt) ? 0 : SECQOP_WRAP_NO_ENCRYPT,
            std::addressof(bufferDesc),
            0
         ),
      };
      SEC_E_OK != securityStatus
   )
   {
      return check_sspi_error("[negotiate] failed to wrap message", securityStatus);
   }
   output.reserve(buffers[0].cbBuffer + buffers[1].cbBuffer + buffers[2].cbBuffer);
   append_buffer(buffers[0], output);
   append_buffer(buffers[1], output);
   append_buffer(buffers[2], output);
   return std::error_code{};
}

std::error_code sspi_engine::unwrap(sspi_security_context &securityContext, blob_view const &input, bool const requireEncryption, blob &output)
{
   assert(true == securityContext.hasContext);
   output.clear();
   blob messageBytes{input.begin(), input.end(),};
   SecBuffer buffers[2]{};
   if (true == securityContext.streamUnsupported)
   {
      auto const tokenSize{static_cast<size_t>(securityContext.sizes.cbSecurityTrailer),};
      if (tokenSize > messageBytes.size())
      {
         log_error(std::source_location::current(), "[negotiate] protected message is shorter than its signature");
         return make_error_code(negotiate_status::message_modified);
      }
      buffers[0] = SecBuffer{.cbBuffer = static_cast<ULONG>(tokenSize), .BufferType = SECBUFFER_TOKEN, .pvBuffer = messageBytes.data(),};
      buffers[1] = SecBuffer
      {
         .cbBuffer = static_cast<ULONG>(messageBytes.size() - tokenSize),
         .BufferType = SECBUFFER_DATA,
         .pvBuffer = messageBytes.data() + tokenSize,
      };
   }
   else
   {
      buffers[0] = SecBuffer{.cbBuffer = static_cast<ULONG>(messageBytes.size()), .BufferType = SECBUFFER_STREAM, .pvBuffer = messageBytes.data(),};
      buffers[1] = SecBuffer{.cbBuffer = 0, .BufferType = SECBUFFER_DATA, .pvBuffer = nullptr,};
   }
   SecBufferDesc bufferDesc{.ulVersion = SECBUFFER_VERSION, .cBuffers = 2, .pBuffers = buffers,};
   ULONG qualityOfProtection{0,};
   if (
      auto const securityStatus
      {
         DecryptMessage(std::addressof(securityContext.contextHandle), std::addressof(bufferDesc), 0, std::addressof(qualityOfProtection)),
      };
      SEC_E_OK != securityStatus
   )
   {
      auto const errorCode{check_sspi_error("[negotiate] failed to unwrap message", securityStatus),};
      /// A token that no longer parses was tampered with just like one that fails its checksum
      return (make_error_code(negotiate_status::invalid_token) == errorCode)
         ? make_error_code(negotiate_status::message_modified)
         : errorCode
      ;
   }
   if ((true == requireEncryption) && (SECQOP_WRAP_NO_ENCRYPT == qualityOfProtection))
   {
      log_error(std::source_location::current(), "[negotiate] message was not encrypted under an encrypting context");
      return make_error_code(negotiate_status::message_modified);
   }
   if ((0 < buffers[1].cbBuffer) && (nullptr != buffers[1].pvBuffer))
   {
      append_buffer(buffers[1], output);
   }
   return std::error_code{};
}

}
