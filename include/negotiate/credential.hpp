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

#include <string> ///< for std::string
#include <string_view> ///< for std::string_view

namespace negotiate
{

/// Identity material handed to the engine when the security context is created.
/// The default credential, with every field empty, stands for the identity of the current process user.
/// Moving copies the secret and cleanses the source, a moved-from credential is the default one.
class credential final
{
public:
   [[nodiscard]] credential() noexcept = default;
   [[nodiscard]] credential(std::string_view const &userName, std::string_view const &password, std::string_view const &domain);
   [[nodiscard]] credential(credential &&rhs);
   [[nodiscard]] credential(credential const &rhs);
   ~credential();

   credential &operator = (credential &&rhs);
   credential &operator = (credential const &rhs);

   [[nodiscard]] bool is_default() const noexcept
   {
      return (true == m_userName.empty()) && (true == m_password.empty()) && (true == m_domain.empty());
   }

   /// A password or domain without a user name, engines reject it as invalid credentials
   [[nodiscard]] bool is_incomplete() const noexcept
   {
      return (true == m_userName.empty()) && (false == is_default());
   }

   [[nodiscard]] std::string_view user_name() const noexcept
   {
      return m_userName;
   }

   [[nodiscard]] std::string_view password() const noexcept
   {
      return m_password;
   }

   [[nodiscard]] std::string_view domain() const noexcept
   {
      return m_domain;
   }

private:
   std::string m_userName{};
   std::string m_password{};
   std::string m_domain{};

   void cleanse() noexcept;
};

}
