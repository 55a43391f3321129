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

#include "negotiate/credential.hpp" ///< for negotiate::credential

#if (defined(NEGOTIATE_OPENSSL))
#  include <openssl/crypto.h> ///< for OPENSSL_cleanse
#elif (defined(NEGOTIATE_SSPI))
#  include <Windows.h> ///< for SecureZeroMemory
#endif

#include <string> ///< for std::string
#include <string_view> ///< for std::string_view

namespace negotiate
{

credential::credential(std::string_view const &userName, std::string_view const &password, std::string_view const &domain) :
   m_userName{userName,},
   m_password{password,},
   m_domain{domain,}
{}

credential::credential(credential &&rhs) :
   m_userName{rhs.m_userName,},
   m_password{rhs.m_password,},
   m_domain{rhs.m_domain,}
{
   rhs.cleanse();
}

credential::credential(credential const &rhs) = default;

credential::~credential()
{
   cleanse();
}

credential &credential::operator = (credential &&rhs)
{
   if (this != &rhs)
   {
      cleanse();
      m_userName = rhs.m_userName;
      m_password = rhs.m_password;
      m_domain = rhs.m_domain;
      rhs.cleanse();
   }
   return *this;
}

credential &credential::operator = (credential const &rhs)
{
   if (this != &rhs)
   {
      cleanse();
      m_userName = rhs.m_userName;
      m_password = rhs.m_password;
      m_domain = rhs.m_domain;
   }
   return *this;
}

void credential::cleanse() noexcept
{
   if (false == m_password.empty())
   {
#if (defined(NEGOTIATE_OPENSSL))
      OPENSSL_cleanse(m_password.data(), m_password.size());
#elif (defined(NEGOTIATE_SSPI))
      SecureZeroMemory(m_password.data(), m_password.size());
#endif
   }
   m_userName.clear();
   m_password.clear();
   m_domain.clear();
}

}
