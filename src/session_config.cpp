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

#include "common/utility.hpp" ///< for negotiate::unreachable
#include "negotiate/credential.hpp" ///< for negotiate::credential
#include "negotiate/session_config.hpp" ///< for negotiate::authentication_role, negotiate::protection_level, negotiate::session_config

#include <string> ///< for std::string
#include <string_view> ///< for std::string_view
#include <utility> ///< for std::move

namespace negotiate
{

std::string_view to_string(authentication_role const role) noexcept
{
   switch (role)
   {
   case authentication_role::client: return std::string_view{"client",};
   case authentication_role::server: return std::string_view{"server",};
   }
   unreachable();
}

std::string_view to_string(protection_level const level) noexcept
{
   switch (level)
   {
   case protection_level::none: return std::string_view{"none",};
   case protection_level::sign: return std::string_view{"sign",};
   case protection_level::encrypt_and_sign: return std::string_view{"encrypt_and_sign",};
   }
   unreachable();
}

session_config session_config::with_package(std::string_view const &value) const
{
   auto config{*this,};
   config.m_package = std::string{value,};
   return config;
}

session_config session_config::with_credential(negotiate::credential value) const
{
   auto config{*this,};
   config.m_credential = std::move(value);
   return config;
}

session_config session_config::with_target_name(std::string_view const &value) const
{
   auto config{*this,};
   config.m_targetName = std::string{value,};
   return config;
}

session_config session_config::with_required_protection_level(protection_level const value) const
{
   auto config{*this,};
   config.m_requiredProtectionLevel = value;
   return config;
}

}
