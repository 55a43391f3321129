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

#include "negotiate/credential.hpp" ///< for negotiate::credential

#include <cstdint> ///< for uint8_t
#include <string> ///< for std::string
#include <string_view> ///< for std::string_view

namespace negotiate
{

enum struct authentication_role : uint8_t
{
   client,
   server,
};

/// Ordered by strength, a stronger level satisfies every weaker requirement
enum struct protection_level : uint8_t
{
   none = 0,
   sign,
   encrypt_and_sign,
};

[[nodiscard]] std::string_view to_string(authentication_role role) noexcept;
[[nodiscard]] std::string_view to_string(protection_level level) noexcept;

class session_config final
{
public:
   [[nodiscard]] session_config() = default;
   [[nodiscard]] session_config(session_config &&rhs) = default;
   [[nodiscard]] session_config(session_config const &rhs) = default;

   session_config &operator = (session_config &&rhs) = default;
   session_config &operator = (session_config const &rhs) = default;

   [[nodiscard]] std::string_view package() const noexcept
   {
      return m_package;
   }

   [[nodiscard]] negotiate::credential const &credential() const noexcept
   {
      return m_credential;
   }

   /// Meaningful for client sessions only
   [[nodiscard]] std::string_view target_name() const noexcept
   {
      return m_targetName;
   }

   [[nodiscard]] protection_level required_protection_level() const noexcept
   {
      return m_requiredProtectionLevel;
   }

   [[nodiscard]] session_config with_package(std::string_view const &value) const;
   [[nodiscard]] session_config with_credential(negotiate::credential value) const;
   [[nodiscard]] session_config with_target_name(std::string_view const &value) const;
   [[nodiscard]] session_config with_required_protection_level(protection_level value) const;

private:
   std::string m_package{"Negotiate",};
   negotiate::credential m_credential{};
   std::string m_targetName{};
   protection_level m_requiredProtectionLevel{protection_level::none,};
};

}
