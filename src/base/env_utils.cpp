//--------------------------------------------------------------------------------------------------
// Copyright (c) 2020 Marcus Geelnard
//
// This software is provided 'as-is', without any express or implied warranty. In no event will the
// authors be held liable for any damages arising from the use of this software.
//
// Permission is granted to anyone to use this software for any purpose, including commercial
// applications, and to alter it and redistribute it freely, subject to the following restrictions:
//
//  1. The origin of this software must not be misrepresented; you must not claim that you wrote
//     the original software. If you use this software in a product, an acknowledgment in the
//     product documentation would be appreciated but is not required.
//
//  2. Altered source versions must be plainly marked as such, and must not be misrepresented as
//     being the original software.
//
//  3. This notice may not be removed or altered from any source distribution.
//--------------------------------------------------------------------------------------------------

#include <base/env_utils.hpp>

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <stdexcept>

namespace dlease {
namespace {
std::string to_lower(const std::string& str) {
  std::string str_lower(str.size(), ' ');
  std::transform(str.begin(), str.end(), str_lower.begin(), ::tolower);
  return str_lower;
}

std::string trim(const std::string& str) {
  const auto first = str.find_first_not_of(" \t\r\n");
  if (first == std::string::npos) {
    return std::string();
  }
  const auto last = str.find_last_not_of(" \t\r\n");
  return str.substr(first, last - first + 1);
}
}  // namespace

env_var_t::env_var_t(const std::string& name) : m_defined(false) {
  if (env_defined(name)) {
    m_value = get_env(name);
    m_defined = true;
  }
}

int64_t env_var_t::as_int64() const {
  // Reject trailing garbage such as "10s", which std::stoll would silently accept.
  const auto value = trim(m_value);
  std::size_t pos = 0;
  const auto result = std::stoll(value, &pos);
  if (pos != value.size()) {
    throw std::invalid_argument("Not an integer: " + m_value);
  }
  return static_cast<int64_t>(result);
}

bool env_var_t::as_bool() const {
  const auto value_lower = to_lower(trim(m_value));
  return m_defined && (!value_lower.empty()) && (value_lower != "false") &&
         (value_lower != "no") && (value_lower != "off") && (value_lower != "0");
}

scoped_set_env_t::scoped_set_env_t(const std::string& name, const std::string& value)
    : m_name(name), m_old_env_var(name) {
  set_env(name, value);
}

scoped_set_env_t::~scoped_set_env_t() {
  if (!m_old_env_var) {
    unset_env(m_name);
  } else {
    set_env(m_name, m_old_env_var.as_string());
  }
}

bool env_defined(const std::string& env_var) {
  return ::getenv(env_var.c_str()) != nullptr;
}

const std::string get_env(const std::string& env_var) {
  const auto* env = ::getenv(env_var.c_str());
  return env != nullptr ? std::string(env) : std::string();
}

void set_env(const std::string& env_var, const std::string& value) {
  (void)::setenv(env_var.c_str(), value.c_str(), 1);
}

void unset_env(const std::string& env_var) {
  (void)::unsetenv(env_var.c_str());
}

}  // namespace dlease
