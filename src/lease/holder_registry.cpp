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

#include <lease/holder_registry.hpp>

namespace dlease {

bool holder_registry_t::insert(const std::string& file,
                               const std::shared_ptr<lock_handle_t>& handle) {
  std::lock_guard<std::mutex> lock(m_mutex);
  return m_handles.emplace(file, handle).second;
}

bool holder_registry_t::erase(const std::string& file, const lock_handle_t* handle) {
  std::lock_guard<std::mutex> lock(m_mutex);
  const auto it = m_handles.find(file);
  if (it == m_handles.end() || it->second.get() != handle) {
    return false;
  }
  m_handles.erase(it);
  return true;
}

std::shared_ptr<lock_handle_t> holder_registry_t::find(const std::string& file) const {
  std::lock_guard<std::mutex> lock(m_mutex);
  const auto it = m_handles.find(file);
  return it != m_handles.end() ? it->second : std::shared_ptr<lock_handle_t>();
}

bool holder_registry_t::contains(const std::string& file) const {
  std::lock_guard<std::mutex> lock(m_mutex);
  return m_handles.find(file) != m_handles.end();
}

std::size_t holder_registry_t::size() const {
  std::lock_guard<std::mutex> lock(m_mutex);
  return m_handles.size();
}

std::vector<std::shared_ptr<lock_handle_t>> holder_registry_t::handles() const {
  std::lock_guard<std::mutex> lock(m_mutex);
  std::vector<std::shared_ptr<lock_handle_t>> result;
  result.reserve(m_handles.size());
  for (const auto& entry : m_handles) {
    result.emplace_back(entry.second);
  }
  return result;
}

}  // namespace dlease
