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

#ifndef DIRLEASE_HOLDER_REGISTRY_HPP_
#define DIRLEASE_HOLDER_REGISTRY_HPP_

#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace dlease {
class lock_handle_t;

/// @brief A thread safe map from lock identities to the lock handles held by this process.
///
/// There is at most one handle per identity. The registry mutex is never held while calling into
/// a handle or the file system.
class holder_registry_t {
public:
  holder_registry_t() {
  }

  /// @brief Register a handle.
  /// @param file The lock identity.
  /// @param handle The lock handle.
  /// @returns false if a handle is already registered for the identity (nothing is changed).
  bool insert(const std::string& file, const std::shared_ptr<lock_handle_t>& handle);

  /// @brief Unregister a handle.
  ///
  /// The entry is only removed if it still refers to @c handle, so that a stale handle can never
  /// unregister a newer lock for the same identity.
  /// @param file The lock identity.
  /// @param handle The lock handle that is expected to be registered.
  /// @returns true if the entry was removed.
  bool erase(const std::string& file, const lock_handle_t* handle);

  /// @brief Look up the handle for an identity.
  /// @returns the handle, or an empty pointer if the identity is not registered.
  std::shared_ptr<lock_handle_t> find(const std::string& file) const;

  /// @returns true if a handle is registered for the identity.
  bool contains(const std::string& file) const;

  /// @returns the number of registered handles.
  std::size_t size() const;

  /// @returns a snapshot of all the registered handles.
  std::vector<std::shared_ptr<lock_handle_t>> handles() const;

private:
  // Prohibit copy & assignment.
  holder_registry_t(const holder_registry_t&) = delete;
  holder_registry_t& operator=(const holder_registry_t&) = delete;

  mutable std::mutex m_mutex;
  std::map<std::string, std::shared_ptr<lock_handle_t>> m_handles;
};

}  // namespace dlease

#endif  // DIRLEASE_HOLDER_REGISTRY_HPP_
