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

#ifndef DIRLEASE_LOCK_MANAGER_HPP_
#define DIRLEASE_LOCK_MANAGER_HPP_

#include <lease/holder_registry.hpp>
#include <lease/lock_error.hpp>
#include <lease/lock_handle.hpp>
#include <lease/lock_options.hpp>

#include <memory>
#include <string>

namespace dlease {
class lock_manager_t;

/// @brief A lock that has been acquired by a lock manager.
///
/// The lease releases the lock when it goes out of scope, unless it has been released explicitly
/// or the lock has been compromised.
class lease_t {
public:
  /// @brief Construct an empty lease (not holding any lock).
  lease_t() {
  }

  lease_t(lease_t&& other) = default;
  lease_t& operator=(lease_t&& other);

  ~lease_t();

  /// @brief Release the lock.
  /// @throws lock_error_t (RELEASED if the lock has already been released or compromised).
  void release();

  /// @returns true if the lock is still believed to be held.
  bool has_lock() const;

  /// @returns true if the lock was lost involuntarily (as opposed to released).
  bool compromised() const;

  /// @returns the ownership token of the lock, or an empty string for an empty lease.
  const std::string& uid() const;

  /// @returns the lock identity (canonical path), or an empty string for an empty lease.
  const std::string& file() const;

private:
  // Prohibit copy & assignment.
  lease_t(const lease_t&) = delete;
  lease_t& operator=(const lease_t&) = delete;

  explicit lease_t(std::shared_ptr<lock_handle_t> handle);

  void release_quietly() noexcept;

  std::shared_ptr<lock_handle_t> m_handle;

  friend class lock_manager_t;
};

/// @brief A set of locks held by this process.
///
/// Each lock manager has its own registry of held locks. Two lock managers behave like two
/// independent processes with respect to each other.
///
/// The destructor releases all the locks that are still held. Note that it is a best effort: locks
/// are left on disk (and will eventually become stale) if the process is killed or crashes.
class lock_manager_t {
public:
  lock_manager_t() {
  }

  ~lock_manager_t();

  /// @brief Acquire a lock.
  ///
  /// If the lock is held by someone else, the acquisition is retried according to the retry policy
  /// of the options. A lock that has not been renewed within the stale threshold is reclaimed.
  /// @param path The path to lock (it must exist, unless symbolic link resolution is disabled).
  /// @param options The lock options.
  /// @param on_compromised A function that is called if the lock is lost involuntarily. If empty,
  /// the default handler is used, which terminates the process.
  /// @returns a lease that holds the lock.
  /// @throws lock_error_t if the lock could not be acquired.
  lease_t lock(const std::string& path,
               const lock_options_t& options,
               compromised_handler_t on_compromised = compromised_handler_t());

  /// @brief Release a lock that is held by this manager.
  /// @param path The locked path.
  /// @param options The lock options (used for resolving the path).
  /// @throws lock_error_t (NOT_ACQUIRED if the lock is not held by this manager).
  void unlock(const std::string& path, const lock_options_t& options);

  /// @returns true if the lock for @c path is held by this manager.
  bool is_held(const std::string& path, const lock_options_t& options) const;

  /// @returns the number of locks held by this manager.
  std::size_t size() const;

private:
  // Prohibit copy & assignment.
  lock_manager_t(const lock_manager_t&) = delete;
  lock_manager_t& operator=(const lock_manager_t&) = delete;

  std::string acquire_lock(const std::string& file, const lock_options_t& options);
  bool try_create_lock(const std::string& file, const lock_options_t& options, std::string& uid);

  holder_registry_t m_registry;
};

/// @brief The default compromise handler: log the error and terminate the process.
void default_compromised_handler(const lock_error_t& error);

/// @returns the process wide lock manager.
lock_manager_t& default_manager();

/// @brief Acquire a lock using the process wide lock manager and the configured options.
lease_t lock(const std::string& path,
             compromised_handler_t on_compromised = compromised_handler_t());

/// @brief Acquire a lock using the process wide lock manager.
lease_t lock(const std::string& path,
             const lock_options_t& options,
             compromised_handler_t on_compromised = compromised_handler_t());

/// @brief Release a lock that is held by the process wide lock manager.
void unlock(const std::string& path);

/// @brief Release a lock that is held by the process wide lock manager.
void unlock(const std::string& path, const lock_options_t& options);

}  // namespace dlease

#endif  // DIRLEASE_LOCK_MANAGER_HPP_
