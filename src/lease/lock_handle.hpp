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

#ifndef DIRLEASE_LOCK_HANDLE_HPP_
#define DIRLEASE_LOCK_HANDLE_HPP_

#include <base/time_utils.hpp>
#include <lease/file_system.hpp>
#include <lease/lock_error.hpp>
#include <lease/lock_options.hpp>

#include <condition_variable>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

namespace dlease {
class holder_registry_t;

/// @brief A function that is called when a lock is lost involuntarily.
///
/// The handler is called at most once per lock, from the renewal thread of the lock.
using compromised_handler_t = std::function<void(const lock_error_t&)>;

/// @brief Remove the on-disk artifacts of a lock (the ownership token file and the lock dir).
///
/// Artifacts that do not exist are silently skipped.
/// @param file The lock identity.
/// @param fs The file system.
/// @throws file::file_error_t if an artifact could not be removed.
void remove_lock(const std::string& file, file_system_t& fs);

/// @brief The in-process state of a held lock.
///
/// A handle is created by the lock manager once the lock has been acquired on disk. It keeps the
/// lock fresh by touching the lock directory from a background thread, and verifies on every
/// renewal that the ownership token on disk is still ours.
///
/// The renewal thread keeps a reference to the handle, so a handle lives at least until its
/// renewal thread has finished.
class lock_handle_t : public std::enable_shared_from_this<lock_handle_t> {
public:
  /// @brief The renewal interval that is used after a failed renewal (milliseconds).
  static const time::millis_t RETRY_DELAY_MS = 1000;

  /// @brief Create a handle for an acquired lock.
  /// @param file The lock identity (canonical path).
  /// @param uid The ownership token that was written to the lock.
  /// @param options The (normalized) lock options.
  /// @param on_compromised The compromise handler.
  /// @param registry The registry that the handle will be registered in.
  lock_handle_t(const std::string& file,
                const std::string& uid,
                const lock_options_t& options,
                compromised_handler_t on_compromised,
                holder_registry_t& registry);

  ~lock_handle_t();

  /// @brief Start the renewal thread.
  void start_renewal();

  /// @brief Release the lock.
  ///
  /// The renewal is stopped (a renewal that is in flight is waited for), the handle is removed from
  /// the registry and the on-disk artifacts are removed.
  /// @throws lock_error_t (RELEASED if the lock has already been released or compromised, IO_ERROR
  /// if the on-disk artifacts could not be removed).
  void release();

  /// @brief Release the lock if it is still held, and wait for the renewal thread to finish.
  ///
  /// Errors are logged, not thrown.
  void shutdown() noexcept;

  /// @returns true if the lock has been released (voluntarily or not).
  bool released() const;

  /// @returns true if the lock was lost involuntarily (the compromise handler has been called or is
  /// about to be called).
  bool compromised() const;

  const std::string& file() const {
    return m_file;
  }

  const std::string& uid() const {
    return m_uid;
  }

private:
  // Prohibit copy & assignment.
  lock_handle_t(const lock_handle_t&) = delete;
  lock_handle_t& operator=(const lock_handle_t&) = delete;

  struct renewal_result_t {
    std::string uid;
    std::string error;
    int sys_errno = 0;
    bool not_found = false;
  };

  void renewal_loop();
  renewal_result_t renew();
  void release_quietly();
  void notify_compromised(const lock_error_t& error);
  void stop_renewal();

  const std::string m_file;
  const std::string m_uid;
  const lock_options_t m_options;
  const compromised_handler_t m_on_compromised;
  holder_registry_t& m_registry;

  // Guards the renewal state below.
  mutable std::mutex m_mutex;
  std::condition_variable m_cv;
  bool m_released = false;
  bool m_compromised = false;
  time::millis_t m_last_update;
  time::millis_t m_update_delay;
  std::string m_update_error;

  // Guards m_thread (it may be stopped from several threads).
  std::mutex m_thread_mutex;
  std::thread m_thread;
};

}  // namespace dlease

#endif  // DIRLEASE_LOCK_HANDLE_HPP_
