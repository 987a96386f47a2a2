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

#include <lease/lock_handle.hpp>

#include <base/debug_utils.hpp>
#include <base/file_utils.hpp>
#include <lease/holder_registry.hpp>
#include <lease/path_resolver.hpp>

#include <chrono>

namespace dlease {
namespace {
std::string trim(const std::string& str) {
  const auto first = str.find_first_not_of(" \t\r\n");
  if (first == std::string::npos) {
    return std::string();
  }
  const auto last = str.find_last_not_of(" \t\r\n");
  return str.substr(first, last - first + 1);
}
}  // namespace

const time::millis_t lock_handle_t::RETRY_DELAY_MS;

void remove_lock(const std::string& file, file_system_t& fs) {
  // Remove the uid file first, since the lock dir must be empty for it to be removed.
  try {
    fs.remove_file(get_uid_file(file));
  } catch (const file::file_error_t& e) {
    if (!e.is_not_found()) {
      throw;
    }
  }

  try {
    fs.remove_dir(get_lock_dir(file));
  } catch (const file::file_error_t& e) {
    if (!e.is_not_found()) {
      throw;
    }
  }
}

lock_handle_t::lock_handle_t(const std::string& file,
                             const std::string& uid,
                             const lock_options_t& options,
                             compromised_handler_t on_compromised,
                             holder_registry_t& registry)
    : m_file(file),
      m_uid(uid),
      m_options(options),
      m_on_compromised(std::move(on_compromised)),
      m_registry(registry),
      m_last_update(time::millis_since_epoch()),
      m_update_delay(options.update_ms) {
}

lock_handle_t::~lock_handle_t() {
  stop_renewal();
}

void lock_handle_t::start_renewal() {
  // Hold the state mutex so that the thread does not start renewing before m_thread is set.
  std::lock_guard<std::mutex> guard(m_mutex);
  std::lock_guard<std::mutex> thread_guard(m_thread_mutex);
  m_thread = std::thread(&lock_handle_t::renewal_loop, shared_from_this());
}

void lock_handle_t::release() {
  {
    std::lock_guard<std::mutex> guard(m_mutex);
    if (m_released) {
      throw lock_error_t(lock_errc_t::RELEASED, "Lock is already released", m_file);
    }
    m_released = true;
  }

  // Cancel the renewal timer, and wait for a renewal that is in flight (it will not reschedule).
  m_cv.notify_all();
  stop_renewal();

  m_registry.erase(m_file, this);

  try {
    remove_lock(m_file, *m_options.fs);
  } catch (const file::file_error_t& e) {
    throw lock_error_t(lock_errc_t::IO_ERROR, e.what(), m_file, e.sys_errno());
  }

  debug::log(debug::DEBUG) << "Released " << m_file;
}

void lock_handle_t::shutdown() noexcept {
  try {
    if (!released()) {
      release();
    }
  } catch (const lock_error_t& e) {
    if (e.code() != lock_errc_t::RELEASED) {
      debug::log(debug::ERROR) << "Unable to release " << m_file << ": " << e.what();
    }
  } catch (const std::exception& e) {
    debug::log(debug::ERROR) << "Unable to release " << m_file << ": " << e.what();
  }

  // The lock may have been compromised by the renewal thread, which might still be running.
  stop_renewal();
}

bool lock_handle_t::released() const {
  std::lock_guard<std::mutex> guard(m_mutex);
  return m_released;
}

bool lock_handle_t::compromised() const {
  std::lock_guard<std::mutex> guard(m_mutex);
  return m_compromised;
}

void lock_handle_t::stop_renewal() {
  std::lock_guard<std::mutex> thread_guard(m_thread_mutex);
  if (m_thread.joinable()) {
    // The last reference to the handle may be dropped by the renewal thread itself.
    if (m_thread.get_id() == std::this_thread::get_id()) {
      m_thread.detach();
    } else {
      m_thread.join();
    }
  }
}

lock_handle_t::renewal_result_t lock_handle_t::renew() {
  renewal_result_t result;
  const auto lock_dir = get_lock_dir(m_file);

  // Read the ownership token and refresh the heartbeat. Both are attempted, and a "not found"
  // error takes precedence, since it means that the lock was removed.
  try {
    m_options.fs->touch(lock_dir, time::millis_since_epoch());
  } catch (const file::file_error_t& e) {
    result.error = e.what();
    result.sys_errno = e.sys_errno();
    result.not_found = e.is_not_found();
  }

  try {
    result.uid = m_options.fs->read(get_uid_file(m_file));
  } catch (const file::file_error_t& e) {
    if (result.error.empty() || (e.is_not_found() && !result.not_found)) {
      result.error = e.what();
      result.sys_errno = e.sys_errno();
      result.not_found = e.is_not_found();
    }
  }

  return result;
}

void lock_handle_t::renewal_loop() {
  std::unique_lock<std::mutex> guard(m_mutex);
  while (!m_released) {
    const auto delay = std::chrono::milliseconds(m_update_delay);
    if (m_cv.wait_for(guard, delay, [this] { return m_released; })) {
      break;
    }

    // Do the file system operations without holding the lock.
    guard.unlock();
    const auto result = renew();
    guard.lock();

    // The lock was released while the renewal was in flight.
    if (m_released) {
      break;
    }

    // A renewal that lands after the stale threshold is worthless, since someone else may already
    // have reclaimed the lock.
    const auto now = time::millis_since_epoch();
    if (m_last_update <= now - m_options.stale_ms) {
      m_released = true;
      m_compromised = true;
      std::string message = "Unable to update lock within the stale threshold";
      if (!m_update_error.empty()) {
        message += ": " + m_update_error;
      }
      guard.unlock();
      debug::log(debug::ERROR) << message << " (" << m_file << ")";
      release_quietly();
      notify_compromised(lock_error_t(lock_errc_t::UPDATE_TIMEOUT, message, m_file));
      return;
    }

    if (!result.error.empty()) {
      if (result.not_found) {
        // The lock was removed behind our back.
        m_released = true;
        m_compromised = true;
        guard.unlock();
        debug::log(debug::ERROR) << "Lost lock " << m_file << ": " << result.error;
        release_quietly();
        notify_compromised(
            lock_error_t(lock_errc_t::NOT_FOUND, result.error, m_file, result.sys_errno));
        return;
      }

      // Keep trying (more frequently) until the stale threshold has passed.
      debug::log(debug::WARNING) << "Unable to update lock " << m_file << ": " << result.error;
      m_update_error = result.error;
      m_update_delay = RETRY_DELAY_MS;
      continue;
    }

    if (trim(result.uid) != m_uid) {
      // Someone else has reclaimed the lock. It is theirs now, so leave the artifacts alone.
      m_released = true;
      m_compromised = true;
      guard.unlock();
      debug::log(debug::ERROR) << "Lock uid mismatch for " << m_file;
      m_registry.erase(m_file, this);
      notify_compromised(lock_error_t(lock_errc_t::MISMATCH, "Lock uid mismatch", m_file));
      return;
    }

    m_last_update = now;
    m_update_error.clear();
    m_update_delay = m_options.update_ms;
  }
}

void lock_handle_t::release_quietly() {
  m_registry.erase(m_file, this);
  try {
    remove_lock(m_file, *m_options.fs);
  } catch (const file::file_error_t& e) {
    debug::log(debug::ERROR) << "Unable to remove lock " << m_file << ": " << e.what();
  }
}

void lock_handle_t::notify_compromised(const lock_error_t& error) {
  if (m_on_compromised) {
    m_on_compromised(error);
  }
}

}  // namespace dlease
