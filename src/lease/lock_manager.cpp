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

#include <lease/lock_manager.hpp>

#include <base/debug_utils.hpp>
#include <base/file_utils.hpp>
#include <base/time_utils.hpp>
#include <lease/path_resolver.hpp>

#include <exception>

namespace dlease {

//--------------------------------------------------------------------------------------------------
// lease_t
//--------------------------------------------------------------------------------------------------

lease_t::lease_t(std::shared_ptr<lock_handle_t> handle) : m_handle(std::move(handle)) {
}

lease_t& lease_t::operator=(lease_t&& other) {
  if (this != &other) {
    release_quietly();
    m_handle = std::move(other.m_handle);
  }
  return *this;
}

lease_t::~lease_t() {
  release_quietly();
}

void lease_t::release() {
  if (!m_handle) {
    throw lock_error_t(lock_errc_t::RELEASED, "The lease does not hold a lock", std::string());
  }
  m_handle->release();
}

bool lease_t::has_lock() const {
  return m_handle && !m_handle->released();
}

bool lease_t::compromised() const {
  return m_handle && m_handle->compromised();
}

const std::string& lease_t::file() const {
  static const std::string s_no_file;
  return m_handle ? m_handle->file() : s_no_file;
}

const std::string& lease_t::uid() const {
  static const std::string s_no_uid;
  return m_handle ? m_handle->uid() : s_no_uid;
}

void lease_t::release_quietly() noexcept {
  if (m_handle && !m_handle->released()) {
    m_handle->shutdown();
  }
}

//--------------------------------------------------------------------------------------------------
// lock_manager_t
//--------------------------------------------------------------------------------------------------

lock_manager_t::~lock_manager_t() {
  for (const auto& handle : m_registry.handles()) {
    handle->shutdown();
  }
}

lease_t lock_manager_t::lock(const std::string& path,
                             const lock_options_t& options,
                             compromised_handler_t on_compromised) {
  const auto opts = options.normalized();
  const auto file = resolve_lock_path(path, opts.resolve_symlinks, *opts.fs);
  if (!on_compromised) {
    on_compromised = default_compromised_handler;
  }

  // Try to acquire the lock, and retry (with back-off) while it is held by someone else.
  std::string uid;
  const auto timeouts = opts.retries.timeouts();
  for (std::size_t attempt = 0;; ++attempt) {
    try {
      uid = acquire_lock(file, opts);
      break;
    } catch (const lock_error_t& e) {
      if (attempt >= timeouts.size()) {
        throw;
      }
      debug::log(debug::DEBUG) << "Unable to lock " << file << " (" << e.what() << "), retrying in "
                               << timeouts[attempt] << " ms";
      time::sleep_millis(timeouts[attempt]);
    } catch (const file::file_error_t& e) {
      // The ownership token could not be written.
      throw lock_error_t(lock_errc_t::IO_ERROR, e.what(), file, e.sys_errno());
    }
  }

  auto handle = std::make_shared<lock_handle_t>(file, uid, opts, on_compromised, m_registry);
  if (!m_registry.insert(file, handle)) {
    // Another thread of this process won the race for the same lock.
    handle->shutdown();
    throw lock_error_t(lock_errc_t::LOCKED, "Lock is already being held", file);
  }
  handle->start_renewal();

  debug::log(debug::DEBUG) << "Locked " << file;
  return lease_t(handle);
}

void lock_manager_t::unlock(const std::string& path, const lock_options_t& options) {
  const auto opts = options.normalized();
  const auto file = resolve_lock_path(path, opts.resolve_symlinks, *opts.fs);
  const auto handle = m_registry.find(file);
  if (!handle) {
    throw lock_error_t(lock_errc_t::NOT_ACQUIRED, "Lock is not acquired/owned by you", file);
  }
  handle->release();
}

bool lock_manager_t::is_held(const std::string& path, const lock_options_t& options) const {
  const auto opts = options.normalized();
  const auto file = resolve_lock_path(path, opts.resolve_symlinks, *opts.fs);
  return m_registry.contains(file);
}

std::size_t lock_manager_t::size() const {
  return m_registry.size();
}

std::string lock_manager_t::acquire_lock(const std::string& file, const lock_options_t& options) {
  // Fail fast if we already hold the lock.
  if (m_registry.contains(file)) {
    throw lock_error_t(lock_errc_t::LOCKED, "Lock is already being held", file);
  }

  std::string uid;
  if (try_create_lock(file, options, uid)) {
    return uid;
  }

  // The lock dir exists. Check if it is stale.
  const auto lock_dir = get_lock_dir(file);
  try {
    const auto mtime = options.fs->modify_time(lock_dir);
    if (mtime >= time::millis_since_epoch() - options.stale_ms) {
      throw lock_error_t(lock_errc_t::LOCKED, "Lock is already being held", file);
    }

    debug::log(debug::INFO) << "Removing stale lock " << lock_dir;
    remove_lock(file, *options.fs);
  } catch (const file::file_error_t& e) {
    // If the lock dir was removed in the meantime, just try again.
    if (!e.is_not_found()) {
      throw lock_error_t(lock_errc_t::IO_ERROR, e.what(), file, e.sys_errno());
    }
  }

  // Only try once more, so that two processes that reclaim the same stale lock can not keep
  // removing each other's locks.
  if (try_create_lock(file, options, uid)) {
    return uid;
  }
  throw lock_error_t(lock_errc_t::LOCKED, "Lock is already being held", file);
}

bool lock_manager_t::try_create_lock(const std::string& file,
                                     const lock_options_t& options,
                                     std::string& uid) {
  try {
    options.fs->create_dir(get_lock_dir(file));
  } catch (const file::file_error_t& e) {
    if (e.already_exists()) {
      return false;
    }
    throw lock_error_t(lock_errc_t::IO_ERROR, e.what(), file, e.sys_errno());
  }

  uid = file::get_unique_id();
  try {
    options.fs->write(uid, get_uid_file(file));
  } catch (const file::file_error_t&) {
    try {
      remove_lock(file, *options.fs);
    } catch (const file::file_error_t& e) {
      debug::log(debug::ERROR) << "Unable to remove lock " << file << ": " << e.what();
    }
    throw;
  }
  return true;
}

//--------------------------------------------------------------------------------------------------
// Process wide API
//--------------------------------------------------------------------------------------------------

void default_compromised_handler(const lock_error_t& error) {
  debug::log(debug::FATAL) << "Lock compromised (" << to_string(error.code()) << "): "
                           << error.what() << " (" << error.file() << ")";
  std::terminate();
}

lock_manager_t& default_manager() {
  static lock_manager_t s_manager;
  return s_manager;
}

lease_t lock(const std::string& path, compromised_handler_t on_compromised) {
  return default_manager().lock(path, lock_options_t::from_config(), std::move(on_compromised));
}

lease_t lock(const std::string& path,
             const lock_options_t& options,
             compromised_handler_t on_compromised) {
  return default_manager().lock(path, options, std::move(on_compromised));
}

void unlock(const std::string& path) {
  default_manager().unlock(path, lock_options_t::from_config());
}

void unlock(const std::string& path, const lock_options_t& options) {
  default_manager().unlock(path, options);
}

}  // namespace dlease
