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

#ifndef DIRLEASE_LOCK_ERROR_HPP_
#define DIRLEASE_LOCK_ERROR_HPP_

#include <stdexcept>
#include <string>

namespace dlease {

/// @brief Lock error codes.
enum class lock_errc_t {
  LOCKED,          ///< The lock is held by someone else (and it is not stale).
  NOT_ACQUIRED,    ///< The lock is not held by this process.
  RELEASED,        ///< The lock has already been released.
  NOT_FOUND,       ///< The path could not be resolved.
  UPDATE_TIMEOUT,  ///< The lock could not be renewed within the stale threshold.
  MISMATCH,        ///< The lock was reclaimed by someone else (ownership token mismatch).
  IO_ERROR         ///< An unexpected file system error.
};

/// @brief Convert a lock error code to a string.
/// @param code The error code.
/// @returns an upper case error code string, e.g. "ELOCKED".
std::string to_string(const lock_errc_t code);

/// @brief An error reported by the lock functions.
class lock_error_t : public std::runtime_error {
public:
  /// @brief Construct a lock error.
  /// @param code The error code.
  /// @param what A human readable description of the error.
  /// @param file The lock identity (canonical path) that the error relates to.
  /// @param sys_errno The system error number, for @c lock_errc_t::IO_ERROR (zero otherwise).
  lock_error_t(const lock_errc_t code,
               const std::string& what,
               const std::string& file,
               const int sys_errno = 0);

  lock_errc_t code() const {
    return m_code;
  }

  const std::string& file() const {
    return m_file;
  }

  int sys_errno() const {
    return m_errno;
  }

private:
  lock_errc_t m_code;
  std::string m_file;
  int m_errno;
};

}  // namespace dlease

#endif  // DIRLEASE_LOCK_ERROR_HPP_
