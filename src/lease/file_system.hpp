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

#ifndef DIRLEASE_FILE_SYSTEM_HPP_
#define DIRLEASE_FILE_SYSTEM_HPP_

#include <base/time_utils.hpp>

#include <memory>
#include <string>

namespace dlease {

/// @brief The primitive file system operations that the lock protocol is built on.
///
/// All operations report failures by throwing @c file::file_error_t, which makes it possible to
/// tell "not found" (and "already exists" for @c create_dir) apart from other errors.
///
/// The native implementation is returned by @c native_file_system(). Other implementations can be
/// passed in the lock options, e.g. for wrapping or instrumenting the native operations.
class file_system_t {
public:
  virtual ~file_system_t();

  /// @brief Atomically create a directory.
  /// @param path The directory to create.
  virtual void create_dir(const std::string& path) = 0;

  /// @brief Get the modification time of a file or directory.
  /// @param path The path to the file (or directory).
  /// @returns the modification time, in milliseconds since the Unix epoch.
  virtual time::millis_t modify_time(const std::string& path) = 0;

  /// @brief Set the access and modification times of a file or directory.
  /// @param path The path to the file (or directory).
  /// @param time The new time, in milliseconds since the Unix epoch.
  virtual void touch(const std::string& path, const time::millis_t time) = 0;

  /// @brief Read the contents of a file.
  virtual std::string read(const std::string& path) = 0;

  /// @brief Replace the contents of a file (create it if necessary).
  virtual void write(const std::string& data, const std::string& path) = 0;

  /// @brief Remove a file.
  virtual void remove_file(const std::string& path) = 0;

  /// @brief Remove an empty directory.
  virtual void remove_dir(const std::string& path) = 0;

  /// @brief Resolve a path to an absolute path, following symbolic links.
  /// @param path The path to resolve (it must exist).
  virtual std::string real_path(const std::string& path) = 0;

protected:
  // Constructor called by child classes.
  file_system_t();

private:
  // Prohibit copy & assignment.
  file_system_t(const file_system_t&) = delete;
  file_system_t& operator=(const file_system_t&) = delete;
};

/// @returns the native (POSIX) file system implementation.
std::shared_ptr<file_system_t> native_file_system();

}  // namespace dlease

#endif  // DIRLEASE_FILE_SYSTEM_HPP_
