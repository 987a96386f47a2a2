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

#ifndef DIRLEASE_FILE_UTILS_HPP_
#define DIRLEASE_FILE_UTILS_HPP_

#include <base/time_utils.hpp>

#include <stdexcept>
#include <string>

namespace dlease {
namespace file {
/// @brief An error reported by a file system operation.
///
/// The error carries the system error number, so that callers can tell a missing file (ENOENT) or
/// an already existing file (EEXIST) apart from other failures.
class file_error_t : public std::runtime_error {
public:
  /// @brief Construct a file error.
  /// @param what A description of the failed operation.
  /// @param path The path that the operation was applied to.
  /// @param sys_errno The system error number (errno).
  file_error_t(const std::string& what, const std::string& path, const int sys_errno);

  /// @returns the path that the failed operation was applied to.
  const std::string& path() const {
    return m_path;
  }

  /// @returns the system error number (errno).
  int sys_errno() const {
    return m_errno;
  }

  /// @returns true if the operation failed because the file or directory does not exist.
  bool is_not_found() const;

  /// @returns true if the operation failed because the file or directory already exists.
  bool already_exists() const;

private:
  std::string m_path;
  int m_errno;
};

/// @brief A helper class for handling temporary files and directories.
///
/// When the temp file object is created, a temporary file name is generated. Once the object goes
/// out of scope, it removes the file or directory (recursively) from disk.
class tmp_file_t {
public:
  /// @brief Construct a temporary file name.
  /// @param dir The base directory in which the temporary file will be located.
  /// @param extension The file name extension (including the leading dot).
  tmp_file_t(const std::string& dir, const std::string& extension);

  /// @brief Remove the temporary file or directory (if any).
  ~tmp_file_t();

  const std::string& path() const {
    return m_path;
  }

private:
  std::string m_path;
};

///@{
/// @brief Append two paths.
/// @param path The base path.
/// @param append The path to be appended (e.g. a file name).
/// @returns the concatenated paths, using the system path separator.
/// @note If @c path is empty or @c append is empty, the result will not contain any path separator.
std::string append_path(const std::string& path, const std::string& append);
std::string append_path(const std::string& path, const char* append);
///@}

/// @brief Get the directory part of a path.
/// @param path The path to a file.
/// @returns The part of the path before the final path separator. If the path does not contain a
/// separator, an empty string is returned.
std::string get_dir_part(const std::string& path);

/// @brief Get a temporary directory for this user and process.
/// @returns the full path to the temporary directory.
std::string get_temp_dir();

/// @brief Get the user home directory.
/// @returns the full path to the user home directory.
std::string get_user_home_dir();

/// @brief Get the current working directory of the process.
/// @throws file_error_t if the working directory could not be determined.
std::string get_current_dir();

/// @returns true if the path is absolute.
bool is_absolute_path(const std::string& path);

/// @brief Lexically normalize a path.
///
/// Relative paths are made absolute against the current working directory. Then "." components,
/// ".." components and repeated separators are removed, without consulting the file system (i.e.
/// symbolic links are not resolved, and the path does not need to exist).
/// @param path The path to normalize.
/// @returns an absolute, normalized path.
std::string normalize_path(const std::string& path);

/// @brief Resolve a path.
///
/// Relative paths are converted into absolute paths, and symbolic links are resolved.
/// @param path The path to resolve.
/// @returns an absolute path to an existing file or directory.
/// @throws file_error_t if the path could not be resolved (e.g. if it does not exist).
std::string resolve_path(const std::string& path);

/// @brief Create a directory.
///
/// This is an atomic operation: exactly one of several concurrent callers succeeds, and the others
/// get an error for which @c file_error_t::already_exists() is true.
/// @param path The path to the directory.
/// @throws file_error_t if the directory could not be created.
void create_dir(const std::string& path);

/// @brief Remove an existing file.
/// @param path The path to the file.
/// @throws file_error_t if the file could not be removed.
void remove_file(const std::string& path);

/// @brief Remove an empty directory.
/// @param path The path to the directory.
/// @throws file_error_t if the directory could not be removed.
void remove_empty_dir(const std::string& path);

/// @brief Remove a directory and all its contents (recursively).
/// @param path The path to the dir.
/// @param ignore_errors Set this to true to ignore errors related to removing files.
/// @throws file_error_t if the dir could not be removed.
void remove_dir(const std::string& path, const bool ignore_errors = false);

/// @brief Check if a directory exists.
/// @param path The path to the directory.
/// @returns true if the directory exists.
bool dir_exists(const std::string& path);

/// @brief Check if a file exists.
/// @param path The path to the file.
/// @returns true if the file exists.
bool file_exists(const std::string& path);

/// @brief Get the modification time of a file or directory.
/// @param path The path to the file (or directory).
/// @returns the modification time, in milliseconds since the Unix epoch.
/// @throws file_error_t if the file information could not be read.
time::millis_t get_modify_time(const std::string& path);

/// @brief Set the access and modification times of a file or directory.
/// @param path The path to the file (or directory).
/// @param time The new time, in milliseconds since the Unix epoch.
/// @throws file_error_t if the times could not be updated.
void touch(const std::string& path, const time::millis_t time);

/// @brief Read a file into a string.
/// @param path The path to the file.
/// @returns the contents of the file as a string.
/// @throws file_error_t if the operation could not be completed.
std::string read(const std::string& path);

/// @brief Write a string to a file.
/// @param data The data string to write.
/// @param path The path to the file.
/// @throws file_error_t if the operation could not be completed.
void write(const std::string& data, const std::string& path);

/// @brief Create a unique ID string.
///
/// The ID is a random (version 4) UUID, generated from a cryptographically strong random source
/// when the system provides one.
/// @returns a string that contains a unique ID (36 printable characters).
std::string get_unique_id();

}  // namespace file
}  // namespace dlease

#endif  // DIRLEASE_FILE_UTILS_HPP_
