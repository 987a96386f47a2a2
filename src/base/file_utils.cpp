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

#include <base/file_utils.hpp>

#include <base/debug_utils.hpp>
#include <base/env_utils.hpp>

#include <atomic>
#include <cerrno>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <sstream>
#include <vector>

#include <dirent.h>
#include <fcntl.h>
#include <limits.h>
#include <sys/stat.h>
#include <sys/types.h>
#include <unistd.h>

#include <uuid/uuid.h>

namespace dlease {
namespace file {
namespace {
// Directory separator for paths.
const char PATH_SEPARATOR_CHR = '/';
const auto PATH_SEPARATOR = std::string(1, PATH_SEPARATOR_CHR);

// This is a static variable that holds a strictly incrementing number used for generating unique
// temporary file names.
std::atomic_uint_fast32_t s_tmp_name_number;

std::string::size_type get_last_path_separator_pos(const std::string& path) {
  return path.rfind(PATH_SEPARATOR);
}

std::string describe(const std::string& what, const int sys_errno) {
  std::ostringstream ss;
  ss << what << " (" << std::strerror(sys_errno) << ")";
  return ss.str();
}
}  // namespace

file_error_t::file_error_t(const std::string& what, const std::string& path, const int sys_errno)
    : std::runtime_error(describe(what + " " + path, sys_errno)), m_path(path), m_errno(sys_errno) {
}

bool file_error_t::is_not_found() const {
  return m_errno == ENOENT;
}

bool file_error_t::already_exists() const {
  return m_errno == EEXIST;
}

tmp_file_t::tmp_file_t(const std::string& dir, const std::string& extension) {
  // Get unique identifiers for this file.
  const auto pid = static_cast<int>(getpid());
  const auto number = ++s_tmp_name_number;

  // Generate a file name from the unique identifiers.
  std::ostringstream ss;
  ss << "dirlease" << pid << "_" << number;
  std::string file_name = ss.str();

  // Concatenate base dir, file name and extension into the full path.
  m_path = append_path(dir, file_name + extension);
}

tmp_file_t::~tmp_file_t() {
  try {
    if (file_exists(m_path)) {
      remove_file(m_path);
    } else if (dir_exists(m_path)) {
      remove_dir(m_path);
    }
  } catch (const std::exception& e) {
    debug::log(debug::ERROR) << e.what();
  }
}

std::string append_path(const std::string& path, const std::string& append) {
  if (path.empty() || append.empty()) {
    return path + append;
  }
  return path + PATH_SEPARATOR + append;
}

std::string append_path(const std::string& path, const char* append) {
  return append_path(path, std::string(append));
}

std::string get_dir_part(const std::string& path) {
  const auto pos = get_last_path_separator_pos(path);
  return (pos != std::string::npos) ? path.substr(0, pos) : std::string();
}

std::string get_temp_dir() {
  // 1. Try $TMPDIR. See:
  //    https://pubs.opengroup.org/onlinepubs/9699919799/basedefs/V1_chap08.html#tag_08_03
  env_var_t tmpdir("TMPDIR");
  if (tmpdir && dir_exists(tmpdir.as_string())) {
    return tmpdir.as_string();
  }

  // 2. Fall back to /tmp. See:
  //    http://refspecs.linuxfoundation.org/FHS_3.0/fhs/ch03s18.html
  return std::string("/tmp");
}

std::string get_user_home_dir() {
  return get_env("HOME");
}

std::string get_current_dir() {
  std::vector<char> buf(PATH_MAX + 1);
  if (::getcwd(buf.data(), buf.size()) == nullptr) {
    throw file_error_t("Unable to get the current directory", std::string(), errno);
  }
  return std::string(buf.data());
}

bool is_absolute_path(const std::string& path) {
  return (path.size() >= 1) && (path[0] == PATH_SEPARATOR_CHR);
}

std::string normalize_path(const std::string& path) {
  const auto full_path = is_absolute_path(path) ? path : append_path(get_current_dir(), path);

  // Split the path into components, and collapse "." and "..".
  std::vector<std::string> parts;
  std::string::size_type start = 0;
  while (start <= full_path.size()) {
    auto end = full_path.find(PATH_SEPARATOR_CHR, start);
    if (end == std::string::npos) {
      end = full_path.size();
    }
    const auto part = full_path.substr(start, end - start);
    if (part == "..") {
      // The parent of the root is the root.
      if (!parts.empty()) {
        parts.pop_back();
      }
    } else if (!part.empty() && part != ".") {
      parts.emplace_back(part);
    }
    start = end + 1;
  }

  std::string result;
  for (const auto& part : parts) {
    result += PATH_SEPARATOR + part;
  }
  return result.empty() ? PATH_SEPARATOR : result;
}

std::string resolve_path(const std::string& path) {
  auto* char_ptr = ::realpath(path.c_str(), nullptr);
  if (char_ptr == nullptr) {
    throw file_error_t("Unable to resolve path", path, errno);
  }
  const auto result = std::string(char_ptr);
  std::free(char_ptr);
  return result;
}

void create_dir(const std::string& path) {
  if (::mkdir(path.c_str(), S_IRWXU | S_IRWXG | S_IROTH | S_IXOTH) != 0) {
    throw file_error_t("Unable to create directory", path, errno);
  }
}

void remove_file(const std::string& path) {
  if (::unlink(path.c_str()) != 0) {
    throw file_error_t("Unable to remove file", path, errno);
  }
}

void remove_empty_dir(const std::string& path) {
  if (::rmdir(path.c_str()) != 0) {
    throw file_error_t("Unable to remove directory", path, errno);
  }
}

void remove_dir(const std::string& path, const bool ignore_errors) {
  auto* dir = ::opendir(path.c_str());
  if (dir == nullptr) {
    if (ignore_errors) {
      return;
    }
    throw file_error_t("Unable to walk the directory", path, errno);
  }

  // Collect the entries first, so that we do not modify the directory while reading it.
  std::vector<std::string> entries;
  for (auto* entity = ::readdir(dir); entity != nullptr; entity = ::readdir(dir)) {
    const auto name = std::string(entity->d_name);
    if ((name != ".") && (name != "..")) {
      entries.emplace_back(append_path(path, name));
    }
  }
  ::closedir(dir);

  for (const auto& entry : entries) {
    struct stat entry_stat;
    const bool is_dir = (::lstat(entry.c_str(), &entry_stat) == 0) && S_ISDIR(entry_stat.st_mode);
    try {
      if (is_dir) {
        remove_dir(entry, ignore_errors);
      } else {
        remove_file(entry);
      }
    } catch (const file_error_t&) {
      if (!ignore_errors) {
        throw;
      }
    }
  }

  try {
    remove_empty_dir(path);
  } catch (const file_error_t&) {
    if (!ignore_errors) {
      throw;
    }
  }
}

bool dir_exists(const std::string& path) {
  struct stat buffer;
  const auto success = (::stat(path.c_str(), &buffer) == 0);
  return success && S_ISDIR(buffer.st_mode);
}

bool file_exists(const std::string& path) {
  struct stat buffer;
  const auto success = (::stat(path.c_str(), &buffer) == 0);
  return success && S_ISREG(buffer.st_mode);
}

time::millis_t get_modify_time(const std::string& path) {
  struct stat file_stat;
  if (::stat(path.c_str(), &file_stat) != 0) {
    throw file_error_t("Unable to get file information for", path, errno);
  }
#ifdef __APPLE__
  const auto& mtime = file_stat.st_mtimespec;
#else
  const auto& mtime = file_stat.st_mtim;
#endif
  return static_cast<time::millis_t>(mtime.tv_sec) * 1000 +
         static_cast<time::millis_t>(mtime.tv_nsec / 1000000);
}

void touch(const std::string& path, const time::millis_t time) {
  struct timespec times[2];
  times[0].tv_sec = static_cast<time_t>(time / 1000);
  times[0].tv_nsec = static_cast<long>((time % 1000) * 1000000);
  times[1] = times[0];
  if (::utimensat(AT_FDCWD, path.c_str(), times, 0) != 0) {
    throw file_error_t("Unable to update the file times of", path, errno);
  }
}

std::string read(const std::string& path) {
  // Open the file.
  auto* f = std::fopen(path.c_str(), "rb");
  if (f == nullptr) {
    throw file_error_t("Unable to open the file", path, errno);
  }

  // Read the data into a string.
  std::string str;
  char buf[4096];
  while (true) {
    const auto bytes_read = std::fread(buf, 1, sizeof(buf), f);
    str.append(buf, bytes_read);
    if (bytes_read < sizeof(buf)) {
      break;
    }
  }
  const auto read_error = std::ferror(f) != 0 ? (errno != 0 ? errno : EIO) : 0;

  // Close the file.
  std::fclose(f);

  if (read_error != 0) {
    throw file_error_t("Unable to read the file", path, read_error);
  }

  return str;
}

void write(const std::string& data, const std::string& path) {
  // Open the file.
  auto* f = std::fopen(path.c_str(), "wb");
  if (f == nullptr) {
    throw file_error_t("Unable to open the file", path, errno);
  }

  // Write the data to the file.
  const auto file_size = data.size();
  auto bytes_left = file_size;
  while ((bytes_left != 0u) && !std::ferror(f)) {
    const auto* ptr = &data[file_size - bytes_left];
    const auto bytes_written = std::fwrite(ptr, 1, bytes_left, f);
    bytes_left -= bytes_written;
  }
  auto write_error = (bytes_left != 0u) ? (errno != 0 ? errno : EIO) : 0;

  // Close the file (this flushes the data, which may fail too).
  if (std::fclose(f) != 0 && write_error == 0) {
    write_error = errno;
  }

  if (write_error != 0) {
    throw file_error_t("Unable to write the file", path, write_error);
  }
}

std::string get_unique_id() {
  uuid_t uuid;
  uuid_generate_random(uuid);
  char uuid_str[37];
  uuid_unparse_lower(uuid, uuid_str);
  return std::string(uuid_str);
}

}  // namespace file
}  // namespace dlease
