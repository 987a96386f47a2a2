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

#include <lease/path_resolver.hpp>

#include <base/file_utils.hpp>
#include <lease/lock_error.hpp>

namespace dlease {
namespace {
const std::string LOCK_DIR_EXTENSION = ".lock";
const std::string UID_FILE_NAME = ".uid";
}  // namespace

std::string resolve_lock_path(const std::string& path,
                              const bool resolve_symlinks,
                              file_system_t& fs) {
  try {
    if (!resolve_symlinks) {
      return file::normalize_path(path);
    }
    return fs.real_path(path);
  } catch (const file::file_error_t& e) {
    if (e.is_not_found()) {
      throw lock_error_t(lock_errc_t::NOT_FOUND, e.what(), path);
    }
    throw lock_error_t(lock_errc_t::IO_ERROR, e.what(), path, e.sys_errno());
  }
}

std::string get_lock_dir(const std::string& file) {
  return file + LOCK_DIR_EXTENSION;
}

std::string get_uid_file(const std::string& file) {
  return file::append_path(get_lock_dir(file), UID_FILE_NAME);
}

}  // namespace dlease
