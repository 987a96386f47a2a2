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

#ifndef DIRLEASE_PATH_RESOLVER_HPP_
#define DIRLEASE_PATH_RESOLVER_HPP_

#include <lease/file_system.hpp>

#include <string>

namespace dlease {

/// @brief Map a user supplied path to the canonical path that identifies a lock.
/// @param path The path to the locked file (it does not have to be a regular file).
/// @param resolve_symlinks If true, symbolic links are followed and the path must exist. If false,
/// the path is normalized lexically (made absolute, "." and ".." removed).
/// @param fs The file system to resolve the path in.
/// @returns the canonical absolute path.
/// @throws lock_error_t (NOT_FOUND if the path does not exist, IO_ERROR for other errors).
std::string resolve_lock_path(const std::string& path,
                              const bool resolve_symlinks,
                              file_system_t& fs);

/// @returns the path to the lock directory for the given lock identity.
std::string get_lock_dir(const std::string& file);

/// @returns the path to the ownership token file for the given lock identity.
std::string get_uid_file(const std::string& file);

}  // namespace dlease

#endif  // DIRLEASE_PATH_RESOLVER_HPP_
