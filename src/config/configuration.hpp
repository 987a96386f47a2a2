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

#ifndef DIRLEASE_CONFIGURATION_HPP_
#define DIRLEASE_CONFIGURATION_HPP_

#include <cstdint>
#include <string>

namespace dlease {
namespace config {

/// @brief Initialize the configuration based on the configuration file and environment variables.
///
/// The configuration is only loaded once. If loading failed, subsequent calls throw the same error.
/// @throws std::runtime_error if the configuration could not be loaded.
void init();

/// @brief Load the configuration again, regardless of whether or not it has already been loaded.
///
/// All options are reset to their default values before loading.
/// @throws std::runtime_error if the configuration could not be loaded.
void reload();

/// @returns the dirlease home directory.
const std::string& dir();

/// @returns the dirlease configuration file.
const std::string& config_file();

/// @returns the stale threshold (in milliseconds).
int64_t stale();

/// @returns the lock update interval (in milliseconds).
int64_t update();

/// @returns true if symbolic links should be resolved when computing lock identities.
bool resolve();

/// @returns the number of times to retry acquiring a lock.
int32_t retries();

/// @returns the debug level (-1 for no debugging).
int32_t debug();

/// @returns the log file (empty string for stdout).
const std::string& log_file();

}  // namespace config
}  // namespace dlease

#endif  // DIRLEASE_CONFIGURATION_HPP_
