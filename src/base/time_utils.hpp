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

#ifndef DIRLEASE_TIME_UTILS_HPP_
#define DIRLEASE_TIME_UTILS_HPP_

#include <cstdint>

namespace dlease {
namespace time {
/// @brief Wall clock time in milliseconds since the Unix epoch.
///
/// Integer number of milliseconds since the Unix epoch, i.e. 00:00:00 UTC on 1 January 1970. This
/// is the unit used for lock heartbeats, which are compared against file modification times that
/// may have been written by other hosts.
using millis_t = int64_t;

/// @brief Get the current wall clock time in milliseconds.
///
/// Time values returned by this function are compatible with file system time values.
/// @returns the number of milliseconds since the Unix epoch.
/// @throws runtime_error if the system time could not be read.
millis_t millis_since_epoch();

/// @brief Block the calling thread.
/// @param duration The time to sleep, in milliseconds (non-positive values return immediately).
void sleep_millis(const millis_t duration);

}  // namespace time
}  // namespace dlease

#endif  // DIRLEASE_TIME_UTILS_HPP_
