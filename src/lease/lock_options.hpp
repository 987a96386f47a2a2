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

#ifndef DIRLEASE_LOCK_OPTIONS_HPP_
#define DIRLEASE_LOCK_OPTIONS_HPP_

#include <base/time_utils.hpp>
#include <lease/file_system.hpp>

#include <cstdint>
#include <limits>
#include <memory>
#include <vector>

namespace dlease {

/// @brief A bounded retry policy with exponential back-off.
///
/// The delay before retry number @c i (counting from zero) is:
///
///   min(round(r * max(min_timeout_ms, 1) * factor^i), max_timeout_ms)
///
/// ...where @c r is 1, or a random number in the range [1, 2) if @c randomize is true.
class retry_policy_t {
public:
  /// @brief Construct a policy that does not retry.
  retry_policy_t() {
  }

  /// @brief Construct a policy with the default back-off parameters.
  /// @param num_retries The number of retries (not counting the first attempt).
  explicit retry_policy_t(const int num_retries) : retries(num_retries) {
  }

  /// @brief Compute the delays between the attempts.
  /// @returns one delay (in milliseconds) per retry.
  std::vector<time::millis_t> timeouts() const;

  int retries = 0;
  double factor = 2.0;
  time::millis_t min_timeout_ms = 1000;
  time::millis_t max_timeout_ms = std::numeric_limits<time::millis_t>::max();
  bool randomize = false;
};

/// @brief Options for acquiring a lock.
class lock_options_t {
public:
  /// @brief The smallest accepted stale threshold (in milliseconds).
  static const time::millis_t MIN_STALE_MS = 2000;

  /// @brief The smallest accepted update interval (in milliseconds).
  static const time::millis_t MIN_UPDATE_MS = 1000;

  /// @brief Create the options from the configuration (config::init() is called if necessary).
  /// @throws lock_error_t (IO_ERROR) if the configuration could not be loaded.
  static lock_options_t from_config();

  /// @brief Get a copy of the options with all the values clamped to their valid ranges.
  ///
  /// The stale threshold is at least MIN_STALE_MS, and the update interval is in the range
  /// [MIN_UPDATE_MS, stale_ms / 2]. A missing file system is replaced by the native one.
  lock_options_t normalized() const;

  /// @brief The time after which an unrenewed lock is considered stale (milliseconds).
  time::millis_t stale_ms = 10000;

  /// @brief The lock renewal interval (milliseconds).
  time::millis_t update_ms = 5000;

  /// @brief Resolve symbolic links when computing the lock identity.
  bool resolve_symlinks = true;

  /// @brief How to retry acquiring a lock that is held by someone else.
  retry_policy_t retries;

  /// @brief The file system to operate on.
  std::shared_ptr<file_system_t> fs = native_file_system();
};

}  // namespace dlease

#endif  // DIRLEASE_LOCK_OPTIONS_HPP_
