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

#include <lease/lock_options.hpp>

#include <config/configuration.hpp>
#include <lease/lock_error.hpp>

#include <algorithm>
#include <cmath>
#include <random>
#include <stdexcept>
#include <string>

namespace dlease {

const time::millis_t lock_options_t::MIN_STALE_MS;
const time::millis_t lock_options_t::MIN_UPDATE_MS;

std::vector<time::millis_t> retry_policy_t::timeouts() const {
  std::vector<time::millis_t> result;
  if (retries <= 0) {
    return result;
  }

  std::random_device seed;
  std::mt19937 generator(seed());
  std::uniform_real_distribution<double> distribution(1.0, 2.0);

  const auto min_timeout = static_cast<double>(std::max<time::millis_t>(min_timeout_ms, 1));
  const auto max_timeout = static_cast<double>(max_timeout_ms);
  for (int i = 0; i < retries; ++i) {
    const double r = randomize ? distribution(generator) : 1.0;
    const auto timeout = std::round(r * min_timeout * std::pow(factor, static_cast<double>(i)));
    result.emplace_back(timeout < max_timeout ? static_cast<time::millis_t>(timeout)
                                              : max_timeout_ms);
  }
  return result;
}

lock_options_t lock_options_t::from_config() {
  try {
    config::init();
  } catch (const std::runtime_error& e) {
    throw lock_error_t(lock_errc_t::IO_ERROR,
                       std::string("Unable to load the configuration: ") + e.what(),
                       config::config_file());
  }

  lock_options_t options;
  options.stale_ms = config::stale();
  options.update_ms = config::update();
  options.resolve_symlinks = config::resolve();
  options.retries = retry_policy_t(config::retries());
  return options;
}

lock_options_t lock_options_t::normalized() const {
  lock_options_t result(*this);
  result.stale_ms = std::max(stale_ms, MIN_STALE_MS);
  const auto half_stale = static_cast<time::millis_t>(std::round(result.stale_ms / 2.0));
  result.update_ms = std::max(std::min(update_ms, half_stale), MIN_UPDATE_MS);
  if (!result.fs) {
    result.fs = native_file_system();
  }
  return result;
}

}  // namespace dlease
