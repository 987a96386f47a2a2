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

#include <base/time_utils.hpp>

#include <sys/time.h>
#include <sys/types.h>

#include <chrono>
#include <stdexcept>
#include <thread>

namespace dlease {
namespace time {

millis_t millis_since_epoch() {
  struct timeval now;
  if (::gettimeofday(&now, nullptr) == 0) {
    return static_cast<millis_t>(now.tv_sec) * 1000 + static_cast<millis_t>(now.tv_usec / 1000);
  }
  throw std::runtime_error("Could not get system time.");
}

void sleep_millis(const millis_t duration) {
  if (duration > 0) {
    std::this_thread::sleep_for(std::chrono::milliseconds(duration));
  }
}

}  // namespace time
}  // namespace dlease
