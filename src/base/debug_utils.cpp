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

#include <base/debug_utils.hpp>

#include <atomic>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <mutex>
#include <string>

#include <sys/types.h>
#include <unistd.h>

namespace dlease {
namespace debug {
namespace {
std::atomic_int s_log_level(-1);

// Guards s_log_file and the output streams (renewal threads log concurrently).
std::mutex s_log_mutex;
std::string s_log_file;

std::string get_level_string(const log_level_t level) {
  switch (level) {
    case DEBUG:
      return "DEBUG";
    case INFO:
      return "INFO";
    case WARNING:
      return "WARNING";
    case ERROR:
      return "ERROR";
    case FATAL:
      return "FATAL";
    default:
      return "?";
  }
}

bool is_valid_level(const int level) {
  return (level >= static_cast<int>(DEBUG)) && (level <= static_cast<int>(NONE));
}

log_level_t get_log_level() {
  int log_level = s_log_level;

  // Until set_log_level() has been called, s_log_level is undefined (negative).
  if (log_level < 0) {
    // Get the log level from the environment variable DIRLEASE_DEBUG.
    const auto* log_level_env = std::getenv("DIRLEASE_DEBUG");
    if (log_level_env != nullptr) {
      try {
        log_level = std::stoi(std::string(log_level_env));
      } catch (const std::exception&) {
        log_level = -1;
      }
      if (!is_valid_level(log_level)) {
        log_level = -1;
      }
    }

    // If we did not get a valid log level, fall back to NONE (higher than the highest level).
    if (log_level < 0) {
      log_level = static_cast<int>(NONE);
    }
    s_log_level = log_level;
  }

  return static_cast<log_level_t>(log_level);
}

std::string pad_string(const std::string& str, const size_t width) {
  return (str.size() < width) ? (str + std::string(width - str.size(), ' ')) : str;
}
}  // namespace

void set_log_level(const int level) {
  s_log_level = is_valid_level(level) ? level : static_cast<int>(NONE);
}

void set_log_file(const std::string& file) {
  std::lock_guard<std::mutex> lock(s_log_mutex);
  s_log_file = file;
}

log::log(const log_level_t level) : m_level(level) {
}

log::~log() {
  if (m_level >= get_log_level()) {
    const auto level_str = std::string("(") + get_level_string(m_level) + ")";
    std::ostringstream line;
    line << "dirlease[" << static_cast<int>(getpid()) << "] " << pad_string(level_str, 9) << " "
         << m_stream.str() << "\n";

    std::lock_guard<std::mutex> lock(s_log_mutex);
    bool written = false;
    if (!s_log_file.empty()) {
      std::ofstream out(s_log_file, std::ios::app);
      if (out) {
        out << line.str() << std::flush;
        written = static_cast<bool>(out);
      }
    }
    if (!written) {
      std::cout << line.str() << std::flush;
    }
  }
}
}  // namespace debug
}  // namespace dlease
