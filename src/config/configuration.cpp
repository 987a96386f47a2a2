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

#include <config/configuration.hpp>

#include <base/debug_utils.hpp>
#include <base/env_utils.hpp>
#include <base/file_utils.hpp>

#include <cjson/cJSON.h>

#include <memory>
#include <mutex>
#include <sstream>
#include <stdexcept>

namespace dlease {
namespace {
// Various constants.
const std::string ROOT_FOLDER_NAME = ".dirlease";
const std::string CONFIGURATION_FILE_NAME = "config.json";
const int64_t DEFAULT_STALE = 10000;   // 10 s
const int64_t DEFAULT_UPDATE = 5000;   // 5 s

struct JSON_Deleter {
  void operator()(cJSON* obj) const {
    if (obj != nullptr) {
      cJSON_Delete(obj);
    }
  }
};

using JSONPtr = std::unique_ptr<cJSON, JSON_Deleter>;

// Guards the initialization.
std::mutex s_init_mutex;
bool s_initialized = false;

// The reason that the configuration could not be loaded (empty if it was loaded).
std::string s_init_error;

// The configuration file for this configuration.
std::string s_config_file;

// Configuration options.
int32_t s_debug = -1;
std::string s_dir;
std::string s_log_file;
bool s_resolve = true;
int32_t s_retries = 0;
int64_t s_stale = DEFAULT_STALE;
int64_t s_update = DEFAULT_UPDATE;

void reset() {
  s_config_file.clear();
  s_debug = -1;
  s_dir.clear();
  s_log_file.clear();
  s_resolve = true;
  s_retries = 0;
  s_stale = DEFAULT_STALE;
  s_update = DEFAULT_UPDATE;
}

std::string get_dir() {
  // Is the environment variable DIRLEASE_DIR defined?
  {
    const env_var_t dir_env("DIRLEASE_DIR");
    if (dir_env) {
      return dir_env.as_string();
    }
  }

  // Use the user home directory if possible.
  {
    auto home = file::get_user_home_dir();
    if (!home.empty()) {
      return file::append_path(home, ROOT_FOLDER_NAME);
    }
  }

  // We failed.
  throw std::runtime_error("Unable to determine a home directory for dirlease.");
}

std::string get_config_file(const std::string& dir) {
  return file::append_path(dir, CONFIGURATION_FILE_NAME);
}

void load_from_file(const std::string& file_name) {
  // Load the configuration file.
  if (!file::file_exists(file_name)) {
    // Nothing to do.
    return;
  }
  const auto data = file::read(file_name);

  // Parse the JSON data.
  JSONPtr root(cJSON_Parse(data.c_str()));
  if (!root) {
    std::ostringstream ss;
    ss << "Configuration file JSON parse error before:\n";
    const auto* json_error = cJSON_GetErrorPtr();
    if (json_error != nullptr) {
      ss << json_error;
    } else {
      ss << "(N/A)";
    }
    throw std::runtime_error(ss.str());
  }

  {
    const auto* node = cJSON_GetObjectItemCaseSensitive(root.get(), "debug");
    if (cJSON_IsNumber(node)) {
      s_debug = static_cast<int32_t>(node->valueint);
    }
  }

  {
    const auto* node = cJSON_GetObjectItemCaseSensitive(root.get(), "log_file");
    if (cJSON_IsString(node) && node->valuestring != nullptr) {
      s_log_file = std::string(node->valuestring);
    }
  }

  {
    const auto* node = cJSON_GetObjectItemCaseSensitive(root.get(), "resolve");
    if (cJSON_IsBool(node)) {
      s_resolve = cJSON_IsTrue(node);
    }
  }

  {
    const auto* node = cJSON_GetObjectItemCaseSensitive(root.get(), "retries");
    if (cJSON_IsNumber(node) && node->valueint >= 0) {
      s_retries = static_cast<int32_t>(node->valueint);
    }
  }

  {
    const auto* node = cJSON_GetObjectItemCaseSensitive(root.get(), "stale");
    if (cJSON_IsNumber(node) && node->valuedouble > 0.0) {
      s_stale = static_cast<int64_t>(node->valuedouble);
    }
  }

  {
    const auto* node = cJSON_GetObjectItemCaseSensitive(root.get(), "update");
    if (cJSON_IsNumber(node) && node->valuedouble > 0.0) {
      s_update = static_cast<int64_t>(node->valuedouble);
    }
  }
}

void load_or_fail() {
  // Get the dirlease home directory.
  s_dir = get_dir();

  // Load any paramaters from the user configuration file.
  // Note: We do this before reading the configuration from the environment, so that the
  // environment overrides the configuration file.
  s_config_file = get_config_file(s_dir);
  load_from_file(s_config_file);

  // Invalid numbers in the environment are ignored.
  {
    const env_var_t env("DIRLEASE_DEBUG");
    if (env) {
      try {
        s_debug = static_cast<int32_t>(env.as_int64());
      } catch (const std::logic_error&) {
        // Ignore...
      }
    }
  }

  {
    const env_var_t env("DIRLEASE_LOG_FILE");
    if (env) {
      s_log_file = env.as_string();
    }
  }

  {
    const env_var_t env("DIRLEASE_RESOLVE");
    if (env) {
      s_resolve = env.as_bool();
    }
  }

  {
    const env_var_t env("DIRLEASE_RETRIES");
    if (env) {
      try {
        const auto retries = env.as_int64();
        if (retries >= 0) {
          s_retries = static_cast<int32_t>(retries);
        }
      } catch (const std::logic_error&) {
        // Ignore...
      }
    }
  }

  {
    const env_var_t env("DIRLEASE_STALE");
    if (env) {
      try {
        const auto stale = env.as_int64();
        if (stale > 0) {
          s_stale = stale;
        }
      } catch (const std::logic_error&) {
        // Ignore...
      }
    }
  }

  {
    const env_var_t env("DIRLEASE_UPDATE");
    if (env) {
      try {
        const auto update = env.as_int64();
        if (update > 0) {
          s_update = update;
        }
      } catch (const std::logic_error&) {
        // Ignore...
      }
    }
  }

  // Apply the logging configuration.
  debug::set_log_level(s_debug);
  debug::set_log_file(s_log_file);
}

void load() {
  s_initialized = true;
  s_init_error.clear();
  try {
    load_or_fail();
  } catch (const std::runtime_error& e) {
    // If we could not load the configuration, we can't proceed. The failure is remembered, so
    // that every subsequent init() reports it instead of silently using the defaults.
    const auto config_file = s_config_file;
    reset();
    s_config_file = config_file;
    s_init_error = e.what();
    throw;
  }
}
}  // namespace

namespace config {
void init() {
  // Guard: Only initialize once.
  std::lock_guard<std::mutex> lock(s_init_mutex);
  if (s_initialized) {
    if (!s_init_error.empty()) {
      throw std::runtime_error(s_init_error);
    }
    return;
  }
  load();
}

void reload() {
  std::lock_guard<std::mutex> lock(s_init_mutex);
  reset();
  load();
}

const std::string& config_file() {
  return s_config_file;
}

int32_t debug() {
  return s_debug;
}

const std::string& dir() {
  return s_dir;
}

const std::string& log_file() {
  return s_log_file;
}

bool resolve() {
  return s_resolve;
}

int32_t retries() {
  return s_retries;
}

int64_t stale() {
  return s_stale;
}

int64_t update() {
  return s_update;
}

}  // namespace config
}  // namespace dlease
