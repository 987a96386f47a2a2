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
#include <base/file_utils.hpp>
#include <base/time_utils.hpp>
#include <lease/lock_manager.hpp>

#include <cstdlib>
#include <iostream>
#include <stdexcept>
#include <string>

using namespace dlease;

namespace {
const int NUM_LOOPS = 500;

long read_number_from_file(const std::string& path) {
  // Read the file.
  std::string data("0");
  if (file::file_exists(path)) {
    data = file::read(path);
  }

  // Convert the content to an integer (count).
  long count;
  try {
    count = std::stol(data);
  } catch (std::invalid_argument& e) {
    std::cerr << "*** Error: Unable to parse integer: \"" << data << "\" (" << e.what() << ")"
              << std::endl;
    std::exit(1);
  }

  return count;
}
}  // namespace

int main(int argc, const char** argv) {
  if (argc != 2) {
    std::cout << "Usage: " << argv[0] << " <filename>\n";
    std::cout << "  filename    The name of the file to be updated in a locked fashion\n";
    std::exit(0);
  }
  const std::string filename(argv[1]);

  // The data file does not have to exist when the first process starts.
  lock_options_t options;
  options.resolve_symlinks = false;
  options.retries = retry_policy_t(200);
  options.retries.min_timeout_ms = 1;
  options.retries.factor = 1.5;
  options.retries.max_timeout_ms = 50;
  options.retries.randomize = true;

  lock_manager_t manager;
  long last_count = -1;
  for (int i = 0; i < NUM_LOOPS; ++i) {
    try {
      // Acquire a lock, which should guarantee us exclusive access to the data file.
      auto lease = manager.lock(filename, options, [](const lock_error_t& e) {
        std::cerr << "*** Error: Lock compromised (" << to_string(e.code()) << "): " << e.what()
                  << std::endl;
        std::exit(1);
      });

      // Read the count from the file (starting at 0 if the file does not exist).
      auto count = read_number_from_file(filename);

      // Update the counter, and write it to the file.
      count++;
      file::write(std::to_string(count), filename);

      last_count = count;
      lease.release();
    } catch (const lock_error_t& e) {
      std::cerr << "*** Error: Unable to lock " << filename << " (" << to_string(e.code())
                << "): " << e.what() << std::endl;
      std::exit(1);
    }

    // At this point, the lock should be released. Sleep a bit to let others aquire the lock.
    time::sleep_millis(i % 3 + 1);
  }

  std::cout << "After " << NUM_LOOPS << " updates, the file count is: " << last_count << std::endl;
  std::exit(0);
}
