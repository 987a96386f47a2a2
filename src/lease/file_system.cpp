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

#include <lease/file_system.hpp>

#include <base/file_utils.hpp>

namespace dlease {
namespace {
class native_file_system_t : public file_system_t {
public:
  void create_dir(const std::string& path) override {
    file::create_dir(path);
  }

  time::millis_t modify_time(const std::string& path) override {
    return file::get_modify_time(path);
  }

  void touch(const std::string& path, const time::millis_t time) override {
    file::touch(path, time);
  }

  std::string read(const std::string& path) override {
    return file::read(path);
  }

  void write(const std::string& data, const std::string& path) override {
    file::write(data, path);
  }

  void remove_file(const std::string& path) override {
    file::remove_file(path);
  }

  void remove_dir(const std::string& path) override {
    file::remove_empty_dir(path);
  }

  std::string real_path(const std::string& path) override {
    return file::resolve_path(path);
  }
};
}  // namespace

file_system_t::file_system_t() {
}

file_system_t::~file_system_t() {
}

std::shared_ptr<file_system_t> native_file_system() {
  // The native implementation is stateless, so a single instance can be shared.
  static const std::shared_ptr<file_system_t> s_native_fs = std::make_shared<native_file_system_t>();
  return s_native_fs;
}

}  // namespace dlease
