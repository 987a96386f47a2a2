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

#include <lease/lock_error.hpp>

namespace dlease {

std::string to_string(const lock_errc_t code) {
  switch (code) {
    case lock_errc_t::LOCKED:
      return "ELOCKED";
    case lock_errc_t::NOT_ACQUIRED:
      return "ENOTACQUIRED";
    case lock_errc_t::RELEASED:
      return "ERELEASED";
    case lock_errc_t::NOT_FOUND:
      return "ENOENT";
    case lock_errc_t::UPDATE_TIMEOUT:
      return "EUPDATE";
    case lock_errc_t::MISMATCH:
      return "EMISMATCH";
    case lock_errc_t::IO_ERROR:
      return "EIO";
    default:
      return "?";
  }
}

lock_error_t::lock_error_t(const lock_errc_t code,
                           const std::string& what,
                           const std::string& file,
                           const int sys_errno)
    : std::runtime_error(what), m_code(code), m_file(file), m_errno(sys_errno) {
}

}  // namespace dlease
