/*
 * Copyright (c) 2014-2015, Hewlett-Packard Development Company, LP.
 * This program is free software; you can redistribute it and/or modify it
 * under the terms of the GNU General Public License as published by the Free
 * Software Foundation; either version 2 of the License, or (at your option)
 * any later version.
 *
 * This program is distributed in the hope that it will be useful, but WITHOUT
 * ANY WARRANTY; without even the implied warranty of MERCHANTABILITY or
 * FITNESS FOR A PARTICULAR PURPOSE. See the GNU General Public License for
 * more details. You should have received a copy of the GNU General Public
 * License along with this program; if not, write to the Free Software
 * Foundation, Inc., 59 Temple Place, Suite 330, Boston, MA 02111-1307 USA
 *
 * HP designates this particular file as subject to the "Classpath" exception
 * as provided by HP in the LICENSE.txt file that accompanied this code.
 */
#include "termlog/assorted/assorted_func.hpp"

#include <cxxabi.h>
#include <errno.h>
#include <string.h>

#include <cstdlib>
#include <iomanip>
#include <ostream>
#include <sstream>
#include <string>

namespace termlog {
namespace assorted {

namespace {
// GNU strerror_r() returns the message. The POSIX one fills the buffer.
inline const char* strerror_result(const char* result, const char* /*buffer*/) { return result; }
inline const char* strerror_result(int result, const char* buffer) {
  return result == 0 ? buffer : "Unknown error";
}
}  // anonymous namespace

std::string os_error() {
  return os_error(errno);
}

std::string os_error(int error_number) {
  if (error_number == 0) {
    return "[No Error]";
  }
  char buffer[256];
  buffer[0] = '\0';
  std::stringstream str;
  str << "[Errno " << error_number << "] "
    << strerror_result(::strerror_r(error_number, buffer, sizeof(buffer)), buffer);
  return str.str();
}

std::ostream& operator<<(std::ostream& o, const Hex& v) {
  std::stringstream str;
  str << std::hex << std::uppercase;
  if (v.fix_digits_ > 0) {
    str << std::setw(v.fix_digits_) << std::setfill('0');
  }
  str << v.val_;
  o << "0x" << str.str();
  return o;
}

std::string demangle_type_name(const char* mangled_name) {
  int status = 0;
  char* demangled = abi::__cxa_demangle(mangled_name, nullptr, nullptr, &status);
  if (demangled == nullptr) {
    return mangled_name;
  }
  std::string ret(demangled);
  std::free(demangled);
  return ret;
}

}  // namespace assorted
}  // namespace termlog
