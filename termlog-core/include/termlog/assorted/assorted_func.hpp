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
#ifndef TERMLOG_ASSORTED_ASSORTED_FUNC_HPP_
#define TERMLOG_ASSORTED_ASSORTED_FUNC_HPP_

#include <stdint.h>

#include <iosfwd>
#include <string>
#include <typeinfo>

namespace termlog {
namespace assorted {

/** @brief True for 1, 2, 4, 8... @ingroup ASSORTED */
template <typename T>
inline bool is_power_of_two(T value) {
  return value > 0 && (value & (value - 1)) == 0;
}

/**
 * @brief Number of trailing zero bits of a power of two. For other values, floor(log2(value)).
 * @ingroup ASSORTED
 * @pre value > 0
 */
inline uint8_t floor_log2(uint64_t value) {
  return static_cast<uint8_t>(63 - __builtin_clzll(value));
}

/**
 * @brief "[Errno 2] No such file or directory" for the given errno, or for the current
 * errno if omitted. Uses strerror_r(), so it is thread-safe.
 * @ingroup ASSORTED
 */
std::string os_error();
std::string os_error(int error_number);

/**
 * @brief Stream manipulator that prints an integer as "0x" followed by upper-case hex.
 * @ingroup ASSORTED
 * @code{.cpp}
 * LOG(INFO) << Hex(kErrorCodeLogBufTermFull, 4);  // 0x0202
 * @endcode
 */
struct Hex {
  template<typename T>
  Hex(T val, int fix_digits = -1) : val_(static_cast<uint64_t>(val)), fix_digits_(fix_digits) {}

  uint64_t val_;
  /** Zero-padded to this many digits. Negative means no padding. */
  int fix_digits_;
  friend std::ostream& operator<<(std::ostream& o, const Hex& v);
};

/** @brief Demangled form of \b mangled_name, or \b mangled_name itself. @ingroup ASSORTED */
std::string demangle_type_name(const char* mangled_name);

/** @brief Readable name of type T, such as "unsigned int". @ingroup ASSORTED */
template <typename T>
std::string get_pretty_type_name() {
  return demangle_type_name(typeid(T).name());
}

}  // namespace assorted
}  // namespace termlog

#endif  // TERMLOG_ASSORTED_ASSORTED_FUNC_HPP_
