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
#include "termlog/assert_nd.hpp"

#include <execinfo.h>

#include <cstdlib>
#include <iostream>
#include <sstream>
#include <string>

#include "termlog/assorted/assorted_func.hpp"

namespace termlog {

namespace {
const int kMaxBacktraceDepth = 64;

std::string recent_assert_backtrace;

/** Demangles the symbol in "binary(_ZN7termlog...+0x1a) [0x400b2c]" when there is one. */
std::string demangle_frame(const char* frame) {
  std::string line(frame);
  std::size_t begin = line.find('(');
  if (begin == std::string::npos) {
    return line;
  }
  std::size_t end = line.find('+', begin);
  if (end == std::string::npos || end == begin + 1) {
    return line;
  }
  std::string symbol = line.substr(begin + 1, end - begin - 1);
  return line.substr(0, begin + 1) + assorted::demangle_type_name(symbol.c_str())
    + line.substr(end);
}
}  // anonymous namespace

std::string print_backtrace() {
  void* addresses[kMaxBacktraceDepth];
  int depth = ::backtrace(addresses, kMaxBacktraceDepth);
  char** frames = ::backtrace_symbols(addresses, depth);
  std::stringstream str;
  str << "Backtrace (" << depth << " frames):" << std::endl;
  if (frames == nullptr) {
    str << "  (backtrace_symbols() failed)" << std::endl;
    return str.str();
  }
  // frame 0 is print_backtrace() itself
  for (int i = 1; i < depth; ++i) {
    str << "  #" << i << " " << demangle_frame(frames[i]) << std::endl;
  }
  ::free(frames);
  return str.str();
}

void report_assertion_failure(const char* file, const char* func, int line, const char* expr) {
  std::stringstream str;
  str << "ASSERT_ND(" << expr << ") failed in " << func << "() at " << file << ":" << line
    << std::endl << print_backtrace();
  recent_assert_backtrace += str.str();
  std::cerr << str.str();
}

std::string get_recent_assert_backtrace() {
  return recent_assert_backtrace;
}

}  // namespace termlog
