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
#include "termlog/error_stack.hpp"

#include <errno.h>
#include <glog/logging.h>

#include <cstdlib>
#include <iostream>
#include <sstream>
#include <string>

#include "termlog/assert_nd.hpp"
#include "termlog/assorted/assorted_func.hpp"

namespace termlog {

ErrorStack::ErrorStack(ErrorCode code)
  : error_code_(code), depth_(0), checked_(code == kErrorCodeOk), os_errno_(errno) {
}

ErrorStack::ErrorStack(const char* file, const char* func, uint32_t line, ErrorCode code,
             const char* custom_message)
  : error_code_(code), depth_(0), checked_(false), os_errno_(errno) {
  ASSERT_ND(code != kErrorCodeOk);
  push_frame(file, func, line);
  if (custom_message) {
    custom_message_ = custom_message;
  }
}

ErrorStack::ErrorStack(const ErrorStack& cause, const char* file, const char* func,
             uint32_t line)
  : error_code_(kErrorCodeOk), depth_(0), checked_(true), os_errno_(0) {
  if (cause.error_code_ == kErrorCodeOk) {
    return;
  }
  take_over(cause);
  // an error created without a frame stays frameless
  if (depth_ > 0) {
    push_frame(file, func, line);
  }
}

ErrorStack::ErrorStack(const ErrorStack& other)
  : error_code_(kErrorCodeOk), depth_(0), checked_(true), os_errno_(0) {
  take_over(other);
}

ErrorStack& ErrorStack::operator=(const ErrorStack& other) {
  if (this != &other) {
    take_over(other);
  }
  return *this;
}

void ErrorStack::take_over(const ErrorStack& other) {
  error_code_ = other.error_code_;
  os_errno_ = other.os_errno_;
  depth_ = other.depth_;
  for (uint16_t i = 0; i < depth_; ++i) {
    frames_[i] = other.frames_[i];
  }
  custom_message_.clear();
  custom_message_.swap(other.custom_message_);
  checked_ = (error_code_ == kErrorCodeOk);
  other.checked_ = true;
}

void ErrorStack::push_frame(const char* file, const char* func, uint32_t line) {
  if (depth_ >= kMaxStackDepth) {
    return;
  }
  Frame& frame = frames_[depth_];
  frame.file_ = file;
  frame.func_ = func;
  frame.line_ = line;
  ++depth_;
}

void ErrorStack::append_custom_message(const std::string& more) {
  if (error_code_ != kErrorCodeOk) {
    custom_message_ += more;
  }
}

const ErrorStack::Frame& ErrorStack::get_frame(uint16_t index) const {
  ASSERT_ND(index < get_stack_depth());
  return frames_[index];
}

void ErrorStack::verify() const {
  if (UNLIKELY(!checked_ && error_code_ != kErrorCodeOk)) {
    dump_and_abort("ErrorStack was destructed or overwritten without being checked");
  }
}

std::ostream& operator<<(std::ostream& o, const ErrorStack& obj) {
  if (!obj.is_error()) {
    o << "No error";
    return o;
  }
  o << get_error_name(obj.error_code_) << "(" << assorted::Hex(obj.error_code_, 4) << "):"
    << obj.get_message();
  if (obj.os_errno_ != 0) {
    o << " (Latest system call error=" << assorted::os_error(obj.os_errno_) << ")";
  }
  if (!obj.custom_message_.empty()) {
    o << " (Additional message=" << obj.custom_message_ << ")";
  }
  for (uint16_t i = 0; i < obj.depth_; ++i) {
    const ErrorStack::Frame& frame = obj.frames_[i];
    o << std::endl << "  " << frame.file_ << ":" << frame.line_ << ": " << frame.func_ << "()";
  }
  if (obj.depth_ >= ErrorStack::kMaxStackDepth) {
    o << std::endl << "  (deeper frames were dropped)";
  }
  return o;
}

namespace {
/** Everything dump_and_abort() printed so far. Read by the signal handler of testcases. */
std::string recent_dump_and_abort;
}  // anonymous namespace

void ErrorStack::dump_and_abort(const char* abort_message) const {
  std::stringstream str;
  str << "termlog::ErrorStack::dump_and_abort: " << abort_message << std::endl
    << *this << std::endl << print_backtrace();
  recent_dump_and_abort += str.str();
  std::cerr << str.str() << std::endl;
  LOG(FATAL) << str.str();
  std::abort();
}

std::string ErrorStack::get_recent_dump_and_abort() {
  return recent_dump_and_abort;
}

}  // namespace termlog
