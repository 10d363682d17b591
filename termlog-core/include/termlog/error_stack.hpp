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
#ifndef TERMLOG_ERROR_STACK_HPP_
#define TERMLOG_ERROR_STACK_HPP_

#include <stdint.h>

#include <iosfwd>
#include <string>

#include "termlog/compiler.hpp"
#include "termlog/cxx11.hpp"
#include "termlog/error_code.hpp"

namespace termlog {

/**
 * @brief Error code plus the call sites it passed through on the way up.
 * @ingroup ERRORCODES
 * @details
 * Returned by the setup path of termlog: region validation, allocation, configuration
 * and stream open. The hot path (append, rotate, cleaning) returns a bare ErrorCode.
 * Nothing in termlog throws.
 *
 * @par Frames
 * ERROR_STACK() records the first frame, and each CHECK_ERROR() that passes the error on
 * adds one more, up to kMaxStackDepth. A frame keeps pointers only, so file and function
 * names must be string literals (__FILE__, __FUNCTION__).
 *
 * @par Unchecked errors
 * In debug builds, destructing an error that nobody inspected with is_error() or
 * get_error_code() dumps it and aborts.
 *
 * @par Copying
 * A copy takes over the custom message and the duty to be checked. The source keeps its
 * code and frames, loses the message and counts as checked. CHECK_ERROR() relies on this
 * to hand an error up the stack without duplicating the message at every level.
 */
class ErrorStack {
 public:
  enum Constants {
    kMaxStackDepth = 8,
  };

  /** One call site. */
  struct Frame {
    const char* file_;
    const char* func_;
    uint32_t    line_;
  };

  /** No error. Same as kRetOk. */
  ErrorStack()
    : error_code_(kErrorCodeOk), depth_(0), checked_(true), os_errno_(0) {}
  /** Error without any frame. */
  explicit ErrorStack(ErrorCode code);
  /** Error with its first frame. \b code must not be kErrorCodeOk. */
  ErrorStack(const char* file, const char* func, uint32_t line, ErrorCode code,
        const char* custom_message = CXX11_NULLPTR);
  /** \b cause passed on with one more frame. No-op copy if \b cause is not an error. */
  ErrorStack(const ErrorStack& cause, const char* file, const char* func, uint32_t line);
  ErrorStack(const ErrorStack& other);
  ErrorStack& operator=(const ErrorStack& other);
  ~ErrorStack() {
#ifndef NDEBUG
    verify();
#endif  // NDEBUG
  }

  bool        is_error() const {
    checked_ = true;
    return error_code_ != kErrorCodeOk;
  }
  ErrorCode   get_error_code() const {
    checked_ = true;
    return error_code_;
  }
  /** Message of the code in error_code.xmacro. */
  const char* get_message() const { return get_error_message(error_code_); }
  /** Null unless some frame attached a message. */
  const char* get_custom_message() const {
    return custom_message_.empty() ? CXX11_NULLPTR : custom_message_.c_str();
  }
  /** Appends to the custom message. Ignored when this is not an error. */
  void        append_custom_message(const std::string& more);

  uint16_t      get_stack_depth() const { return error_code_ == kErrorCodeOk ? 0 : depth_; }
  const Frame&  get_frame(uint16_t index) const;
  const char*   get_filename(uint16_t index) const { return get_frame(index).file_; }
  const char*   get_func(uint16_t index) const { return get_frame(index).func_; }
  uint32_t      get_linenum(uint16_t index) const { return get_frame(index).line_; }

  /** Dumps and aborts if this is an unchecked error. */
  void        verify() const;
  /** Writes this error to glog as FATAL. Never returns. */
  void        dump_and_abort(const char* abort_message) const;
  /** What the last dump_and_abort() printed, for the signal handler of testcases. */
  static std::string get_recent_dump_and_abort();

  friend std::ostream& operator<<(std::ostream& o, const ErrorStack& obj);

 private:
  void        push_frame(const char* file, const char* func, uint32_t line);
  void        take_over(const ErrorStack& other);

  ErrorCode   error_code_;
  uint16_t    depth_;
  mutable bool checked_;
  /** errno when the error was created. Often unrelated. */
  int         os_errno_;
  Frame       frames_[kMaxStackDepth];
  /** Moved to the copy on copy. */
  mutable std::string custom_message_;
};

/**
 * @var kRetOk
 * @ingroup ERRORCODES
 * @brief Normal return value for no-error case.
 */
const ErrorStack kRetOk;

}  // namespace termlog

/**
 * @def ERROR_STACK(e)
 * @ingroup ERRORCODES
 * @brief Error \b e with the current call site as its first frame.
 */
#define ERROR_STACK(e)          termlog::ErrorStack(__FILE__, __FUNCTION__, __LINE__, e)

/**
 * @def ERROR_STACK_MSG(e, m)
 * @ingroup ERRORCODES
 * @brief ERROR_STACK(e) with a custom message.
 */
#define ERROR_STACK_MSG(e, m)   termlog::ErrorStack(__FILE__, __FUNCTION__, __LINE__, e, m)

/**
 * @def CHECK_ERROR(x)
 * @ingroup ERRORCODES
 * @brief Evaluates \b x, and if it is an error returns it with this call site added.
 * @note glog already owns the name CHECK.
 */
#define CHECK_ERROR(x)\
{\
  termlog::ErrorStack __e(x);\
  if (UNLIKELY(__e.is_error())) {\
    return termlog::ErrorStack(__e, __FILE__, __FUNCTION__, __LINE__);\
  }\
}

/**
 * @def CHECK_OUTOFMEMORY(ptr)
 * @ingroup ERRORCODES
 * @brief Returns kErrorCodeOutofmemory if \b ptr is null.
 */
#define CHECK_OUTOFMEMORY(ptr)\
if (UNLIKELY(!(ptr))) {\
  return ERROR_STACK(termlog::kErrorCodeOutofmemory);\
}

/**
 * @def COERCE_ERROR(x)
 * @ingroup ERRORCODES
 * @brief Evaluates \b x and aborts if it is an error. For destructors and test fixtures
 * that have nobody to return an error to.
 */
#define COERCE_ERROR(x)\
{\
  termlog::ErrorStack __e(x);\
  if (UNLIKELY(__e.is_error())) {\
    __e.dump_and_abort("Unexpected error happened");\
  }\
}

#endif  // TERMLOG_ERROR_STACK_HPP_
