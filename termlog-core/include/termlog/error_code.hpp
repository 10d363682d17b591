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
#ifndef TERMLOG_ERROR_CODE_HPP_
#define TERMLOG_ERROR_CODE_HPP_

namespace termlog {

/**
 * @defgroup ERRORCODES Error codes, messages, and stacktraces
 * @ingroup IDIOMS
 * @brief Error codes (termlog::ErrorCode), their messages defined in error_code.xmacro, and
 * the stacktrace holder (ErrorStack) returned by non-trivial API functions.
 * @details
 * @par Adding an error
 * Add one line to error_code.xmacro. The enum value, get_error_name() and get_error_message()
 * are all generated from that line by the X-Macro trick, no code generator involved.
 *
 * @par ErrorCode or ErrorStack
 * Functions on the hot path (LogBuffer::append(), LogBuffer::rotate()) return a bare
 * ErrorCode. It is an integer and costs nothing to return.
 * Setup functions (region validation, memory allocation, configuration loading) return
 * ErrorStack, which carries a short stacktrace and an optional custom message.
 * @code{.cpp}
 * ErrorStack setup() {
 *   if (region.length_ < kLogMetaDataLength) {
 *     return ERROR_STACK(kErrorCodeLogBufInvalidLayout);
 *   }
 *   CHECK_ERROR(another_setup());
 *   return kRetOk;
 * }
 * @endcode
 */

#define X(a, b, c) /** b: c. */ a = b,
/**
 * @var ErrorCode
 * @ingroup ERRORCODES
 * @brief Enum of error codes defined in error_code.xmacro.
 */
enum ErrorCode {
  /** 0 means no-error. */
  kErrorCodeOk = 0,
#include "termlog/error_code.xmacro" // NOLINT
};
#undef X

/**
 * @brief Returns the names of ErrorCode enum defined in error_code.xmacro.
 * @ingroup ERRORCODES
 */
const char* get_error_name(ErrorCode code);

/**
 * @brief Returns the error messages corresponding to ErrorCode enum defined in error_code.xmacro.
 * @ingroup ERRORCODES
 */
const char* get_error_message(ErrorCode code);

#define X_QUOTE(str) #str
#define X_EXPAND_AND_QUOTE(str) X_QUOTE(str)
#define X(a, b, c) case a: return X_EXPAND_AND_QUOTE(a);
inline const char* get_error_name(ErrorCode code) {
  switch (code) {
    case kErrorCodeOk: return "kErrorCodeOk";
#include "termlog/error_code.xmacro" // NOLINT
  }
  return "Unexpected error code";
}
#undef X
#undef X_EXPAND_AND_QUOTE
#undef X_QUOTE

#define X(a, b, c) case a: return c;
inline const char* get_error_message(ErrorCode code) {
  switch (code) {
    case kErrorCodeOk: return "no_error";
#include "termlog/error_code.xmacro" // NOLINT
  }
  return "Unexpected error code";
}
#undef X
}  // namespace termlog

/**
 * @def CHECK_ERROR_CODE(x)
 * @ingroup ERRORCODES
 * @brief Calls \b x and, if it returns anything but kErrorCodeOk, returns that code from the
 * current function.
 * @details
 * Only for functions that themselves return ErrorCode.
 */
#define CHECK_ERROR_CODE(x)\
{\
  termlog::ErrorCode __e = x;\
  if (UNLIKELY(__e != termlog::kErrorCodeOk)) {\
    return __e;\
  }\
}

#endif  // TERMLOG_ERROR_CODE_HPP_
