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
#ifndef TERMLOG_ASSERT_ND_HPP_
#define TERMLOG_ASSERT_ND_HPP_

#include <string>

/**
 * @def ASSERT_ND(x)
 * @ingroup IDIOMS
 * @brief Debug-only assertion for programming errors, such as a partition index out of range
 * or a call before initialize().
 * @details
 * In debug builds a failure prints the expression and a backtrace, then calls assert().
 * Under NDEBUG the expression is not evaluated, and variables used only here do not trigger
 * unused-variable warnings.
 * Anything a caller can cause at runtime (bad region length, full term, dirty partition) is
 * reported as ErrorCode or ErrorStack instead.
 */
namespace termlog {
/** Best-effort backtrace of the calling thread, one frame per line. */
std::string print_backtrace();

/** Prints a failed ASSERT_ND with a backtrace to stderr and remembers it. */
void report_assertion_failure(const char* file, const char* func, int line, const char* expr);

/** Everything report_assertion_failure() printed so far. For signal handlers of testcases. */
std::string get_recent_assert_backtrace();
}  // namespace termlog

#ifdef NDEBUG
#define ASSERT_ND(x) do { (void) sizeof(x); } while (0)
#else  // NDEBUG
#include <cassert>
#define ASSERT_ND(x) do {\
  if (!(x)) {\
    termlog::report_assertion_failure(__FILE__, __FUNCTION__, __LINE__, #x);\
    assert(x);\
  }\
} while (0)
#endif  // NDEBUG

#endif  // TERMLOG_ASSERT_ND_HPP_
