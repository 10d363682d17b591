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
#ifndef TERMLOG_ERROR_STACK_BATCH_HPP_
#define TERMLOG_ERROR_STACK_BATCH_HPP_

#include <stdint.h>

#include <vector>

#include "termlog/error_stack.hpp"

namespace termlog {
/**
 * @brief Errors of several independent steps, typically while releasing resources.
 * @ingroup ERRORCODES
 * @details
 * Uninitialization keeps going after a failed step so that one failure does not leak the
 * rest. Each step's result goes in here, and the function returns the summary.
 * @code{.cpp}
 * ErrorStackBatch batch;
 * batch.emprace_back(log_buffer_memory_.uninitialize());
 * batch.emprace_back(debug_.uninitialize());
 * return SUMMARIZE_ERROR_BATCH(batch);
 * @endcode
 */
class ErrorStackBatch {
 public:
  /** Keeps \b error_stack only if it is an error. */
  void emprace_back(ErrorStack&& error_stack) {
    if (error_stack.is_error()) {
      errors_.emplace_back(error_stack);
    }
  }

  bool        is_error() const { return !errors_.empty(); }
  uint32_t    size() const { return static_cast<uint32_t>(errors_.size()); }

  /**
   * kRetOk when empty. The error itself when there is one. Otherwise kErrorCodeBatchedError
   * whose custom message lists every error.
   */
  ErrorStack  summarize(const char* file, const char* func, uint32_t line) const;

 private:
  std::vector<ErrorStack> errors_;
};
}  // namespace termlog

/**
 * @def SUMMARIZE_ERROR_BATCH(batch)
 * @ingroup ERRORCODES
 * @brief ErrorStackBatch::summarize() at the current call site.
 */
#define SUMMARIZE_ERROR_BATCH(x) x.summarize(__FILE__, __FUNCTION__, __LINE__)

#endif  // TERMLOG_ERROR_STACK_BATCH_HPP_
