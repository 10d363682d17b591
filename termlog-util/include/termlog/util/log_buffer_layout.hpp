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
#ifndef TERMLOG_UTIL_LOG_BUFFER_LAYOUT_HPP_
#define TERMLOG_UTIL_LOG_BUFFER_LAYOUT_HPP_

#include <stdint.h>

#include <iosfwd>
#include <vector>

#include "termlog/error_stack.hpp"
#include "termlog/logbuf/logbuf_id.hpp"

namespace termlog {
namespace util {
/**
 * @brief Main routine of the termlog_layout utility.
 * @details
 * Prints where each region of a log buffer is for the given term length, and where the
 * given positions are (term id, partition, offset in the term).
 * Pure arithmetic. Nothing is allocated.
 */
struct LogBufferLayout {
  LogBufferLayout() : term_length_(0), initial_term_id_(0) {}

  uint32_t                          term_length_;
  logbuf::TermId                    initial_term_id_;
  std::vector< logbuf::LogPosition > positions_;

  /** kErrorCodeLogBufInvalidLayout if term_length_ is not a valid term length. */
  ErrorStack  validate() const;

  /** Writes out the layout as XML. @pre validate() returned no error */
  void        dump(std::ostream* out) const;
};

}  // namespace util
}  // namespace termlog
#endif  // TERMLOG_UTIL_LOG_BUFFER_LAYOUT_HPP_
