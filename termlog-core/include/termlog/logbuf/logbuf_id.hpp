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
#ifndef TERMLOG_LOGBUF_LOGBUF_ID_HPP_
#define TERMLOG_LOGBUF_LOGBUF_ID_HPP_
#include <stdint.h>

#include <iosfwd>

/**
 * @file termlog/logbuf/logbuf_id.hpp
 * @brief Typedefs of ID types used in log buffer package.
 * @ingroup LOGBUF
 */
namespace termlog {
namespace logbuf {
/**
 * @typedef TermId
 * @brief Identifier of one term of a stream.
 * @ingroup LOGBUF
 * @details
 * Consecutive terms have consecutive ids. The counter is a signed 32-bit integer that
 * may wrap around from INT32_MAX to INT32_MIN; every arithmetic on term ids is done in
 * 32-bit two's complement.
 */
typedef int32_t TermId;

/**
 * @typedef LogPosition
 * @brief Byte position in a stream, counted from the beginning of the initial term.
 * @ingroup LOGBUF
 */
typedef int64_t LogPosition;

/**
 * @typedef TermOffset
 * @brief Byte offset in one term. Also the type of tail counters and high water marks.
 * @ingroup LOGBUF
 */
typedef int32_t TermOffset;

/**
 * @typedef PartitionIndex
 * @brief Index of a physical partition, [0, kPartitionCount).
 * @ingroup LOGBUF
 */
typedef uint16_t PartitionIndex;

/**
 * @brief Where a position physically is.
 * @ingroup LOGBUF
 */
struct LogLocation {
  TermId          term_id_;
  PartitionIndex  partition_index_;
  TermOffset      term_offset_;

  bool operator==(const LogLocation& other) const {
    return term_id_ == other.term_id_ && partition_index_ == other.partition_index_
      && term_offset_ == other.term_offset_;
  }
  bool operator!=(const LogLocation& other) const { return !operator==(other); }

  friend std::ostream& operator<<(std::ostream& o, const LogLocation& v);
};

}  // namespace logbuf
}  // namespace termlog
#endif  // TERMLOG_LOGBUF_LOGBUF_ID_HPP_
