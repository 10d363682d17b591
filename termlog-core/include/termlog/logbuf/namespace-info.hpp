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
#ifndef TERMLOG_LOGBUF_NAMESPACE_INFO_HPP_
#define TERMLOG_LOGBUF_NAMESPACE_INFO_HPP_

/**
 * @namespace termlog::logbuf
 * @brief \b Log \b Buffer, the shared-memory layout of one message stream.
 * @details
 * A stream is persisted into kPartitionCount (3) fixed-length memory regions called
 * \e terms, used as a ring. One producer appends to the active term without any lock,
 * any number of consumers read concurrently, and a cleaner zeroes retired terms so that
 * the producer can roll into them again.
 *
 * @par Layout
 * One log occupies one contiguous block:
 * @code
 * [Term0][Term1][Term2][TermMeta0][TermMeta1][TermMeta2][LogMeta]
 * @endcode
 * Each term is term_length bytes (a power of two, at least kTermMinLength).
 * Each term metadata is two cachelines, the log metadata is one.
 * @see log_buffer_descriptor.hpp
 *
 * @par Positions
 * A position is a 64-bit byte count from the beginning of the stream. It is never stored;
 * it is derived from the active term id, the initial term id and the tail of the term.
 * Term ids are signed 32-bit counters that may wrap around during the life of a stream.
 * @see position_codec.hpp
 *
 * @par Partitions
 * The term with id t lives in partition (t - initial_term_id) mod 3.
 * @see partition_indexer.hpp
 *
 * @par Life of a partition
 * @code
 *   kTermClean --(becomes active, producer appends)--> written
 *   written --(producer rotates away)--> kTermNeedsCleaning
 *   kTermNeedsCleaning --(cleaner zeroes it)--> kTermClean
 * @endcode
 * The producer never rotates into a partition that is not kTermClean; LogBuffer::rotate()
 * returns kErrorCodeLogBufRotationBlocked instead.
 *
 * @par Ordering
 * The active term id is the only coordination point between the producer and consumers.
 * It is read with acquire and written with release semantics, as are the counters and the
 * status of each term. No other synchronization exists; nothing blocks.
 */

/**
 * @defgroup LOGBUF Log Buffer
 * @ingroup COMPONENTS
 * @copydoc termlog::logbuf
 */

#endif  // TERMLOG_LOGBUF_NAMESPACE_INFO_HPP_
