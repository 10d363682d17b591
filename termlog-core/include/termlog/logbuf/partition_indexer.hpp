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
#ifndef TERMLOG_LOGBUF_PARTITION_INDEXER_HPP_
#define TERMLOG_LOGBUF_PARTITION_INDEXER_HPP_

#include <stdint.h>

#include "termlog/assert_nd.hpp"
#include "termlog/logbuf/log_buffer_descriptor.hpp"
#include "termlog/logbuf/logbuf_id.hpp"
#include "termlog/logbuf/position_codec.hpp"

/**
 * @file termlog/logbuf/partition_indexer.hpp
 * @ingroup LOGBUF
 * @brief Mapping from term ids to partitions, and ring navigation.
 * @details
 * At any moment the partition of the active term is written by the producer, the previous
 * one is the most recently retired term (consumers may still be reading it), and the next
 * one must be kTermClean before the producer may rotate into it.
 */
namespace termlog {
namespace logbuf {

/**
 * @brief Partition of the term active_term_id.
 * @ingroup LOGBUF
 * @details
 * (active_term_id - initial_term_id) mod kPartitionCount, where the difference wraps in
 * 32 bits and the modulo is a true modulo, so the result is in [0, kPartitionCount) even
 * when the difference is negative.
 */
inline PartitionIndex partition_index(TermId initial_term_id, TermId active_term_id) {
  int64_t term_count = compute_term_count(active_term_id, initial_term_id);
  int64_t remainder = term_count % kPartitionCount;
  if (remainder < 0) {
    remainder += kPartitionCount;
  }
  return static_cast<PartitionIndex>(remainder);
}

/** @ingroup LOGBUF */
inline PartitionIndex next_partition_index(PartitionIndex current) {
  ASSERT_ND(current < kPartitionCount);
  return static_cast<PartitionIndex>((current + 1) % kPartitionCount);
}

/** @ingroup LOGBUF */
inline PartitionIndex previous_partition_index(PartitionIndex current) {
  ASSERT_ND(current < kPartitionCount);
  return static_cast<PartitionIndex>((current + kPartitionCount - 1) % kPartitionCount);
}

/**
 * @brief Partition that holds the given position.
 * @ingroup LOGBUF
 */
inline PartitionIndex partition_index_for_position(
  LogPosition position,
  uint8_t position_bits_to_shift) {
  uint32_t term_count = static_cast<uint32_t>(
    static_cast<uint64_t>(position) >> position_bits_to_shift);
  return partition_index(0, static_cast<TermId>(term_count));
}

}  // namespace logbuf
}  // namespace termlog
#endif  // TERMLOG_LOGBUF_PARTITION_INDEXER_HPP_
