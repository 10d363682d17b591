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
#ifndef TERMLOG_LOGBUF_LOG_BUFFER_DESCRIPTOR_HPP_
#define TERMLOG_LOGBUF_LOG_BUFFER_DESCRIPTOR_HPP_

#include <stdint.h>

#include "termlog/error_stack.hpp"
#include "termlog/assorted/cacheline.hpp"
#include "termlog/logbuf/logbuf_id.hpp"
#include "termlog/memory/memory_region.hpp"

/**
 * @file termlog/logbuf/log_buffer_descriptor.hpp
 * @ingroup LOGBUF
 * @brief Byte layout of a log buffer and validation of the regions it is built on.
 * @details
 * Everything here is part of the shared memory format. A process that attaches to a log
 * created by another process must agree on every constant.
 *
 * Term metadata, per partition:
 * @code
 *  0                   4                   8                          64
 *  +-------------------+-------------------+---------------------------+
 *  |  high water mark  |      status       |         (padding)         |
 *  +-------------------+-------------------+---------------------------+
 *  |   tail counter    |                  (padding)                    |
 *  +-------------------+-----------------------------------------------+
 *  64                  68                                             128
 * @endcode
 * The tail counter is written on every append, so it sits alone on the second cacheline.
 * The status shares the first cacheline with the high water mark. A layout that puts the
 * status at offset 68, next to the tail counter, is not compatible with this one. Processes
 * sharing a log must all use these offsets.
 *
 * Log metadata:
 * @code
 *  0                   4                   8                          64
 *  +-------------------+-------------------+---------------------------+
 *  |  initial term id  |  active term id   |         (padding)         |
 *  +-------------------+-------------------+---------------------------+
 * @endcode
 */
namespace termlog {
namespace logbuf {

/** Number of partitions (terms) in the ring. @ingroup LOGBUF */
const uint16_t kPartitionCount = 3;

/** Minimum byte length of one term. @ingroup LOGBUF */
const uint32_t kTermMinLength = 64 * 1024;

/**
 * Maximum byte length of one term. Offsets in a term are signed 32-bit integers.
 * @ingroup LOGBUF
 * @details
 * This narrows the valid term lengths: powers of two larger than this are rejected even
 * though they are multiples of kFrameAlignment and at least kTermMinLength. The tail of a
 * full 2GB term would not fit in a TermOffset.
 */
const uint32_t kTermMaxLength = 1U << 30;

/** Alignment of every frame in a term, thus of every term length. @ingroup LOGBUF */
const uint32_t kFrameAlignment = 8;

/** Byte length of one term metadata record. @ingroup LOGBUF */
const uint32_t kTermMetaDataLength = 2 * assorted::kCachelineSize;

/** Byte length of the log metadata record. @ingroup LOGBUF */
const uint32_t kLogMetaDataLength = assorted::kCachelineSize;

/** Offset of the high water mark in term metadata. @ingroup LOGBUF */
const uint32_t kTermHighWaterMarkOffset = 0;

/** Offset of the status in term metadata. @ingroup LOGBUF */
const uint32_t kTermStatusOffset = 4;

/** Offset of the tail counter in term metadata. @ingroup LOGBUF */
const uint32_t kTermTailCounterOffset = assorted::kCachelineSize;

/** Offset of the initial term id in log metadata. @ingroup LOGBUF */
const uint32_t kLogInitialTermIdOffset = 0;

/** Offset of the active term id in log metadata. @ingroup LOGBUF */
const uint32_t kLogActiveTermIdOffset = 4;

/**
 * @brief Cleanliness of a term.
 * @ingroup LOGBUF
 * @details
 * Stored as a 32-bit integer at kTermStatusOffset.
 */
enum TermStatus {
  /** Zero-filled and ready to become the active term. */
  kTermClean = 0,
  /** Retired by the producer. Must be zeroed before reuse. */
  kTermNeedsCleaning = 1,
};

/** Byte length of one term metadata record. Same as kTermMetaDataLength. */
inline uint32_t term_meta_data_length() { return kTermMetaDataLength; }

/** Byte length of the log metadata record. Same as kLogMetaDataLength. */
inline uint32_t log_meta_data_length() { return kLogMetaDataLength; }

/**
 * @brief Total byte length of a log whose terms are term_length bytes each.
 * @details
 * compute_log_length(65536) is 197056.
 */
inline uint64_t compute_log_length(uint32_t term_length) {
  return static_cast<uint64_t>(term_length) * kPartitionCount
    + static_cast<uint64_t>(kTermMetaDataLength) * kPartitionCount
    + kLogMetaDataLength;
}

/** Byte offset of the term of the given partition in the contiguous layout. */
inline uint64_t compute_term_offset(PartitionIndex partition, uint32_t term_length) {
  return static_cast<uint64_t>(partition) * term_length;
}

/** Byte offset of the term metadata of the given partition in the contiguous layout. */
inline uint64_t compute_term_meta_data_offset(PartitionIndex partition, uint32_t term_length) {
  return static_cast<uint64_t>(term_length) * kPartitionCount
    + static_cast<uint64_t>(partition) * kTermMetaDataLength;
}

/** Byte offset of the log metadata in the contiguous layout. */
inline uint64_t compute_log_meta_data_offset(uint32_t term_length) {
  return compute_term_meta_data_offset(kPartitionCount, term_length);
}

/**
 * @brief Checks a term length.
 * @return kErrorCodeLogBufInvalidLayout if the length is less than kTermMinLength, more than
 * kTermMaxLength, not a multiple of kFrameAlignment, or not a power of two.
 */
ErrorStack validate_term_length(uint64_t length);

/** validate_term_length() on the length of the region. Also rejects a null block. */
ErrorStack validate_term_region(const memory::MemoryRegion& region);

/** kErrorCodeLogBufInvalidLayout if the region is shorter than kTermMetaDataLength. */
ErrorStack validate_meta_data_region(const memory::MemoryRegion& region);

/** kErrorCodeLogBufInvalidLayout if the region is shorter than kLogMetaDataLength. */
ErrorStack validate_log_meta_data_region(const memory::MemoryRegion& region);

/**
 * @brief log2(term_length).
 * @pre term_length passed validate_term_length()
 */
uint8_t compute_position_bits_to_shift(uint32_t term_length);

}  // namespace logbuf
}  // namespace termlog
#endif  // TERMLOG_LOGBUF_LOG_BUFFER_DESCRIPTOR_HPP_
