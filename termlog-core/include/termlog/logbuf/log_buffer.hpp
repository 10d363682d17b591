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
#ifndef TERMLOG_LOGBUF_LOG_BUFFER_HPP_
#define TERMLOG_LOGBUF_LOG_BUFFER_HPP_

#include <stdint.h>

#include <iosfwd>

#include "termlog/assert_nd.hpp"
#include "termlog/cxx11.hpp"
#include "termlog/error_code.hpp"
#include "termlog/initializable.hpp"
#include "termlog/logbuf/log_buffer_descriptor.hpp"
#include "termlog/logbuf/log_buffer_regions.hpp"
#include "termlog/logbuf/log_meta_data.hpp"
#include "termlog/logbuf/logbuf_id.hpp"
#include "termlog/logbuf/partition_indexer.hpp"
#include "termlog/logbuf/term_meta_data.hpp"

namespace termlog {
namespace logbuf {
/**
 * @brief Three terms, their metadata and the log metadata, used as one ring.
 * @ingroup LOGBUF
 * @details
 * This object does not own any memory. It binds the regions given to the constructor,
 * and initialize() checks that they satisfy the layout.
 *
 * @par Who calls what
 * \li The producer (only one per stream): create_stream() once, then append() and rotate().
 * \li Consumers (any number, any thread): the get_xxx() methods, position_to_location().
 * \li The cleaner (one): see TermCleaner.
 *
 * A process that attaches to a log another process created constructs its own LogBuffer
 * on the same regions and calls initialize() but not create_stream().
 *
 * @par Errors
 * append() and rotate() are on the hot path, so they return a bare ErrorCode:
 * \li kErrorCodeLogBufTermFull from append(): the active term cannot hold the reservation.
 * The caller should rotate() and retry.
 * \li kErrorCodeLogBufRotationBlocked from rotate(): the next partition is not cleaned yet.
 * Nothing is changed; the caller stalls and retries.
 * \li kErrorCodeLogBufTermIdExhausted from rotate(): 2^31 - 1 terms have been used since
 * the initial term id. Positions and partition indexes are defined only up to there, so
 * the stream must be recreated.
 * \li kErrorCodeLogBufActiveTermDirty from append(): the active partition is marked
 * kTermNeedsCleaning. Only happens if someone else wrote the status.
 */
class LogBuffer CXX11_FINAL : public DefaultInitializable {
 public:
  LogBuffer() CXX11_FUNC_DELETE;
  explicit LogBuffer(const LogBufferRegions& regions);

  /**
   * Validates every region, checks that all terms have the same length, and computes
   * the position shift. Fails with kErrorCodeLogBufInvalidLayout or
   * kErrorCodeLogBufTermLengthMismatch.
   */
  ErrorStack  initialize_once() CXX11_OVERRIDE;
  ErrorStack  uninitialize_once() CXX11_OVERRIDE;

  /**
   * @brief Starts a new stream on the regions.
   * @pre is_initialized()
   * @details
   * Resets every term metadata to kTermClean with zero counters, stores the initial term id,
   * and finally publishes initial_term_id as the active term id. Partition 0 becomes active.
   * Term contents are not touched; the regions must have been zero-filled by whoever
   * allocated them.
   */
  void        create_stream(TermId initial_term_id);

  /**
   * @brief Reserves length bytes at the tail of the active term.
   * @param[in] length byte length to reserve
   * @param[out] reserved_offset offset of the reserved range in the active term
   * @return kErrorCodeLogBufTermFull if tail + length exceeds the term length, or
   * kErrorCodeLogBufActiveTermDirty if the active partition is not kTermClean. In both cases
   * nothing is changed.
   * @details
   * Single writer only, so a plain read of the tail followed by a release store of the new
   * tail is enough. No CAS.
   */
  ErrorCode   append(uint32_t length, TermOffset* reserved_offset);

  /**
   * @brief Retires the active term and makes the next one active.
   * @return kErrorCodeLogBufRotationBlocked if the next partition is not kTermClean, or
   * kErrorCodeLogBufTermIdExhausted if the next term id would overflow the term count.
   * In both cases nothing is changed.
   * @details
   * The partition checked is the one the next term id maps to, which is the partition that
   * becomes active. Marks the current partition kTermNeedsCleaning, then release-stores
   * active term id + 1.
   */
  ErrorCode   rotate();

  /** Partition of the active term. */
  PartitionIndex  get_active_partition_index() const {
    return partition_index(get_initial_term_id(), get_active_term_id());
  }
  TermId      get_active_term_id() const { return log_meta_data_.get_active_term_id(); }
  TermId      get_initial_term_id() const { return log_meta_data_.get_initial_term_id(); }

  /**
   * @brief Position of the tail of the given partition.
   * @details
   * The term id the partition holds is derived from the active term id and how far the
   * partition is behind the active one in the ring, 0 to 2 terms.
   * For a partition that has not been used yet, this is a position of the term before the
   * initial one, which is meaningless (and negative).
   */
  LogPosition get_position(PartitionIndex partition) const;

  /** Position of the producer, the tail of the active term. */
  LogPosition get_position() const { return get_position(get_active_partition_index()); }

  /** Where the position physically is. */
  LogLocation position_to_location(LogPosition position) const;

  TermMetaData&       get_term_meta_data(PartitionIndex partition) {
    ASSERT_ND(partition < kPartitionCount);
    return term_meta_data_[partition];
  }
  const TermMetaData& get_term_meta_data(PartitionIndex partition) const {
    ASSERT_ND(partition < kPartitionCount);
    return term_meta_data_[partition];
  }
  LogMetaData&        get_log_meta_data() { return log_meta_data_; }
  const LogMetaData&  get_log_meta_data() const { return log_meta_data_; }

  /** Beginning of the given term. */
  char*       get_term_block(PartitionIndex partition) const {
    ASSERT_ND(partition < kPartitionCount);
    return reinterpret_cast<char*>(regions_.term_regions_[partition].get_block());
  }
  uint32_t    get_term_length() const { return term_length_; }
  uint8_t     get_position_bits_to_shift() const { return position_bits_to_shift_; }
  const LogBufferRegions& get_regions() const { return regions_; }

  friend std::ostream& operator<<(std::ostream& o, const LogBuffer& v);

 private:
  const LogBufferRegions  regions_;

  /** Views of regions_. Valid after initialize(). */
  TermMetaData            term_meta_data_[kPartitionCount];
  LogMetaData             log_meta_data_;

  /** Same for all terms. */
  uint32_t                term_length_;
  /** log2(term_length_) */
  uint8_t                 position_bits_to_shift_;
};

}  // namespace logbuf
}  // namespace termlog
#endif  // TERMLOG_LOGBUF_LOG_BUFFER_HPP_
