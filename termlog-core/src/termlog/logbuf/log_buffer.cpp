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
#include "termlog/logbuf/log_buffer.hpp"

#include <glog/logging.h>

#include <ostream>
#include <sstream>

#include "termlog/assert_nd.hpp"
#include "termlog/logbuf/position_codec.hpp"

namespace termlog {
namespace logbuf {

LogBuffer::LogBuffer(const LogBufferRegions& regions)
  : regions_(regions), term_length_(0), position_bits_to_shift_(0) {
}

ErrorStack LogBuffer::initialize_once() {
  LOG(INFO) << "Initializing LogBuffer.. " << regions_;
  for (PartitionIndex i = 0; i < kPartitionCount; ++i) {
    CHECK_ERROR(validate_term_region(regions_.term_regions_[i]));
    CHECK_ERROR(validate_meta_data_region(regions_.term_meta_data_regions_[i]));
  }
  CHECK_ERROR(validate_log_meta_data_region(regions_.log_meta_data_region_));

  uint64_t length = regions_.term_regions_[0].get_length();
  for (PartitionIndex i = 1; i < kPartitionCount; ++i) {
    if (regions_.term_regions_[i].get_length() != length) {
      std::stringstream message;
      message << "Term " << i << " is " << regions_.term_regions_[i].get_length()
        << " bytes while term 0 is " << length << " bytes";
      LOG(ERROR) << message.str();
      return ERROR_STACK_MSG(kErrorCodeLogBufTermLengthMismatch, message.str().c_str());
    }
  }
  term_length_ = static_cast<uint32_t>(length);
  position_bits_to_shift_ = compute_position_bits_to_shift(term_length_);

  for (PartitionIndex i = 0; i < kPartitionCount; ++i) {
    term_meta_data_[i] = TermMetaData(regions_.term_meta_data_regions_[i]);
  }
  log_meta_data_ = LogMetaData(regions_.log_meta_data_region_);
  LOG(INFO) << "Initialized LogBuffer. term_length=" << term_length_
    << ", position_bits_to_shift=" << static_cast<int>(position_bits_to_shift_);
  return kRetOk;
}

ErrorStack LogBuffer::uninitialize_once() {
  // the regions are not ours. just forget the views.
  for (PartitionIndex i = 0; i < kPartitionCount; ++i) {
    term_meta_data_[i] = TermMetaData();
  }
  log_meta_data_ = LogMetaData();
  return kRetOk;
}

void LogBuffer::create_stream(TermId initial_term_id) {
  ASSERT_ND(is_initialized());
  for (PartitionIndex i = 0; i < kPartitionCount; ++i) {
    term_meta_data_[i].reset();
  }
  log_meta_data_.set_initial_term_id(initial_term_id);
  // publishes everything above to consumers
  log_meta_data_.set_active_term_id(initial_term_id);
  LOG(INFO) << "Created a stream. initial_term_id=" << initial_term_id;
}

ErrorCode LogBuffer::append(uint32_t length, TermOffset* reserved_offset) {
  ASSERT_ND(is_initialized());
  ASSERT_ND(reserved_offset);
  TermMetaData& meta = term_meta_data_[get_active_partition_index()];
  if (UNLIKELY(meta.get_status() != kTermClean)) {
    return kErrorCodeLogBufActiveTermDirty;
  }
  TermOffset tail = meta.get_tail_counter_relaxed();
  ASSERT_ND(tail >= 0);
  ASSERT_ND(static_cast<uint32_t>(tail) <= term_length_);
  if (UNLIKELY(static_cast<uint64_t>(tail) + length > term_length_)) {
    return kErrorCodeLogBufTermFull;
  }
  meta.set_tail_counter(static_cast<TermOffset>(tail + length));
  *reserved_offset = tail;
  return kErrorCodeOk;
}

ErrorCode LogBuffer::rotate() {
  ASSERT_ND(is_initialized());
  const TermId initial_term_id = get_initial_term_id();
  TermId active_term_id = get_active_term_id();
  TermId next_term_id = static_cast<TermId>(static_cast<uint32_t>(active_term_id) + 1U);
  if (UNLIKELY(compute_term_count(next_term_id, initial_term_id) < 0)) {
    // the term count would wrap to negative. positions and partitions are undefined there.
    LOG(ERROR) << "Term ids exhausted. initial_term_id=" << initial_term_id
      << ", active_term_id=" << active_term_id;
    return kErrorCodeLogBufTermIdExhausted;
  }

  PartitionIndex current = partition_index(initial_term_id, active_term_id);
  PartitionIndex next = partition_index(initial_term_id, next_term_id);
  ASSERT_ND(next != current);
  ASSERT_ND(next == next_partition_index(current));
  if (term_meta_data_[next].get_status() != kTermClean) {
    LOG(WARNING) << "Rotation blocked. Partition " << next << " is not cleaned yet."
      << " active_term_id=" << active_term_id;
    return kErrorCodeLogBufRotationBlocked;
  }

  term_meta_data_[current].set_status(kTermNeedsCleaning);
  log_meta_data_.set_active_term_id(next_term_id);
  VLOG(0) << "Rotated from partition " << current << " to " << next
    << ". active_term_id=" << next_term_id;
  return kErrorCodeOk;
}

LogPosition LogBuffer::get_position(PartitionIndex partition) const {
  ASSERT_ND(is_initialized());
  ASSERT_ND(partition < kPartitionCount);
  TermId active_term_id = get_active_term_id();
  PartitionIndex active = partition_index(get_initial_term_id(), active_term_id);
  uint32_t terms_behind = (active + kPartitionCount - partition) % kPartitionCount;
  TermId term_id = static_cast<TermId>(static_cast<uint32_t>(active_term_id) - terms_behind);
  TermOffset tail = term_meta_data_[partition].get_tail_counter();
  return compute_position(term_id, tail, position_bits_to_shift_, get_initial_term_id());
}

LogLocation LogBuffer::position_to_location(LogPosition position) const {
  ASSERT_ND(is_initialized());
  LogLocation location;
  location.term_id_ = compute_term_id_from_position(
    position,
    position_bits_to_shift_,
    get_initial_term_id());
  location.partition_index_ = partition_index(get_initial_term_id(), location.term_id_);
  location.term_offset_ = compute_term_offset_from_position(position, position_bits_to_shift_);
  return location;
}

std::ostream& operator<<(std::ostream& o, const LogLocation& v) {
  o << "<LogLocation>"
    << "<term_id_>" << v.term_id_ << "</term_id_>"
    << "<partition_index_>" << v.partition_index_ << "</partition_index_>"
    << "<term_offset_>" << v.term_offset_ << "</term_offset_>"
    << "</LogLocation>";
  return o;
}

std::ostream& operator<<(std::ostream& o, const LogBuffer& v) {
  o << "<LogBuffer>";
  o << "<term_length_>" << v.term_length_ << "</term_length_>";
  o << "<position_bits_to_shift_>" << static_cast<int>(v.position_bits_to_shift_)
    << "</position_bits_to_shift_>";
  if (v.is_initialized()) {
    o << v.log_meta_data_;
    o << "<active_partition_index_>" << v.get_active_partition_index()
      << "</active_partition_index_>";
    for (PartitionIndex i = 0; i < kPartitionCount; ++i) {
      o << v.term_meta_data_[i];
    }
  }
  o << "</LogBuffer>";
  return o;
}

}  // namespace logbuf
}  // namespace termlog
