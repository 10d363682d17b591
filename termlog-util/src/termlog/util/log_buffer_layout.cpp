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
#include "termlog/util/log_buffer_layout.hpp"

#include <ostream>
#include <sstream>
#include <string>

#include "termlog/assert_nd.hpp"
#include "termlog/assorted/assorted_func.hpp"
#include "termlog/logbuf/log_buffer_descriptor.hpp"
#include "termlog/logbuf/partition_indexer.hpp"
#include "termlog/logbuf/position_codec.hpp"

namespace termlog {
namespace util {

ErrorStack LogBufferLayout::validate() const {
  return logbuf::validate_term_length(term_length_);
}

namespace {
void dump_region(std::ostream* out, const std::string& name, uint64_t offset, uint64_t length) {
  *out << "    <Region name=\"" << name << "\""
    << " offset=\"" << assorted::Hex(offset) << "\""
    << " length=\"" << length << "\" />" << std::endl;
}
}  // namespace

void LogBufferLayout::dump(std::ostream* out) const {
  ASSERT_ND(out);
  const uint8_t bits = logbuf::compute_position_bits_to_shift(term_length_);
  *out << "<LogBufferLayout>" << std::endl
    << "<Args>" << std::endl
    << "  <term_length_>" << term_length_ << "</term_length_>" << std::endl
    << "  <initial_term_id_>" << initial_term_id_ << "</initial_term_id_>" << std::endl
    << "</Args>" << std::endl;

  *out << "<Layout>" << std::endl
    << "  <log_length_>" << logbuf::compute_log_length(term_length_) << "</log_length_>"
    << std::endl
    << "  <position_bits_to_shift_>" << static_cast<int>(bits) << "</position_bits_to_shift_>"
    << std::endl
    << "  <Regions>" << std::endl;
  for (logbuf::PartitionIndex i = 0; i < logbuf::kPartitionCount; ++i) {
    std::stringstream name;
    name << "Term" << i;
    dump_region(out, name.str(), logbuf::compute_term_offset(i, term_length_), term_length_);
  }
  for (logbuf::PartitionIndex i = 0; i < logbuf::kPartitionCount; ++i) {
    std::stringstream name;
    name << "TermMeta" << i;
    dump_region(
      out,
      name.str(),
      logbuf::compute_term_meta_data_offset(i, term_length_),
      logbuf::kTermMetaDataLength);
  }
  dump_region(
    out,
    "LogMeta",
    logbuf::compute_log_meta_data_offset(term_length_),
    logbuf::kLogMetaDataLength);
  *out << "  </Regions>" << std::endl
    << "</Layout>" << std::endl;

  *out << "<Positions>" << std::endl;
  for (logbuf::LogPosition position : positions_) {
    logbuf::TermId term_id = logbuf::compute_term_id_from_position(
      position,
      bits,
      initial_term_id_);
    *out << "  <Position value=\"" << position << "\""
      << " term_id=\"" << term_id << "\""
      << " partition_index=\"" << logbuf::partition_index(initial_term_id_, term_id) << "\""
      << " term_offset=\"" << logbuf::compute_term_offset_from_position(position, bits) << "\""
      << " />" << std::endl;
  }
  *out << "</Positions>" << std::endl
    << "</LogBufferLayout>" << std::endl;
}

}  // namespace util
}  // namespace termlog
