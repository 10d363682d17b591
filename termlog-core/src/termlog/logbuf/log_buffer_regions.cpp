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
#include "termlog/logbuf/log_buffer_regions.hpp"

#include <ostream>

#include "termlog/assert_nd.hpp"

namespace termlog {
namespace logbuf {

LogBufferRegions LogBufferRegions::slice(
  const memory::MemoryRegion& block,
  uint32_t term_length) {
  ASSERT_ND(block.get_length() >= compute_log_length(term_length));
  LogBufferRegions regions;
  for (PartitionIndex i = 0; i < kPartitionCount; ++i) {
    regions.term_regions_[i] = block.sub_region(compute_term_offset(i, term_length), term_length);
    regions.term_meta_data_regions_[i] = block.sub_region(
      compute_term_meta_data_offset(i, term_length),
      kTermMetaDataLength);
  }
  regions.log_meta_data_region_ = block.sub_region(
    compute_log_meta_data_offset(term_length),
    kLogMetaDataLength);
  return regions;
}

std::ostream& operator<<(std::ostream& o, const LogBufferRegions& v) {
  o << "<LogBufferRegions>";
  for (PartitionIndex i = 0; i < kPartitionCount; ++i) {
    o << "<Partition index=\"" << i << "\">"
      << "<term_>" << v.term_regions_[i] << "</term_>"
      << "<meta_>" << v.term_meta_data_regions_[i] << "</meta_>"
      << "</Partition>";
  }
  o << "<log_meta_>" << v.log_meta_data_region_ << "</log_meta_>";
  o << "</LogBufferRegions>";
  return o;
}

}  // namespace logbuf
}  // namespace termlog
