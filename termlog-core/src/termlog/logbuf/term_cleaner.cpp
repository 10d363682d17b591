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
#include "termlog/logbuf/term_cleaner.hpp"

#include <glog/logging.h>

#include <cstring>

#include "termlog/assert_nd.hpp"
#include "termlog/logbuf/log_buffer.hpp"

namespace termlog {
namespace logbuf {

ErrorCode TermCleaner::clean_partition(PartitionIndex partition) {
  ASSERT_ND(buffer_->is_initialized());
  ASSERT_ND(partition < kPartitionCount);
  TermMetaData& meta = buffer_->get_term_meta_data(partition);
  if (meta.get_status() != kTermNeedsCleaning) {
    DVLOG(1) << "Partition " << partition << " is already clean";
    return kErrorCodeLogBufTermNotDirty;
  }
  if (partition == buffer_->get_active_partition_index()) {
    LOG(ERROR) << "Partition " << partition << " is marked dirty but is the active one";
    return kErrorCodeLogBufActivePartition;
  }

  std::memset(buffer_->get_term_block(partition), 0, buffer_->get_term_length());
  meta.reset();  // status is stored last, after the zeros above
  VLOG(0) << "Cleaned partition " << partition;
  return kErrorCodeOk;
}

ErrorCode TermCleaner::clean_all_dirty(uint16_t* cleaned_count) {
  ASSERT_ND(cleaned_count);
  *cleaned_count = 0;
  PartitionIndex active = buffer_->get_active_partition_index();
  for (PartitionIndex i = 0; i < kPartitionCount; ++i) {
    if (i == active || buffer_->get_term_meta_data(i).get_status() != kTermNeedsCleaning) {
      continue;
    }
    CHECK_ERROR_CODE(clean_partition(i));
    ++(*cleaned_count);
  }
  return kErrorCodeOk;
}

}  // namespace logbuf
}  // namespace termlog
