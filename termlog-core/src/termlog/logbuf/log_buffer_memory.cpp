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
#include "termlog/logbuf/log_buffer_memory.hpp"

#include <glog/logging.h>

#include <ostream>

#include "termlog/logbuf/log_buffer_descriptor.hpp"

namespace termlog {
namespace logbuf {
const uint64_t LogBufferMemory::kBlockAlignment;

ErrorStack LogBufferMemory::initialize_once() {
  CHECK_ERROR(validate_term_length(options_->term_length_));
  uint64_t log_length = compute_log_length(options_->term_length_);
  LOG(INFO) << "Allocating a log buffer of " << log_length << " bytes."
    << " term_length=" << options_->term_length_;
  memory::AlignedMemory::AllocType alloc_type = options_->use_numa_alloc_
    ? memory::AlignedMemory::kNumaAllocOnnode
    : memory::AlignedMemory::kPosixMemalign;
  memory_.alloc(log_length, kBlockAlignment, alloc_type, options_->numa_node_);
  CHECK_OUTOFMEMORY(memory_.get_block());
  regions_ = LogBufferRegions::slice(memory_.as_region(), options_->term_length_);
  return kRetOk;
}

ErrorStack LogBufferMemory::uninitialize_once() {
  regions_ = LogBufferRegions();
  memory_.release_block();
  return kRetOk;
}

std::ostream& operator<<(std::ostream& o, const LogBufferMemory& v) {
  o << "<LogBufferMemory>" << v.memory_ << v.regions_ << "</LogBufferMemory>";
  return o;
}

}  // namespace logbuf
}  // namespace termlog
