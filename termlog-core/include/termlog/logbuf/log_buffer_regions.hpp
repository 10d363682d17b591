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
#ifndef TERMLOG_LOGBUF_LOG_BUFFER_REGIONS_HPP_
#define TERMLOG_LOGBUF_LOG_BUFFER_REGIONS_HPP_

#include <iosfwd>

#include "termlog/cxx11.hpp"
#include "termlog/logbuf/log_buffer_descriptor.hpp"
#include "termlog/memory/memory_region.hpp"

namespace termlog {
namespace logbuf {
/**
 * @brief The raw regions one log buffer is built on.
 * @ingroup LOGBUF
 * @details
 * Whoever backs the log with memory (LogBufferMemory in this library, or a mapping of a
 * shared file) fills this in. The regions need not be contiguous.
 *
 * This object is a POD.
 */
struct LogBufferRegions CXX11_FINAL {
  memory::MemoryRegion  term_regions_[kPartitionCount];
  memory::MemoryRegion  term_meta_data_regions_[kPartitionCount];
  memory::MemoryRegion  log_meta_data_region_;

  /**
   * @brief Slices one contiguous block laid out as compute_log_length() describes.
   * @param[in] block at least compute_log_length(term_length) bytes
   */
  static LogBufferRegions slice(const memory::MemoryRegion& block, uint32_t term_length);

  friend std::ostream& operator<<(std::ostream& o, const LogBufferRegions& v);
};

}  // namespace logbuf
}  // namespace termlog
#endif  // TERMLOG_LOGBUF_LOG_BUFFER_REGIONS_HPP_
