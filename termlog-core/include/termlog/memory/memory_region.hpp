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
#ifndef TERMLOG_MEMORY_MEMORY_REGION_HPP_
#define TERMLOG_MEMORY_MEMORY_REGION_HPP_

#include <stdint.h>

#include <iosfwd>

#include "termlog/cxx11.hpp"

namespace termlog {
namespace memory {

/**
 * @brief A byte range handed out by a region provider.
 * @ingroup MEMORY
 * @details
 * Only a \e view. It never allocates nor releases the block.
 * The block may be process-private memory or a mapping shared with other processes;
 * the log buffer does not care as long as it outlives the view.
 *
 * This object is a POD.
 */
struct MemoryRegion CXX11_FINAL {
  MemoryRegion() : block_(CXX11_NULLPTR), length_(0) {}
  MemoryRegion(void* block, uint64_t length) : block_(block), length_(length) {}

  /** A region that covers [offset, offset + length) of this region. */
  MemoryRegion  sub_region(uint64_t offset, uint64_t length) const {
    return MemoryRegion(reinterpret_cast<char*>(block_) + offset, length);
  }

  bool          is_valid() const { return block_ != CXX11_NULLPTR; }
  void*         get_block() const { return block_; }
  uint64_t      get_length() const { return length_; }

  friend std::ostream& operator<<(std::ostream& o, const MemoryRegion& v);

  void*         block_;
  uint64_t      length_;
};

}  // namespace memory
}  // namespace termlog

#endif  // TERMLOG_MEMORY_MEMORY_REGION_HPP_
