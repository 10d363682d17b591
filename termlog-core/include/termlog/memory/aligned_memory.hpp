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
#ifndef TERMLOG_MEMORY_ALIGNED_MEMORY_HPP_
#define TERMLOG_MEMORY_ALIGNED_MEMORY_HPP_

#include <stdint.h>

#include <iosfwd>

#include "termlog/cxx11.hpp"
#include "termlog/memory/memory_region.hpp"

namespace termlog {
namespace memory {

/**
 * @brief An owned, aligned and zero-filled memory block.
 * @ingroup MEMORY
 * @details
 * The in-process region provider allocates a whole log (three terms, their metadata and the
 * log metadata) as one of these and slices it into MemoryRegion views.
 * Movable but not copiable.
 *
 * The block is zero-filled right after allocation. A new log buffer relies on that: every
 * status reads kTermClean and every counter 0 before create_stream().
 */
class AlignedMemory CXX11_FINAL {
 public:
  enum AllocType {
    /** posix_memalign() and free(). */
    kPosixMemalign = 0,
    /** numa_alloc_onnode() and numa_free(). Page aligned whatever the requested alignment. */
    kNumaAllocOnnode,
  };

  AlignedMemory() CXX11_NOEXCEPT : size_(0), alignment_(0), alloc_type_(kPosixMemalign),
    numa_node_(0), block_(CXX11_NULLPTR) {}
  /** Same as alloc() on an empty object. */
  AlignedMemory(uint64_t size, uint64_t alignment,
    AllocType alloc_type, int numa_node) CXX11_NOEXCEPT;
  AlignedMemory(const AlignedMemory &other) CXX11_FUNC_DELETE;
  AlignedMemory& operator=(const AlignedMemory &other) CXX11_FUNC_DELETE;
#ifndef DISABLE_CXX11_IN_PUBLIC_HEADERS
  AlignedMemory(AlignedMemory &&other) noexcept;
  AlignedMemory& operator=(AlignedMemory &&other) noexcept;
#endif  // DISABLE_CXX11_IN_PUBLIC_HEADERS
  ~AlignedMemory() { release_block(); }

  /**
   * Releases the current block and allocates a new one.  size is rounded up to a multiple
   * of  alignment, which must be a power of two. If NUMA is not available,
   * kNumaAllocOnnode falls back to kPosixMemalign.
   * Does not throw. On failure the object is left empty, and the caller checks is_null().
   */
  void        alloc(uint64_t size, uint64_t alignment, AllocType alloc_type,
    int numa_node) CXX11_NOEXCEPT;
  void        release_block();

  void*       get_block() const { return block_; }
  bool        is_null() const { return block_ == CXX11_NULLPTR; }
  uint64_t    get_size() const { return size_; }
  uint64_t    get_alignment() const { return alignment_; }
  MemoryRegion  as_region() const { return MemoryRegion(block_, size_); }

  friend std::ostream&    operator<<(std::ostream& o, const AlignedMemory& v);

 private:
  uint64_t    size_;
  uint64_t    alignment_;
  AllocType   alloc_type_;
  int         numa_node_;
  void*       block_;
};

}  // namespace memory
}  // namespace termlog

#endif  // TERMLOG_MEMORY_ALIGNED_MEMORY_HPP_
