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
#include "termlog/memory/aligned_memory.hpp"

#include <errno.h>
#include <numa.h>
#include <glog/logging.h>

#include <cstdlib>
#include <cstring>
#include <ostream>
#include <utility>

#include "termlog/assert_nd.hpp"
#include "termlog/assorted/assorted_func.hpp"

namespace termlog {
namespace memory {

namespace {
const char* alloc_type_name(AlignedMemory::AllocType type) {
  return type == AlignedMemory::kNumaAllocOnnode ? "numa_alloc_onnode" : "posix_memalign";
}
}  // anonymous namespace

AlignedMemory::AlignedMemory(uint64_t size, uint64_t alignment, AllocType alloc_type,
               int numa_node) noexcept
  : size_(0), alignment_(0), alloc_type_(kPosixMemalign), numa_node_(0), block_(nullptr) {
  alloc(size, alignment, alloc_type, numa_node);
}

AlignedMemory::AlignedMemory(AlignedMemory &&other) noexcept
  : size_(0), alignment_(0), alloc_type_(kPosixMemalign), numa_node_(0), block_(nullptr) {
  *this = std::move(other);
}

AlignedMemory& AlignedMemory::operator=(AlignedMemory &&other) noexcept {
  if (this != &other) {
    release_block();
    std::swap(size_, other.size_);
    std::swap(alignment_, other.alignment_);
    std::swap(alloc_type_, other.alloc_type_);
    std::swap(numa_node_, other.numa_node_);
    std::swap(block_, other.block_);
  }
  return *this;
}

void AlignedMemory::alloc(uint64_t size, uint64_t alignment, AllocType alloc_type,
              int numa_node) noexcept {
  release_block();
  ASSERT_ND(assorted::is_power_of_two(alignment));
  uint64_t rounded = (size + alignment - 1) / alignment * alignment;
  if (rounded == 0) {
    rounded = alignment;
  }
  if (alloc_type == kNumaAllocOnnode && ::numa_available() < 0) {
    LOG(WARNING) << "NUMA is not available on this machine. Using posix_memalign() instead";
    alloc_type = kPosixMemalign;
  }

  void* block = nullptr;
  if (alloc_type == kNumaAllocOnnode) {
    block = ::numa_alloc_onnode(rounded, numa_node);
  } else {
    int ret = ::posix_memalign(&block, alignment, rounded);
    if (ret != 0) {
      errno = ret;
      block = nullptr;
    }
  }
  if (block == nullptr) {
    LOG(ERROR) << alloc_type_name(alloc_type) << "() failed. size=" << rounded
      << ", alignment=" << alignment << ", numa_node=" << numa_node
      << ", error=" << assorted::os_error();
    return;
  }

  std::memset(block, 0, rounded);
  block_ = block;
  size_ = rounded;
  alignment_ = alignment;
  alloc_type_ = alloc_type;
  numa_node_ = numa_node;
  LOG(INFO) << "Allocated " << *this;
}

void AlignedMemory::release_block() {
  if (block_ == nullptr) {
    return;
  }
  if (alloc_type_ == kNumaAllocOnnode) {
    ::numa_free(block_, size_);
  } else {
    std::free(block_);
  }
  block_ = nullptr;
  size_ = 0;
}

std::ostream& operator<<(std::ostream& o, const AlignedMemory& v) {
  o << "<AlignedMemory><address>" << v.block_ << "</address>"
    << "<size>" << v.size_ << "</size>"
    << "<alignment>" << v.alignment_ << "</alignment>"
    << "<alloc_type>" << alloc_type_name(v.alloc_type_) << "</alloc_type>"
    << "<numa_node>" << v.numa_node_ << "</numa_node></AlignedMemory>";
  return o;
}

std::ostream& operator<<(std::ostream& o, const MemoryRegion& v) {
  o << "<MemoryRegion><address>" << v.block_ << "</address>"
    << "<length>" << v.length_ << "</length></MemoryRegion>";
  return o;
}

}  // namespace memory
}  // namespace termlog
