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
#ifndef TERMLOG_LOGBUF_LOG_META_DATA_HPP_
#define TERMLOG_LOGBUF_LOG_META_DATA_HPP_

#include <stdint.h>

#include <iosfwd>

#include "termlog/assert_nd.hpp"
#include "termlog/cxx11.hpp"
#include "termlog/assorted/atomic_fences.hpp"
#include "termlog/logbuf/log_buffer_descriptor.hpp"
#include "termlog/logbuf/logbuf_id.hpp"
#include "termlog/memory/memory_region.hpp"

namespace termlog {
namespace logbuf {
/**
 * @brief Accessors to the log metadata record of one log.
 * @ingroup LOGBUF
 * @details
 * Only a \e view of the region; copying it copies the pointer.
 *
 * @par Ordering
 * The active term id is what consumers look at to know which partition is being written.
 * The producer publishes a new one with set_active_term_id() (release) after finishing every
 * write that must be visible with it, and consumers read it with get_active_term_id()
 * (acquire). The initial term id is written once at stream creation, before the first
 * release of the active term id, so plain accesses are enough for it.
 */
class LogMetaData CXX11_FINAL {
 public:
  LogMetaData() : block_(CXX11_NULLPTR) {}
  explicit LogMetaData(const memory::MemoryRegion& region)
    : block_(reinterpret_cast<char*>(region.get_block())) {
    ASSERT_ND(region.get_length() >= kLogMetaDataLength);
  }

  bool    is_valid() const { return block_ != CXX11_NULLPTR; }

  TermId  get_initial_term_id() const { return *initial_term_id_address(); }
  void    set_initial_term_id(TermId value) { *initial_term_id_address() = value; }

  /** Acquire load. */
  TermId  get_active_term_id() const {
    return assorted::atomic_load_acquire<TermId>(active_term_id_address());
  }
  /** Release store. */
  void    set_active_term_id(TermId value) {
    assorted::atomic_store_release<TermId>(active_term_id_address(), value);
  }

  friend std::ostream& operator<<(std::ostream& o, const LogMetaData& v);

 private:
  TermId* initial_term_id_address() const {
    ASSERT_ND(is_valid());
    return reinterpret_cast<TermId*>(block_ + kLogInitialTermIdOffset);
  }
  TermId* active_term_id_address() const {
    ASSERT_ND(is_valid());
    return reinterpret_cast<TermId*>(block_ + kLogActiveTermIdOffset);
  }

  char*   block_;
};

}  // namespace logbuf
}  // namespace termlog
#endif  // TERMLOG_LOGBUF_LOG_META_DATA_HPP_
