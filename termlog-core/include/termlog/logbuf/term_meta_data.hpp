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
#ifndef TERMLOG_LOGBUF_TERM_META_DATA_HPP_
#define TERMLOG_LOGBUF_TERM_META_DATA_HPP_

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
 * @brief Accessors to the metadata record of one term.
 * @ingroup LOGBUF
 * @details
 * Only a \e view of the region; copying it copies the pointer.
 *
 * @par Writers
 * \li tail counter and high water mark: the producer only.
 * \li status: the producer (kTermClean to kTermNeedsCleaning, on rotation) and the cleaner
 * (kTermNeedsCleaning to kTermClean, after zeroing the term).
 *
 * Every store is a release and every load is an acquire, except
 * get_tail_counter_relaxed() which only the producer itself may use.
 */
class TermMetaData CXX11_FINAL {
 public:
  TermMetaData() : block_(CXX11_NULLPTR) {}
  explicit TermMetaData(const memory::MemoryRegion& region)
    : block_(reinterpret_cast<char*>(region.get_block())) {
    ASSERT_ND(region.get_length() >= kTermMetaDataLength);
  }

  bool        is_valid() const { return block_ != CXX11_NULLPTR; }

  TermStatus  get_status() const {
    return static_cast<TermStatus>(assorted::atomic_load_acquire<int32_t>(
      field_address(kTermStatusOffset)));
  }
  void        set_status(TermStatus status) {
    assorted::atomic_store_release<int32_t>(
      field_address(kTermStatusOffset),
      static_cast<int32_t>(status));
  }

  TermOffset  get_tail_counter() const {
    return assorted::atomic_load_acquire<TermOffset>(field_address(kTermTailCounterOffset));
  }
  /** For the producer, which is the only writer of the tail counter. */
  TermOffset  get_tail_counter_relaxed() const {
    return assorted::atomic_load_relaxed<TermOffset>(field_address(kTermTailCounterOffset));
  }
  void        set_tail_counter(TermOffset value) {
    assorted::atomic_store_release<TermOffset>(field_address(kTermTailCounterOffset), value);
  }

  TermOffset  get_high_water_mark() const {
    return assorted::atomic_load_acquire<TermOffset>(field_address(kTermHighWaterMarkOffset));
  }
  void        set_high_water_mark(TermOffset value) {
    assorted::atomic_store_release<TermOffset>(field_address(kTermHighWaterMarkOffset), value);
  }

  /**
   * @brief Zeroes both counters, then stores kTermClean.
   * @details
   * The status is stored last, so whoever observes kTermClean also observes the zeros.
   */
  void        reset();

  friend std::ostream& operator<<(std::ostream& o, const TermMetaData& v);

 private:
  int32_t*    field_address(uint32_t offset) const {
    ASSERT_ND(is_valid());
    return reinterpret_cast<int32_t*>(block_ + offset);
  }

  char*       block_;
};

}  // namespace logbuf
}  // namespace termlog
#endif  // TERMLOG_LOGBUF_TERM_META_DATA_HPP_
