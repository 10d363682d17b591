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
#ifndef TERMLOG_LOGBUF_TERM_CLEANER_HPP_
#define TERMLOG_LOGBUF_TERM_CLEANER_HPP_

#include <stdint.h>

#include "termlog/cxx11.hpp"
#include "termlog/error_code.hpp"
#include "termlog/logbuf/fwd.hpp"
#include "termlog/logbuf/logbuf_id.hpp"

namespace termlog {
namespace logbuf {
/**
 * @brief Zeroes retired terms so the producer can rotate into them again.
 * @ingroup LOGBUF
 * @details
 * The only one that moves a partition from kTermNeedsCleaning to kTermClean.
 * One cleaner per log buffer; it may run in any thread concurrently with the producer
 * and consumers. It never touches the active partition, and the producer never rotates
 * into a partition that is not clean, so the two never write the same term.
 *
 * Deciding \e when a retired term is drained enough to be cleaned is the caller's job.
 */
class TermCleaner CXX11_FINAL {
 public:
  TermCleaner() CXX11_FUNC_DELETE;
  /** @param[in] buffer initialized log buffer that must outlive this object */
  explicit TermCleaner(LogBuffer* buffer) : buffer_(buffer) {}

  /**
   * @brief Zeroes the term of the partition, resets its counters, then marks it kTermClean.
   * @return kErrorCodeLogBufTermNotDirty if the partition is not kTermNeedsCleaning,
   * kErrorCodeLogBufActivePartition if it is the active one. Nothing is changed on error.
   */
  ErrorCode   clean_partition(PartitionIndex partition);

  /**
   * @brief Cleans every partition that is kTermNeedsCleaning and not active.
   * @param[out] cleaned_count number of partitions this call cleaned
   */
  ErrorCode   clean_all_dirty(uint16_t* cleaned_count);

 private:
  LogBuffer* const buffer_;
};

}  // namespace logbuf
}  // namespace termlog
#endif  // TERMLOG_LOGBUF_TERM_CLEANER_HPP_
