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
#ifndef TERMLOG_LOGBUF_LOG_BUFFER_MEMORY_HPP_
#define TERMLOG_LOGBUF_LOG_BUFFER_MEMORY_HPP_

#include <iosfwd>

#include "termlog/cxx11.hpp"
#include "termlog/initializable.hpp"
#include "termlog/logbuf/log_buffer_options.hpp"
#include "termlog/logbuf/log_buffer_regions.hpp"
#include "termlog/memory/aligned_memory.hpp"

namespace termlog {
namespace logbuf {
/**
 * @brief Backs one log buffer with process-private memory.
 * @ingroup LOGBUF
 * @details
 * Allocates compute_log_length() bytes as one zero-filled AlignedMemory and slices it into
 * LogBufferRegions in the contiguous layout. Sharing the log with other processes
 * needs a different provider that fills LogBufferRegions from a shared mapping.
 */
class LogBufferMemory CXX11_FINAL : public DefaultInitializable {
 public:
  /** Alignment of the whole block. Every region in it is at least cacheline-aligned. */
  static const uint64_t kBlockAlignment = 1ULL << 12;

  LogBufferMemory() CXX11_FUNC_DELETE;
  /** @param[in] options must outlive this object */
  explicit LogBufferMemory(const LogBufferOptions* options) : options_(options) {}

  ErrorStack  initialize_once() CXX11_OVERRIDE;
  ErrorStack  uninitialize_once() CXX11_OVERRIDE;

  /** Valid only while initialized. */
  const LogBufferRegions&     get_regions() const { return regions_; }
  const memory::AlignedMemory& get_memory() const { return memory_; }

  friend std::ostream& operator<<(std::ostream& o, const LogBufferMemory& v);

 private:
  const LogBufferOptions* const options_;
  memory::AlignedMemory   memory_;
  LogBufferRegions        regions_;
};

}  // namespace logbuf
}  // namespace termlog
#endif  // TERMLOG_LOGBUF_LOG_BUFFER_MEMORY_HPP_
