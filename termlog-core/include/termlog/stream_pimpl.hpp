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
#ifndef TERMLOG_STREAM_PIMPL_HPP_
#define TERMLOG_STREAM_PIMPL_HPP_

#include <memory>

#include "termlog/fwd.hpp"
#include "termlog/initializable.hpp"
#include "termlog/termlog_options.hpp"
// This is pimpl. no need for further indirections. just include them all.
#include "termlog/debugging/debugging_supports.hpp"
#include "termlog/logbuf/log_buffer.hpp"
#include "termlog/logbuf/log_buffer_memory.hpp"
#include "termlog/logbuf/logbuf_id.hpp"
#include "termlog/logbuf/term_cleaner.hpp"

namespace termlog {
/**
 * @brief Pimpl object of Stream.
 * @ingroup TERMLOG
 * @details
 * A private pimpl object for Stream.
 * Do not include this header from a client program unless you know what you are doing.
 */
class StreamPimpl final : public DefaultInitializable {
 public:
  StreamPimpl() = delete;
  explicit StreamPimpl(const TermlogOptions& options);

  ErrorStack  initialize_once() override;
  ErrorStack  uninitialize_once() override;

  /** The configured initial term id, or a random one seeded with the clock. */
  logbuf::TermId  decide_initial_term_id() const;

  /** Options given at the constructor. Never changed. */
  const TermlogOptions                  options_;

  debugging::DebuggingSupports          debug_;
  logbuf::LogBufferMemory               log_buffer_memory_;
  /** Constructed after log_buffer_memory_ knows the regions. */
  std::unique_ptr<logbuf::LogBuffer>    log_buffer_;
  std::unique_ptr<logbuf::TermCleaner>  cleaner_;
};
}  // namespace termlog
#endif  // TERMLOG_STREAM_PIMPL_HPP_
