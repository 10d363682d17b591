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
#include "termlog/stream.hpp"

#include <ostream>

#include "termlog/assert_nd.hpp"
#include "termlog/stream_pimpl.hpp"

namespace termlog {
Stream::Stream(const TermlogOptions& options) : pimpl_(nullptr) {
  pimpl_ = new StreamPimpl(options);
}
Stream::~Stream() {
  delete pimpl_;
}

// simply forward to pimpl object
const TermlogOptions& Stream::get_options() const { return pimpl_->options_; }
debugging::DebuggingSupports* Stream::get_debug() const { return &pimpl_->debug_; }
logbuf::LogBuffer* Stream::get_log_buffer() const {
  ASSERT_ND(pimpl_->log_buffer_);
  return pimpl_->log_buffer_.get();
}
logbuf::TermCleaner* Stream::get_cleaner() const {
  ASSERT_ND(pimpl_->cleaner_);
  return pimpl_->cleaner_.get();
}
const logbuf::LogBufferMemory& Stream::get_log_buffer_memory() const {
  return pimpl_->log_buffer_memory_;
}

bool        Stream::is_initialized() const  { return pimpl_->is_initialized(); }
ErrorStack  Stream::initialize()            { return pimpl_->initialize(); }
ErrorStack  Stream::uninitialize()          { return pimpl_->uninitialize(); }

std::ostream& operator<<(std::ostream& o, const Stream& v) {
  o << "<Stream>";
  o << "<initialized_>" << v.is_initialized() << "</initialized_>";
  o << v.get_log_buffer_memory();
  if (v.pimpl_->log_buffer_) {
    o << *v.pimpl_->log_buffer_;
  }
  o << "</Stream>";
  return o;
}

}  // namespace termlog
