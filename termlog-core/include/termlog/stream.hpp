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
#ifndef TERMLOG_STREAM_HPP_
#define TERMLOG_STREAM_HPP_

#include <iosfwd>

#include "termlog/cxx11.hpp"
#include "termlog/error_stack.hpp"
#include "termlog/fwd.hpp"
#include "termlog/initializable.hpp"
#include "termlog/debugging/fwd.hpp"
#include "termlog/logbuf/fwd.hpp"
#include "termlog/logbuf/logbuf_id.hpp"

namespace termlog {
/**
 * @brief One message stream backed by a log buffer in process-private memory.
 * @ingroup TERMLOG
 * @details
 * This is the stream-open code. It owns everything one stream needs and brings them up
 * in this order:
 * \li debugging (glog)
 * \li memory for the log buffer (LogBufferMemory)
 * \li the log buffer on that memory, then create_stream() with the configured or a random
 * initial term id
 * \li the cleaner of the log buffer
 *
 * uninitialize() releases them in the reverse order and reports every error it sees.
 *
 * @code{.cpp}
 * TermlogOptions options;
 * Stream stream(options);
 * COERCE_ERROR(stream.initialize());
 * {
 *   UninitializeGuard guard(&stream);
 *   TermOffset offset;
 *   if (stream.get_log_buffer()->append(64, &offset) == kErrorCodeLogBufTermFull) {
 *     ...
 *   }
 *   COERCE_ERROR(stream.uninitialize());
 * }
 * @endcode
 */
class Stream CXX11_FINAL : public virtual Initializable {
 public:
  /** Copies the options. Nothing is allocated until initialize(). */
  explicit Stream(const TermlogOptions& options);
  ~Stream();

  // Disable default constructors
  Stream() CXX11_FUNC_DELETE;
  Stream(const Stream &) CXX11_FUNC_DELETE;
  Stream& operator=(const Stream &) CXX11_FUNC_DELETE;

  ErrorStack  initialize() CXX11_OVERRIDE;
  bool        is_initialized() const CXX11_OVERRIDE;
  ErrorStack  uninitialize() CXX11_OVERRIDE;

  const TermlogOptions&         get_options() const;
  debugging::DebuggingSupports* get_debug() const;
  /** Valid only while initialized. */
  logbuf::LogBuffer*            get_log_buffer() const;
  /** Valid only while initialized. */
  logbuf::TermCleaner*          get_cleaner() const;
  const logbuf::LogBufferMemory& get_log_buffer_memory() const;

  friend std::ostream& operator<<(std::ostream& o, const Stream& v);

 private:
  StreamPimpl* pimpl_;
};
}  // namespace termlog
#endif  // TERMLOG_STREAM_HPP_
