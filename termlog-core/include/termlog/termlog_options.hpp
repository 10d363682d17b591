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
#ifndef TERMLOG_TERMLOG_OPTIONS_HPP_
#define TERMLOG_TERMLOG_OPTIONS_HPP_

#include <stdint.h>

#include <iosfwd>

#include "termlog/cxx11.hpp"
#include "termlog/error_stack.hpp"
#include "termlog/debugging/debugging_options.hpp"
#include "termlog/externalize/externalizable.hpp"
#include "termlog/logbuf/log_buffer_options.hpp"

namespace termlog {
/**
 * @brief Set of option values given to a Stream at start-up.
 * @ingroup TERMLOG
 * @details
 * A collection of the options of each module. Instantiate it with the default constructor,
 * change what you need, and give it to Stream.
 *
 * @par Externalization
 * @code{.cpp}
 * TermlogOptions options;
 * options.log_buffer_.term_length_ = 1U << 24;
 * if (options.save_to_file("/your/path/to/termlog_config.xml").is_error()) {
 *    // handle errors. It might be file permission issue or other file I/O issues.
 * }
 * ...
 * if (options.load_from_file("/your/path/to/termlog_config.xml").is_error()) {
 *    // handle errors. It might be file permission, corrupted XML files, etc.
 * }
 * @endcode
 */
struct TermlogOptions CXX11_FINAL : public virtual externalize::Externalizable {
  /**
   * Constructs option values with default values.
   */
  TermlogOptions();
  TermlogOptions(const TermlogOptions& other);
  TermlogOptions& operator=(const TermlogOptions& other);

  /** Byte size of memory a Stream allocates with these option values. */
  uint64_t calculate_required_memory() const;

  // options for each module
  debugging::DebuggingOptions debugging_;
  logbuf::LogBufferOptions    log_buffer_;

  EXTERNALIZABLE(TermlogOptions);
};
}  // namespace termlog
#endif  // TERMLOG_TERMLOG_OPTIONS_HPP_
