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
#ifndef TERMLOG_LOGBUF_LOG_BUFFER_OPTIONS_HPP_
#define TERMLOG_LOGBUF_LOG_BUFFER_OPTIONS_HPP_
#include <stdint.h>

#include "termlog/cxx11.hpp"
#include "termlog/externalize/externalizable.hpp"
#include "termlog/logbuf/logbuf_id.hpp"

namespace termlog {
namespace logbuf {
/**
 * @brief Set of options for the log buffer of one stream.
 * @ingroup LOGBUF
 * This is a POD-like struct. Default destructor/copy-constructor/assignment operator work fine.
 */
struct LogBufferOptions CXX11_FINAL : public virtual externalize::Externalizable {
  /** Default term length, 1MB. */
  static const uint32_t kDefaultTermLength = 1U << 20;

  /**
   * Constructs option values with default values.
   */
  LogBufferOptions();

  /**
   * @brief Byte length of each term.
   * @details
   * Power of two, between kTermMinLength and kTermMaxLength. Default is kDefaultTermLength.
   */
  uint32_t    term_length_;

  /**
   * @brief Whether to pick the initial term id at random when the stream is created.
   * @details
   * Default true, so that a stream re-created after a restart does not reuse the term ids
   * (thus positions) of its previous incarnation by accident.
   */
  bool        randomize_initial_term_id_;

  /** Initial term id of a new stream. Only used if randomize_initial_term_id_ is false. */
  TermId      initial_term_id_;

  /**
   * @brief Whether to allocate the log buffer with libnuma on numa_node_.
   * @details
   * Default false, which uses posix_memalign().
   */
  bool        use_numa_alloc_;

  /** NUMA node to allocate the log buffer on. Only used if use_numa_alloc_ is true. */
  int16_t     numa_node_;

  EXTERNALIZABLE(LogBufferOptions);
};
}  // namespace logbuf
}  // namespace termlog
#endif  // TERMLOG_LOGBUF_LOG_BUFFER_OPTIONS_HPP_
