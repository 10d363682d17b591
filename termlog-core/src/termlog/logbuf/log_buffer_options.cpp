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
#include "termlog/logbuf/log_buffer_options.hpp"

#include "termlog/externalize/externalizable.hpp"
#include "termlog/logbuf/log_buffer_descriptor.hpp"

namespace termlog {
namespace logbuf {
const uint32_t LogBufferOptions::kDefaultTermLength;

LogBufferOptions::LogBufferOptions() :
  term_length_(kDefaultTermLength),
  randomize_initial_term_id_(true),
  initial_term_id_(0),
  use_numa_alloc_(false),
  numa_node_(0) {
}

ErrorStack LogBufferOptions::load(tinyxml2::XMLElement* element) {
  EXTERNALIZE_LOAD_ELEMENT(element, term_length_);
  EXTERNALIZE_LOAD_ELEMENT(element, randomize_initial_term_id_);
  EXTERNALIZE_LOAD_ELEMENT(element, initial_term_id_);
  EXTERNALIZE_LOAD_ELEMENT_OPTIONAL(element, use_numa_alloc_, false);
  EXTERNALIZE_LOAD_ELEMENT_OPTIONAL(element, numa_node_, static_cast<int16_t>(0));
  if (validate_term_length(term_length_).is_error()) {
    return ERROR_STACK_MSG(kErrorCodeConfValueOutofrange, "term_length_");
  }
  if (numa_node_ < 0) {
    return ERROR_STACK_MSG(kErrorCodeConfValueOutofrange, "numa_node_");
  }
  return kRetOk;
}

ErrorStack LogBufferOptions::save(tinyxml2::XMLElement* element) const {
  CHECK_ERROR(insert_comment(element, "Set of options for the log buffer of one stream"));

  EXTERNALIZE_SAVE_ELEMENT(element, term_length_,
    "Byte length of each term. Power of two, between 64KB and 1GB.");
  EXTERNALIZE_SAVE_ELEMENT(element, randomize_initial_term_id_,
    "Whether to pick the initial term id at random when the stream is created.");
  EXTERNALIZE_SAVE_ELEMENT(element, initial_term_id_,
    "Initial term id of a new stream. Only used if randomize_initial_term_id_ is false.");
  EXTERNALIZE_SAVE_ELEMENT(element, use_numa_alloc_,
    "Whether to allocate the log buffer with libnuma on numa_node_."
    " If false, posix_memalign() is used.");
  EXTERNALIZE_SAVE_ELEMENT(element, numa_node_,
    "NUMA node to allocate the log buffer on. Only used if use_numa_alloc_ is true.");
  return kRetOk;
}

}  // namespace logbuf
}  // namespace termlog
