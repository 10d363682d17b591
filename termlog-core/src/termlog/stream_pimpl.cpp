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
#include "termlog/stream_pimpl.hpp"

#include <glog/logging.h>

#include <chrono>

#include "termlog/error_stack_batch.hpp"
#include "termlog/assorted/uniform_random.hpp"

namespace termlog {

StreamPimpl::StreamPimpl(const TermlogOptions& options) :
  options_(options),
  // these only keep the pointer. they do not read the options until initialize().
  debug_(&options_.debugging_),
  log_buffer_memory_(&options_.log_buffer_) {
}

logbuf::TermId StreamPimpl::decide_initial_term_id() const {
  if (!options_.log_buffer_.randomize_initial_term_id_) {
    return options_.log_buffer_.initial_term_id_;
  }
  uint64_t seed = std::chrono::high_resolution_clock::now().time_since_epoch().count();
  assorted::UniformRandom rnd(seed);
  return rnd.next_int32();
}

ErrorStack StreamPimpl::initialize_once() {
  CHECK_ERROR(debug_.initialize());  // everything after this can use glog
  CHECK_ERROR(log_buffer_memory_.initialize());
  log_buffer_.reset(new logbuf::LogBuffer(log_buffer_memory_.get_regions()));
  CHECK_ERROR(log_buffer_->initialize());

  logbuf::TermId initial_term_id = decide_initial_term_id();
  log_buffer_->create_stream(initial_term_id);
  cleaner_.reset(new logbuf::TermCleaner(log_buffer_.get()));

  LOG(INFO) << "================================================================================";
  LOG(INFO) << "===================== TERMLOG STREAM INITIALIZATION DONE =======================";
  LOG(INFO) << "================================================================================";
  LOG(INFO) << "initial_term_id=" << initial_term_id
    << ", term_length=" << log_buffer_->get_term_length();
  return kRetOk;
}

ErrorStack StreamPimpl::uninitialize_once() {
  LOG(INFO) << "================================================================================";
  LOG(INFO) << "========================== TERMLOG STREAM EXITTING... ==========================";
  LOG(INFO) << "================================================================================";
  ErrorStackBatch batch;
  // uninit in reverse order of initialization
  cleaner_.reset();
  if (log_buffer_) {
    batch.emprace_back(log_buffer_->uninitialize());
    log_buffer_.reset();
  }
  batch.emprace_back(log_buffer_memory_.uninitialize());
  batch.emprace_back(debug_.uninitialize());  // nothing after this can use glog
  return SUMMARIZE_ERROR_BATCH(batch);
}

}  // namespace termlog
