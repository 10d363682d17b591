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
#include <gflags/gflags.h>
#include <glog/logging.h>
#include <stdint.h>

#include <cstdlib>
#include <iostream>

#include "termlog/error_stack.hpp"
#include "termlog/logbuf/log_buffer_descriptor.hpp"
#include "termlog/util/log_buffer_layout.hpp"

/**
 * @file termlog_layout.cpp
 * @brief Log buffer layout utility.
 * @details
 * Shows the byte layout of a log buffer and decodes positions, for debugging and for
 * whoever backs a log buffer with their own memory.
 */
DEFINE_int64(term_length, 1 << 20, "Byte length of each term. Power of two, 64KB or larger.");
DEFINE_int32(initial_term_id, 0, "Initial term id of the stream, used to decode --position.");
DEFINE_int64(position, -1, "Position to decode into term id, partition and term offset."
  " Negative value means not specified.");

bool ValidateTermLength(const char* flagname, int64_t value) {
  if (value > 0 && !termlog::logbuf::validate_term_length(value).is_error()) {
    return true;
  } else {
    std::cout << "Invalid value for --" << flagname << ": " << value << std::endl;
    return false;
  }
}

int main(int argc, char* argv[]) {
  gflags::SetUsageMessage("Log Buffer Layout Utility for libtermlog\n"
    "  Shows where each region of a log buffer is and decodes positions\n"
    "  Usage: termlog_layout <flags> [more positions]\n"
    "  Example: termlog_layout --term_length=65536\n"
    "  Example2: termlog_layout --term_length=65536 --initial_term_id=5 --position=131172");
  gflags::RegisterFlagValidator(&FLAGS_term_length, &ValidateTermLength);
  gflags::ParseCommandLineFlags(&argc, &argv, true);
  google::InitGoogleLogging(argv[0]);

  termlog::util::LogBufferLayout layout;
  layout.term_length_ = static_cast<uint32_t>(FLAGS_term_length);
  layout.initial_term_id_ = FLAGS_initial_term_id;
  if (FLAGS_position >= 0) {
    layout.positions_.push_back(FLAGS_position);
  }
  for (int i = 1; i < argc; ++i) {
    char* end;
    int64_t position = std::strtoll(argv[i], &end, 10);
    if (*end != '\0' || position < 0) {
      std::cerr << "Not a position: " << argv[i] << std::endl;
      return 1;
    }
    layout.positions_.push_back(position);
  }

  termlog::ErrorStack error = layout.validate();
  if (error.is_error()) {
    std::cerr << "Invalid layout: " << error << std::endl;
    return 1;
  }
  layout.dump(&std::cout);
  google::ShutdownGoogleLogging();
  return 0;
}
