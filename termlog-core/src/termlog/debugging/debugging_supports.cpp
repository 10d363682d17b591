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
#include "termlog/debugging/debugging_supports.hpp"

#include <glog/logging.h>
#include <glog/vlog_is_on.h>

#include <mutex>
#include <string>

#include "termlog/assert_nd.hpp"

namespace termlog {
namespace debugging {

namespace {
/** Initialized DebuggingSupports in this process. Only touched under glog_users_lock. */
int         glog_users = 0;
std::mutex  glog_users_lock;

/** Identifies this library in glog's file names. glog keeps the pointer. */
const char* const kGlogProgramName = "libtermlog";
}  // anonymous namespace

ErrorStack DebuggingSupports::initialize_once() {
  std::lock_guard<std::mutex> guard(glog_users_lock);
  ASSERT_ND(glog_users >= 0);
  if (glog_users++ > 0) {
    LOG(INFO) << "glog is already set up by another stream. Users=" << glog_users;
    return kRetOk;
  }
  // flags must be set before InitGoogleLogging() to take effect on log files
  FLAGS_logtostderr = options_->debug_log_to_stderr_;
  FLAGS_stderrthreshold = static_cast<int>(options_->debug_log_stderr_threshold_);
  FLAGS_minloglevel = static_cast<int>(options_->debug_log_min_threshold_);
  FLAGS_log_dir = options_->debug_log_dir_;
  FLAGS_v = options_->verbose_log_level_;
  if (!options_->verbose_modules_.empty()) {
    google::SetVLOGLevel(options_->verbose_modules_.c_str(), options_->verbose_log_level_);
  }
  google::InitGoogleLogging(kGlogProgramName);
  LOG(INFO) << "Set up glog. " << *options_;
  return kRetOk;
}

ErrorStack DebuggingSupports::uninitialize_once() {
  std::lock_guard<std::mutex> guard(glog_users_lock);
  ASSERT_ND(glog_users >= 1);
  if (--glog_users > 0) {
    LOG(INFO) << "glog is still used by other streams. Users=" << glog_users;
    return kRetOk;
  }
  LOG(INFO) << "Shutting down glog";
  google::ShutdownGoogleLogging();  // no glog after this
  return kRetOk;
}

int DebuggingSupports::get_glog_user_count() {
  std::lock_guard<std::mutex> guard(glog_users_lock);
  return glog_users;
}

void DebuggingSupports::set_verbose_log_level(int verbose) {
  FLAGS_v = verbose;
  LOG(INFO) << "VLOG level is now " << verbose;
}

void DebuggingSupports::set_verbose_module(const std::string& module_pattern, int verbose) {
  int previous = google::SetVLOGLevel(module_pattern.c_str(), verbose);
  LOG(INFO) << "VLOG level of " << module_pattern << " is now " << verbose
    << " (was " << previous << ")";
}

}  // namespace debugging
}  // namespace termlog
