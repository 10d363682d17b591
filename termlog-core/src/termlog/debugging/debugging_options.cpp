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
#include "termlog/debugging/debugging_options.hpp"

#include "termlog/externalize/externalizable.hpp"

namespace termlog {
namespace debugging {
DebuggingOptions::DebuggingOptions() :
  debug_log_to_stderr_(false),
  debug_log_stderr_threshold_(kDebugLogInfo),
  debug_log_min_threshold_(kDebugLogInfo),
  verbose_log_level_(0),
  verbose_modules_(""),
  debug_log_dir_("/tmp/") {
}

ErrorStack DebuggingOptions::load(tinyxml2::XMLElement* element) {
  EXTERNALIZE_LOAD_ELEMENT(element, debug_log_to_stderr_);
  EXTERNALIZE_LOAD_ENUM_ELEMENT(element, debug_log_stderr_threshold_);
  EXTERNALIZE_LOAD_ENUM_ELEMENT(element, debug_log_min_threshold_);
  EXTERNALIZE_LOAD_ELEMENT(element, verbose_log_level_);
  EXTERNALIZE_LOAD_ELEMENT_OPTIONAL(element, verbose_modules_, "");
  EXTERNALIZE_LOAD_ELEMENT(element, debug_log_dir_);
  if (debug_log_stderr_threshold_ > kDebugLogFatal || debug_log_stderr_threshold_ < kDebugLogInfo) {
    return ERROR_STACK_MSG(kErrorCodeConfValueOutofrange, "debug_log_stderr_threshold_");
  }
  if (debug_log_min_threshold_ > kDebugLogFatal || debug_log_min_threshold_ < kDebugLogInfo) {
    return ERROR_STACK_MSG(kErrorCodeConfValueOutofrange, "debug_log_min_threshold_");
  }
  return kRetOk;
}

ErrorStack DebuggingOptions::save(tinyxml2::XMLElement* element) const {
  CHECK_ERROR(insert_comment(element, "Set of options for debug logging (glog).\n"
    " Most of them can be changed at runtime, so these are initial configurations.\n"
    " enum DebugLogLevel:\n"
    " kDebugLogInfo = 0, kDebugLogWarning = 1, kDebugLogError = 2,\n"
    " kDebugLogFatal = 3: aborts the process after this log."));

  EXTERNALIZE_SAVE_ELEMENT(element, debug_log_to_stderr_,
    "Whether to write debug logs to stderr rather than log files.");
  EXTERNALIZE_SAVE_ENUM_ELEMENT(element, debug_log_stderr_threshold_,
    "Debug logs at or above this level are copied to stderr.");
  EXTERNALIZE_SAVE_ENUM_ELEMENT(element, debug_log_min_threshold_,
    "Debug logs below this level are ignored.");
  EXTERNALIZE_SAVE_ELEMENT(element, verbose_log_level_,
    "VLOG(m) with m at or less than this are shown.");
  EXTERNALIZE_SAVE_ELEMENT(element, verbose_modules_,
    "Per-module verbose level. Comma-separated list of 'module name'='log level'.\n"
    " 'module name' is a glob pattern matched against the source file base name,\n"
    " eg 'log_buffer*=2'.");
  EXTERNALIZE_SAVE_ELEMENT(element, debug_log_dir_,
    "Folder to write debug log files in. Only read when glog is initialized.");
  return kRetOk;
}

}  // namespace debugging
}  // namespace termlog
