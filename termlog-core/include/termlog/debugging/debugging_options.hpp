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
#ifndef TERMLOG_DEBUGGING_DEBUGGING_OPTIONS_HPP_
#define TERMLOG_DEBUGGING_DEBUGGING_OPTIONS_HPP_
#include <stdint.h>

#include <string>

#include "termlog/cxx11.hpp"
#include "termlog/externalize/externalizable.hpp"

namespace termlog {
namespace debugging {
/**
 * @brief Set of options for debug logging.
 * @ingroup DEBUGGING
 * This is a POD-like struct. Default destructor/copy-constructor/assignment operator work fine.
 * Most of them can be changed at runtime through DebuggingSupports, so these are merely
 * \e initial configurations.
 */
struct DebuggingOptions CXX11_FINAL : public virtual externalize::Externalizable {
  /** Mirrors glog's severity levels. */
  enum DebugLogLevel {
    kDebugLogInfo = 0,
    kDebugLogWarning,
    kDebugLogError,
    /** Aborts the process after this log. */
    kDebugLogFatal,
  };

  DebuggingOptions();

  /** Whether to write debug logs to stderr rather than log files. Default false. */
  bool                                debug_log_to_stderr_;

  /** Debug logs at or above this level are copied to stderr. Default kDebugLogInfo. */
  DebugLogLevel                       debug_log_stderr_threshold_;

  /** Debug logs below this level are ignored. Default kDebugLogInfo. */
  DebugLogLevel                       debug_log_min_threshold_;

  /** VLOG(m) with m at or less than this are shown. Default 0. */
  int16_t                             verbose_log_level_;

  /**
   * @brief Per-module verbose level.
   * @details
   * Comma-separated list of 'module name'='log level', where the module name is a glob
   * pattern matched against the source file base name (eg "log_buffer*=2").
   * Default is "".
   */
  std::string                         verbose_modules_;

  /**
   * @brief Folder to write debug log files in.
   * @details
   * Default is "/tmp/". Only read when glog is initialized.
   */
  std::string                         debug_log_dir_;

  EXTERNALIZABLE(DebuggingOptions);
};
}  // namespace debugging
}  // namespace termlog
#endif  // TERMLOG_DEBUGGING_DEBUGGING_OPTIONS_HPP_
