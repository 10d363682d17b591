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
#ifndef TERMLOG_DEBUGGING_DEBUGGING_SUPPORTS_HPP_
#define TERMLOG_DEBUGGING_DEBUGGING_SUPPORTS_HPP_

#include <string>

#include "termlog/cxx11.hpp"
#include "termlog/initializable.hpp"
#include "termlog/debugging/debugging_options.hpp"

namespace termlog {
namespace debugging {
/**
 * @brief Owns the process-wide glog setup on behalf of one Stream.
 * @ingroup DEBUGGING
 * @details
 * glog can be set up only once per process, but several streams may live in one process.
 * The first DebuggingSupports to initialize applies its DebuggingOptions and calls
 * InitGoogleLogging(). The last one to uninitialize calls ShutdownGoogleLogging().
 * The options of the others are ignored.
 */
class DebuggingSupports CXX11_FINAL : public DefaultInitializable {
 public:
  DebuggingSupports() CXX11_FUNC_DELETE;
  /** @param[in] options must outlive this object */
  explicit DebuggingSupports(const DebuggingOptions* options) : options_(options) {}
  ErrorStack  initialize_once() CXX11_OVERRIDE;
  ErrorStack  uninitialize_once() CXX11_OVERRIDE;

  /** Changes VLOG verbosity of every module at runtime. */
  void        set_verbose_log_level(int verbose);
  /** Changes VLOG verbosity of the modules matching \b module_pattern, such as "log_buffer*". */
  void        set_verbose_module(const std::string& module_pattern, int verbose);

  /** How many DebuggingSupports in this process are initialized right now. */
  static int  get_glog_user_count();

 private:
  const DebuggingOptions* const options_;
};
}  // namespace debugging
}  // namespace termlog
#endif  // TERMLOG_DEBUGGING_DEBUGGING_SUPPORTS_HPP_
