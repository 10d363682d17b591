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
#ifndef TERMLOG_DEBUGGING_NAMESPACE_INFO_HPP_
#define TERMLOG_DEBUGGING_NAMESPACE_INFO_HPP_

/**
 * @namespace termlog::debugging
 * @brief Debug logging configuration.
 * @details
 * termlog writes its debug logs with Google glog (LOG(INFO), VLOG(n) and so on).
 * DebuggingOptions holds the glog settings as an Externalizable, and DebuggingSupports applies
 * them and initializes glog once per process no matter how many streams are opened.
 */

/**
 * @defgroup DEBUGGING Debugging Support
 * @ingroup COMPONENTS
 * @copydoc termlog::debugging
 */

#endif  // TERMLOG_DEBUGGING_NAMESPACE_INFO_HPP_
