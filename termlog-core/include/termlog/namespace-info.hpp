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
#ifndef TERMLOG_NAMESPACE_INFO_HPP_
#define TERMLOG_NAMESPACE_INFO_HPP_

/**
 * @namespace termlog
 * @brief Root package of \b termlog, the term-rotating log buffer of a message stream.
 * @details
 * The heart of the library is termlog::logbuf. The root package holds the error model
 * (ErrorCode, ErrorStack), the initialize/uninitialize idiom, the options of a stream
 * (TermlogOptions) and Stream, which brings up one log buffer in process-private memory.
 */

/**
 * @defgroup IDIOMS Coding Idioms
 * @brief Idioms used throughout the code base.
 */

/**
 * @defgroup COMPONENTS termlog Components
 * @brief Modules of the library.
 */

/**
 * @defgroup TERMLOG Stream
 * @ingroup COMPONENTS
 * @brief Stream and its options.
 */

#endif  // TERMLOG_NAMESPACE_INFO_HPP_
