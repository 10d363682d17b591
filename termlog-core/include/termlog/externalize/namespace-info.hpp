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
#ifndef TERMLOG_EXTERNALIZE_NAMESPACE_INFO_HPP_
#define TERMLOG_EXTERNALIZE_NAMESPACE_INFO_HPP_

/**
 * @namespace termlog::externalize
 * @brief Object serialization to and from XML, used for every options class.
 * @details
 * Each options class derives from Externalizable, invokes the EXTERNALIZABLE() macro in its
 * public section and defines load()/save() with the EXTERNALIZE_xxx macros. The XML is parsed
 * and written by tinyxml2.
 * @par Example
 * @code{.xml}
 * <TermlogOptions>
 *   <log_buffer>
 *     <term_length_>1048576</term_length_>
 *     ...
 *   </log_buffer>
 *   <debugging>...</debugging>
 * </TermlogOptions>
 * @endcode
 */

/**
 * @defgroup EXTERNALIZE Externalizable Objects
 * @ingroup IDIOMS
 * @copydoc termlog::externalize
 */

#endif  // TERMLOG_EXTERNALIZE_NAMESPACE_INFO_HPP_
